#pragma once
#include <mutex>
#include <string>
#include <vector>

// Outcome of one sync or copy run. Workers append from many threads.
class SyncReport {
public:
    void addUploaded(const std::string& path);
    void addDownloaded(const std::string& path);
    void addDeleted(const std::string& path);
    void addError(const std::string& description);

    std::vector<std::string> uploaded() const;
    std::vector<std::string> downloaded() const;
    std::vector<std::string> deleted() const;
    std::vector<std::string> errors() const;

    size_t actionCount() const;
    bool hasErrors() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> uploaded_;
    std::vector<std::string> downloaded_;
    std::vector<std::string> deleted_;
    std::vector<std::string> errors_;
};

// counts per action (paths too when verbose) and every error; silent when quiet
void printSyncSummary(const SyncReport& report);
