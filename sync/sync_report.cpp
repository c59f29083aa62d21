#include "sync_report.hpp"
#include "../common/log.hpp"
#include <iostream>

void SyncReport::addUploaded(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    uploaded_.push_back(path);
}

void SyncReport::addDownloaded(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    downloaded_.push_back(path);
}

void SyncReport::addDeleted(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    deleted_.push_back(path);
}

void SyncReport::addError(const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(description);
}

std::vector<std::string> SyncReport::uploaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploaded_;
}

std::vector<std::string> SyncReport::downloaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return downloaded_;
}

std::vector<std::string> SyncReport::deleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deleted_;
}

std::vector<std::string> SyncReport::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

size_t SyncReport::actionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploaded_.size() + downloaded_.size() + deleted_.size();
}

bool SyncReport::hasErrors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !errors_.empty();
}

namespace {
void printSection(const std::string& title, const std::vector<std::string>& paths, const std::string& marker) {
    if (paths.empty()) return;
    std::cout << title << ": " << paths.size() << " files\n";
    if (Log::isVerbose()) {
        for (const auto& path : paths) std::cout << "  " << marker << " " << path << "\n";
    }
}
}

void printSyncSummary(const SyncReport& report) {
    if (Log::level() == LogLevel::Quiet) return;

    std::vector<std::string> errors = report.errors();
    std::cout << "\n=== Sync Summary ===\n";
    printSection("Uploaded", report.uploaded(), "+");
    printSection("Downloaded", report.downloaded(), "+");
    printSection("Deleted", report.deleted(), "-");

    if (!errors.empty()) {
        std::cout << "Errors: " << errors.size() << "\n";
        for (const auto& error : errors) std::cout << "  ! " << error << "\n";
    }

    if (report.actionCount() == 0 && errors.empty()) {
        std::cout << "Directories are already in sync!\n";
    }
}
