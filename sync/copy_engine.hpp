#pragma once
#include "../common/cancel_token.hpp"
#include "../common/result.hpp"
#include "../storage/object_store.hpp"
#include "../transfer/transfer.hpp"
#include "sync_options.hpp"
#include "sync_report.hpp"
#include <string>

// Plain copy between the local disk and one bucket: nothing is ever deleted,
// and files that already match are left alone unless forced.
class CopyEngine {
public:
    CopyEngine(ObjectStore& store, const SyncOptions& options);

    // A single file goes to key (or key + file name when key is empty or ends
    // in '/'); a directory needs recursive and lands under key as a prefix.
    Result<void> upload(const CancelToken& token, const std::string& localPath, const std::string& key,
                        SyncReport& report) const;

    // One object when key names one, otherwise every object under key as a prefix.
    Result<void> download(const CancelToken& token, const std::string& key, const std::string& localPath,
                          SyncReport& report) const;

private:
    struct CopyTask {
        std::string localPath;
        std::string key;
    };

    Result<void> uploadDirectory(const CancelToken& token, const std::string& localDir, const std::string& prefix,
                                 SyncReport& report) const;
    Result<void> uploadOne(const CancelToken& token, const CopyTask& task, SyncReport& report) const;
    Result<void> downloadOne(const CancelToken& token, const CopyTask& task, SyncReport& report) const;

    ObjectStore& store_;
    SyncOptions options_;
    Transfer transfer_;
};

// object key for a file upload: an empty key or one ending in '/' gets the file name
std::string uploadKeyFor(const std::string& key, const std::string& localPath);
