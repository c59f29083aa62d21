#pragma once
#include "../common/cancel_token.hpp"
#include "../common/config.hpp"
#include "../common/result.hpp"
#include "../storage/object_store.hpp"
#include <functional>
#include <string>

struct TransferOptions {
    bool encrypt = false;
    std::string passphrase;
    int attempts = Config::DEFAULT_RETRIES;   // total tries for a transient failure
    bool preserveMtime = false;               // stamp downloads with the object's mtime
};

enum class TransferOutcome { Transferred, Skipped };

// Moves one file in either direction, optionally through the stream cipher.
// Neither direction ever exposes a partial result: uploads rely on the store
// publishing only complete objects, downloads land in a temporary file that
// is renamed over the destination once every byte is in.
class Transfer {
public:
    Transfer(ObjectStore& store, TransferOptions options);

    // skipIdentical: leave an object alone when its checksum already matches
    // (never under encryption)
    Result<TransferOutcome> upload(const CancelToken& token, const std::string& localPath,
                                   const std::string& key, bool skipIdentical = false) const;

    // remoteModTime is applied to the file when preserveMtime is set
    Result<TransferOutcome> download(const CancelToken& token, const std::string& key,
                                     const std::string& localPath, bool skipIdentical = false,
                                     int64_t remoteModTime = 0) const;

    const TransferOptions& options() const { return options_; }

private:
    Result<void> uploadOnce(const std::string& localPath, const std::string& key) const;
    Result<void> downloadOnce(const std::string& key, const std::string& localPath) const;

    // whether the object at key already holds content with this MD5
    Result<bool> remoteMatches(const std::string& key, const std::string& localMd5) const;

    Result<void> withRetries(const CancelToken& token, const std::string& what,
                             const std::function<Result<void>()>& attempt) const;

    ObjectStore& store_;
    TransferOptions options_;
};

// mkdir -p; succeeds when another worker created the directory first
Result<void> ensureDirectory(const std::string& path);
