#include "change_detector.hpp"
#include "../common/config.hpp"
#include "../common/hash_utils.hpp"
#include "../common/log.hpp"
#include "../crypto/stream_cipher.hpp"
#include <cstdlib>

namespace {
void explain(const std::string& path, const std::string& reason) {
    Log::verbose("Compare", path + ": " + reason);
}

// an unreadable HEAD cannot prove the copies equal
Result<Verdict> headFailed(const FileRecord& local, const FileRecord& remote, const Result<ObjectHead>& head) {
    if (isCancellation(head.code)) return Result<Verdict>::From(head);
    Log::warn("Compare", "cannot read metadata of " + remote.location + ": " + head.message);
    explain(local.relativePath, "metadata unavailable, will transfer");
    return Result<Verdict>::Ok(Verdict::Different);
}
}

ChangeDetector::ChangeDetector(ObjectStore& store, CompareMode mode, bool encrypted)
    : store_(store), mode_(mode), encrypted_(encrypted) {}

Result<Verdict> ChangeDetector::compare(const FileRecord& local, const FileRecord& remote) const {
    if (!sizesMatch(local, remote)) {
        explain(local.relativePath, "size differs, will transfer");
        return Result<Verdict>::Ok(Verdict::Different);
    }
    if (mode_ == CompareMode::SizeTime) {
        return compareSizeTime(local, remote);
    }
    return compareChecksum(local, remote);
}

bool ChangeDetector::sizesMatch(const FileRecord& local, const FileRecord& remote) const {
    if (!encrypted_) return local.size == remote.size;
    uint64_t plain = 0;
    return StreamCipher::plaintextSize(remote.size, plain) && plain == local.size;
}

Result<Verdict> ChangeDetector::compareChecksum(const FileRecord& local, const FileRecord& remote) const {
    // neither the ETag nor local-md5 describes an encrypted object's plaintext
    if (encrypted_) {
        explain(local.relativePath, "encrypted, no usable checksum, will transfer");
        return Result<Verdict>::Ok(Verdict::Different);
    }

    std::string localHash = local.contentHash;
    if (localHash.empty()) {
        Result<std::string> hash = HashUtils::fileMd5Hex(local.location);
        if (!hash.success) return Result<Verdict>::From(hash);
        localHash = hash.data;
    }

    if (!remote.contentHash.empty() && remote.contentHash == localHash) {
        explain(local.relativePath, "ETag matches, skipping");
        return Result<Verdict>::Ok(Verdict::Same);
    }

    Result<ObjectHead> head = store_.head(remote.location);
    if (!head.success) return headFailed(local, remote, head);

    auto it = head.data.metadata.find(Config::META_LOCAL_MD5);
    if (it == head.data.metadata.end() || it->second.empty()) {
        explain(local.relativePath, "no checksum metadata, will transfer");
        return Result<Verdict>::Ok(Verdict::Different);
    }
    if (it->second == localHash) {
        explain(local.relativePath, "local-md5 matches, skipping");
        return Result<Verdict>::Ok(Verdict::Same);
    }
    explain(local.relativePath, "checksum differs, will transfer");
    return Result<Verdict>::Ok(Verdict::Different);
}

Result<Verdict> ChangeDetector::compareSizeTime(const FileRecord& local, const FileRecord& remote) const {
    if (local.modTime != 0 && remote.modTime != 0 &&
        std::llabs(local.modTime - remote.modTime) <= Config::MTIME_TOLERANCE_SECONDS) {
        explain(local.relativePath, "size and mtime match, skipping");
        return Result<Verdict>::Ok(Verdict::Same);
    }

    Result<ObjectHead> head = store_.head(remote.location);
    if (!head.success) return headFailed(local, remote, head);

    auto it = head.data.metadata.find(Config::META_LOCAL_MTIME);
    if (it == head.data.metadata.end() || it->second.empty()) {
        explain(local.relativePath, "no mtime metadata, will transfer");
        return Result<Verdict>::Ok(Verdict::Different);
    }
    if (it->second == std::to_string(local.modTime)) {
        explain(local.relativePath, "local-mtime matches, skipping");
        return Result<Verdict>::Ok(Verdict::Same);
    }
    explain(local.relativePath, "mtime differs, will transfer");
    return Result<Verdict>::Ok(Verdict::Different);
}

Result<CompareMode> parseCompareMode(const std::string& name) {
    if (name == "checksum") return Result<CompareMode>::Ok(CompareMode::Checksum);
    if (name == "size-time") return Result<CompareMode>::Ok(CompareMode::SizeTime);
    return Result<CompareMode>::Error("unknown compare mode '" + name + "', use checksum or size-time",
                                      ErrorCode::Config);
}
