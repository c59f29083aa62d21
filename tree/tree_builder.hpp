#pragma once
#include "../common/ignore_matcher.hpp"
#include "../common/result.hpp"
#include "../storage/object_store.hpp"
#include <cstdint>
#include <map>
#include <string>

struct FileRecord {
    std::string relativePath;   // slash-separated, never empty
    uint64_t size = 0;
    std::string contentHash;    // local MD5 or remote ETag; empty when unknown
    int64_t modTime = 0;        // unix seconds; 0 when unknown
    bool isRemote = false;
    std::string location;       // absolute local path or full object key
};

// relativePath -> record, one enumeration pass per side
using Tree = std::map<std::string, FileRecord>;

// Every regular file under root not hidden by ignore. Hashing every file is
// optional; size-time comparison never needs it.
Result<Tree> buildLocalTree(const std::string& root, const IgnorePredicate& ignore, bool computeHashes);

// Every object under prefix, paging through the listing. Keys are URL-decoded
// and made relative to prefix; directory markers are skipped.
Result<Tree> buildRemoteTree(ObjectStore& store, const std::string& prefix, const IgnorePredicate& ignore);
