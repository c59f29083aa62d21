#pragma once
#include "../common/result.hpp"
#include "../storage/object_store.hpp"
#include "../tree/tree_builder.hpp"

enum class CompareMode { Checksum, SizeTime };

enum class Verdict { Same, Different };

// Decides whether one local file and one remote object hold the same content.
// Remote metadata is fetched with a HEAD only when the listing alone cannot
// settle it.
class ChangeDetector {
public:
    ChangeDetector(ObjectStore& store, CompareMode mode, bool encrypted = false);

    Result<Verdict> compare(const FileRecord& local, const FileRecord& remote) const;

    CompareMode mode() const { return mode_; }

private:
    Result<Verdict> compareChecksum(const FileRecord& local, const FileRecord& remote) const;
    Result<Verdict> compareSizeTime(const FileRecord& local, const FileRecord& remote) const;
    bool sizesMatch(const FileRecord& local, const FileRecord& remote) const;

    ObjectStore& store_;
    CompareMode mode_;
    bool encrypted_;
};

Result<CompareMode> parseCompareMode(const std::string& name);
