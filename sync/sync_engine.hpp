#pragma once
#include "../common/cancel_token.hpp"
#include "../common/path_utils.hpp"
#include "../common/result.hpp"
#include "../storage/object_store.hpp"
#include "diff_plan.hpp"
#include "sync_options.hpp"
#include "sync_report.hpp"
#include <string>

enum class SyncDirection { Upload, Download };

// Which side is local, which is remote, and which one wins.
struct SyncTarget {
    SyncDirection direction = SyncDirection::Upload;
    std::string localRoot;
    S3Location remote;     // key is a prefix ending in '/' unless empty
};

// Exactly one of source and destination must be an s3:// location.
Result<SyncTarget> resolveSyncTarget(const std::string& source, const std::string& destination,
                                     const std::string& bucketOverride);

// One-way mirror: after a successful run the destination holds exactly the
// source's files. Destination-only files are deleted.
class SyncEngine {
public:
    SyncEngine(ObjectStore& store, SyncTarget target, const SyncOptions& options);

    // both trees, compared; no side effects
    Result<DiffPlan> plan(const CancelToken& token) const;

    // Per-file failures land in report and do not stop the run. The result
    // fails only for what prevents the run as a whole.
    Result<void> run(const CancelToken& token, SyncReport& report) const;

    Result<void> execute(const CancelToken& token, const DiffPlan& plan, SyncReport& report) const;

private:
    struct SyncTask {
        bool remove = false;
        FileRecord record;
    };

    Result<void> runTask(const CancelToken& token, const SyncTask& task, SyncReport& report) const;
    Result<void> transferOne(const CancelToken& token, const FileRecord& record, SyncReport& report) const;
    Result<void> deleteOne(const FileRecord& record, SyncReport& report) const;

    std::string localPathOf(const std::string& relativePath) const;

    ObjectStore& store_;
    SyncTarget target_;
    SyncOptions options_;
    Transfer transfer_;
};
