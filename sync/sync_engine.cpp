#include "sync_engine.hpp"
#include "../common/log.hpp"
#include "../common/thread_pool.hpp"
#include "../tree/tree_builder.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

Result<SyncTarget> resolveSyncTarget(const std::string& source, const std::string& destination,
                                     const std::string& bucketOverride) {
    bool sourceRemote = PathUtils::isS3Url(source);
    bool destinationRemote = PathUtils::isS3Url(destination);
    if (sourceRemote && destinationRemote) {
        return Result<SyncTarget>::Error("S3 to S3 sync is not supported", ErrorCode::Config);
    }
    if (!sourceRemote && !destinationRemote) {
        return Result<SyncTarget>::Error("local to local sync is not supported, one side must be s3://",
                                         ErrorCode::Config);
    }

    SyncTarget target;
    target.direction = sourceRemote ? SyncDirection::Download : SyncDirection::Upload;
    target.localRoot = sourceRemote ? destination : source;

    Result<S3Location> remote = PathUtils::parseS3Url(sourceRemote ? source : destination, bucketOverride);
    if (!remote.success) return Result<SyncTarget>::From(remote);
    target.remote = remote.data;
    target.remote.key = PathUtils::directoryPrefix(target.remote.key);

    std::error_code ec;
    if (target.direction == SyncDirection::Upload) {
        if (!fs::is_directory(target.localRoot, ec)) {
            return Result<SyncTarget>::Error("sync source must be an existing directory: " + target.localRoot,
                                             ErrorCode::Config);
        }
    } else if (fs::exists(target.localRoot, ec) && !fs::is_directory(target.localRoot, ec)) {
        return Result<SyncTarget>::Error("sync destination is not a directory: " + target.localRoot,
                                         ErrorCode::Config);
    }
    return Result<SyncTarget>::Ok(target);
}

namespace {
// size-time comparison needs a downloaded file to carry the object's mtime
TransferOptions syncTransferOptions(const SyncOptions& options) {
    TransferOptions transfer = options.transfer;
    transfer.preserveMtime = options.compare == CompareMode::SizeTime;
    return transfer;
}
}

SyncEngine::SyncEngine(ObjectStore& store, SyncTarget target, const SyncOptions& options)
    : store_(store), target_(std::move(target)), options_(options),
      transfer_(store, syncTransferOptions(options)) {}

std::string SyncEngine::localPathOf(const std::string& relativePath) const {
    return (fs::path(target_.localRoot) / fs::path(relativePath)).string();
}

Result<DiffPlan> SyncEngine::plan(const CancelToken& token) const {
    bool hashLocal = options_.compare == CompareMode::Checksum && !options_.transfer.encrypt;

    Tree local;
    std::error_code ec;
    if (target_.direction == SyncDirection::Upload || fs::exists(target_.localRoot, ec)) {
        Result<Tree> walked = buildLocalTree(target_.localRoot, options_.ignore, hashLocal);
        if (!walked.success) return Result<DiffPlan>::From(walked, "failed to list local files");
        local = walked.data;
    }

    Result<void> live = token.status();
    if (!live.success) return Result<DiffPlan>::From(live);

    Result<Tree> remote = buildRemoteTree(store_, target_.remote.key, options_.ignore);
    if (!remote.success) return Result<DiffPlan>::From(remote, "failed to list S3 files");

    ChangeDetector detector(store_, options_.compare, options_.transfer.encrypt);
    bool upload = target_.direction == SyncDirection::Upload;
    SameContent same = [&](const FileRecord& src, const FileRecord& dst) -> Result<bool> {
        Result<void> alive = token.status();
        if (!alive.success) return Result<bool>::From(alive);
        Result<Verdict> verdict = upload ? detector.compare(src, dst) : detector.compare(dst, src);
        if (!verdict.success) return Result<bool>::From(verdict);
        return Result<bool>::Ok(verdict.data == Verdict::Same);
    };

    return upload ? computeDiff(local, remote.data, same) : computeDiff(remote.data, local, same);
}

Result<void> SyncEngine::run(const CancelToken& token, SyncReport& report) const {
    Result<DiffPlan> diff = plan(token);
    if (!diff.success) return Result<void>::From(diff);

    Log::verbose("Sync", std::to_string(diff.data.toTransfer.size()) + " to transfer, " +
                         std::to_string(diff.data.toDelete.size()) + " to delete, " +
                         std::to_string(diff.data.unchangedCount) + " unchanged");
    return execute(token, diff.data, report);
}

Result<void> SyncEngine::execute(const CancelToken& token, const DiffPlan& plan, SyncReport& report) const {
    if (plan.empty()) return token.status();

    if (target_.direction == SyncDirection::Download && !options_.dryRun) {
        Result<void> root = ensureDirectory(target_.localRoot);
        if (!root.success) return root;
    }

    // transfers and deletes touch disjoint paths and share one pool
    auto worker = [this, &report](const CancelToken& taskToken, const SyncTask& task) {
        return runTask(taskToken, task, report);
    };
    auto producer = [&plan](const CancelToken& producerToken, TaskSink<SyncTask>& sink) -> Result<void> {
        for (const FileRecord& record : plan.toTransfer) {
            if (!sink.push(SyncTask{false, record})) return producerToken.status();
        }
        for (const FileRecord& record : plan.toDelete) {
            if (!sink.push(SyncTask{true, record})) return producerToken.status();
        }
        return Result<void>::Ok();
    };
    return runWorkerPoolStream<SyncTask>(token, options_.maxWorkers, worker, producer);
}

Result<void> SyncEngine::runTask(const CancelToken& token, const SyncTask& task, SyncReport& report) const {
    return task.remove ? deleteOne(task.record, report) : transferOne(token, task.record, report);
}

Result<void> SyncEngine::transferOne(const CancelToken& token, const FileRecord& record, SyncReport& report) const {
    bool upload = target_.direction == SyncDirection::Upload;
    const std::string& rel = record.relativePath;

    if (options_.dryRun) {
        Log::info("Sync", std::string(upload ? "Would upload: " : "Would download: ") + rel);
        if (upload) report.addUploaded(rel);
        else report.addDownloaded(rel);
        return Result<void>::Ok();
    }

    Result<TransferOutcome> moved = upload
        ? transfer_.upload(token, record.location, target_.remote.key + rel)
        : transfer_.download(token, record.location, localPathOf(rel), false, record.modTime);

    if (!moved.success) {
        if (isCancellation(moved.code)) return Result<void>::From(moved);
        report.addError(std::string(upload ? "Failed to upload " : "Failed to download ") + rel + ": " + moved.message);
        return Result<void>::Ok();
    }

    Log::info("Sync", std::string(upload ? "Uploaded: " : "Downloaded: ") + rel);
    if (upload) report.addUploaded(rel);
    else report.addDownloaded(rel);
    return Result<void>::Ok();
}

Result<void> SyncEngine::deleteOne(const FileRecord& record, SyncReport& report) const {
    const std::string& rel = record.relativePath;
    // the destination is whichever side is not the source
    bool remote = target_.direction == SyncDirection::Upload;

    if (options_.dryRun) {
        Log::info("Sync", std::string(remote ? "Would delete S3 file: " : "Would delete local file: ") + rel);
        report.addDeleted(rel);
        return Result<void>::Ok();
    }

    if (remote) {
        Result<void> removed = store_.remove(record.location);
        if (!removed.success) {
            report.addError("Failed to delete S3 file " + rel + ": " + removed.message);
            return Result<void>::Ok();
        }
    } else {
        std::error_code ec;
        fs::remove(record.location, ec);
        if (ec) {
            report.addError("Failed to delete local file " + rel + ": " + ec.message());
            return Result<void>::Ok();
        }
    }

    Log::info("Sync", std::string(remote ? "Deleted S3 file: " : "Deleted local file: ") + rel);
    report.addDeleted(rel);
    return Result<void>::Ok();
}
