#include "copy_engine.hpp"
#include "../common/log.hpp"
#include "../common/path_utils.hpp"
#include "../common/thread_pool.hpp"
#include "../tree/tree_builder.hpp"
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

std::string uploadKeyFor(const std::string& key, const std::string& localPath) {
    if (key.empty() || key == "/") return PathUtils::baseName(localPath);
    if (key.back() == '/') return key + PathUtils::baseName(localPath);
    return key;
}

CopyEngine::CopyEngine(ObjectStore& store, const SyncOptions& options)
    : store_(store), options_(options), transfer_(store, options.transfer) {}

Result<void> CopyEngine::upload(const CancelToken& token, const std::string& localPath, const std::string& key,
                                SyncReport& report) const {
    std::error_code ec;
    if (!fs::exists(localPath, ec)) {
        return Result<void>::Error("failed to stat source: " + localPath, ErrorCode::Io);
    }
    if (fs::is_directory(localPath, ec)) {
        if (!options_.recursive) {
            return Result<void>::Error("source is a directory, use -r flag for recursive copy", ErrorCode::Config);
        }
        std::string prefix = key == "/" ? "" : PathUtils::directoryPrefix(key);
        return uploadDirectory(token, localPath, prefix, report);
    }

    CopyTask task{localPath, uploadKeyFor(key, localPath)};
    if (options_.dryRun) return uploadOne(token, task, report);

    // a lone file fails the whole command
    Log::info("Upload", "Uploading " + task.localPath + " to " + task.key);
    Result<TransferOutcome> moved = transfer_.upload(token, task.localPath, task.key, !options_.force);
    if (!moved.success) return Result<void>::From(moved, "failed to upload " + task.localPath);
    if (moved.data == TransferOutcome::Transferred) report.addUploaded(task.key);
    return Result<void>::Ok();
}

Result<void> CopyEngine::uploadDirectory(const CancelToken& token, const std::string& localDir,
                                         const std::string& prefix, SyncReport& report) const {
    auto worker = [this, &report](const CancelToken& taskToken, const CopyTask& task) {
        return uploadOne(taskToken, task, report);
    };

    // the walk feeds the workers as it goes
    auto producer = [this, &localDir, &prefix](const CancelToken& producerToken,
                                               TaskSink<CopyTask>& sink) -> Result<void> {
        std::error_code ec;
        fs::recursive_directory_iterator it(localDir, ec);
        if (ec) return Result<void>::Error("cannot walk " + localDir + ": " + ec.message(), ErrorCode::Io);

        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) return Result<void>::Error("cannot walk " + localDir + ": " + ec.message(), ErrorCode::Io);
            if (producerToken.isCancelled()) return producerToken.status();

            std::string rel = fs::relative(it->path(), localDir, ec).generic_string();
            if (ec) return Result<void>::Error("cannot resolve " + it->path().string(), ErrorCode::Io);

            if (it->is_directory(ec)) {
                if (options_.ignore && options_.ignore(rel + "/")) {
                    Log::info("Upload", "Ignoring directory: " + it->path().string());
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!it->is_regular_file(ec)) continue;
            if (options_.ignore && options_.ignore(rel)) {
                Log::info("Upload", "Ignoring file: " + it->path().string());
                continue;
            }

            if (!sink.push(CopyTask{it->path().string(), prefix + rel})) return producerToken.status();
        }
        return Result<void>::Ok();
    };

    return runWorkerPoolStream<CopyTask>(token, options_.maxWorkers, worker, producer);
}

Result<void> CopyEngine::uploadOne(const CancelToken& token, const CopyTask& task, SyncReport& report) const {
    if (options_.dryRun) {
        Log::info("Upload", "Would upload: " + task.localPath + " to " + task.key);
        report.addUploaded(task.key);
        return Result<void>::Ok();
    }

    Log::info("Upload", "Uploading " + task.localPath + " to " + task.key);
    Result<TransferOutcome> moved = transfer_.upload(token, task.localPath, task.key, !options_.force);
    if (!moved.success) {
        if (isCancellation(moved.code)) return Result<void>::From(moved);
        report.addError("Failed to upload " + task.localPath + ": " + moved.message);
        return Result<void>::Ok();
    }
    if (moved.data == TransferOutcome::Transferred) report.addUploaded(task.key);
    return Result<void>::Ok();
}

Result<void> CopyEngine::download(const CancelToken& token, const std::string& key, const std::string& localPath,
                                  SyncReport& report) const {
    Result<ObjectHead> head = key.empty() ? Result<ObjectHead>::Ok(ObjectHead{}) : store_.head(key);
    if (!head.success) return Result<void>::From(head, "failed to check " + key);

    std::error_code ec;
    if (head.data.exists) {
        std::string target = localPath;
        bool intoDirectory = localPath == "." || localPath == "./" ||
                             (!localPath.empty() && localPath.back() == '/') || fs::is_directory(localPath, ec);
        if (intoDirectory) {
            std::string name = PathUtils::baseName(key);
            if (!PathUtils::isContainedRelative(name)) {
                return Result<void>::Error("object " + key + " has no usable file name", ErrorCode::Config);
            }
            target = (fs::path(localPath) / name).string();
        }

        CopyTask task{target, key};
        if (options_.dryRun) return downloadOne(token, task, report);

        Log::info("Download", "Downloading " + task.key + " to " + task.localPath);
        Result<TransferOutcome> moved = transfer_.download(token, task.key, task.localPath, !options_.force);
        if (!moved.success) return Result<void>::From(moved, "failed to download " + task.key);
        if (moved.data == TransferOutcome::Transferred) report.addDownloaded(task.key);
        return Result<void>::Ok();
    }

    Result<Tree> listed = buildRemoteTree(store_, key, options_.ignore);
    if (!listed.success) return Result<void>::From(listed, "failed to list objects");
    if (listed.data.empty()) {
        return Result<void>::Error("no objects found with prefix: " + key, ErrorCode::NotFound);
    }

    if (!options_.dryRun) {
        // without the root directory there is nowhere to put anything
        Result<void> root = ensureDirectory(localPath);
        if (!root.success) return Result<void>::From(root, "failed to create destination directory");
    }

    std::vector<CopyTask> tasks;
    for (const auto& entry : listed.data) {
        tasks.push_back(CopyTask{(fs::path(localPath) / fs::path(entry.first)).string(), entry.second.location});
    }

    return runWorkerPool(token, tasks, options_.maxWorkers,
                         [this, &report](const CancelToken& taskToken, const CopyTask& task) {
                             return downloadOne(taskToken, task, report);
                         });
}

Result<void> CopyEngine::downloadOne(const CancelToken& token, const CopyTask& task, SyncReport& report) const {
    if (options_.dryRun) {
        Log::info("Download", "Would download: " + task.key + " to " + task.localPath);
        report.addDownloaded(task.key);
        return Result<void>::Ok();
    }

    Log::info("Download", "Downloading " + task.key + " to " + task.localPath);
    Result<TransferOutcome> moved = transfer_.download(token, task.key, task.localPath, !options_.force);
    if (!moved.success) {
        if (isCancellation(moved.code)) return Result<void>::From(moved);
        report.addError("Failed to download " + task.key + ": " + moved.message);
        return Result<void>::Ok();
    }
    if (moved.data == TransferOutcome::Transferred) report.addDownloaded(task.key);
    return Result<void>::Ok();
}
