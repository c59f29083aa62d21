#include "common/cancel_token.hpp"
#include "common/ignore_matcher.hpp"
#include "common/log.hpp"
#include "common/path_utils.hpp"
#include "storage/s3_client.hpp"
#include "sync/command_line.hpp"
#include "sync/copy_engine.hpp"
#include "sync/sync_engine.hpp"
#include "sync/sync_report.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

int fail(const std::string& message) {
    Log::error("s3mirror", message);
    return 1;
}

int runSync(const CommandLine& cmd, const S3Config& s3, const CancelToken& token) {
    const SyncOptions& options = cmd.options;
    Result<SyncTarget> target = resolveSyncTarget(options.source, options.destination, options.bucket);
    if (!target.success) return fail(target.message);

    S3Client client(s3, target.data.remote.bucket);
    SyncEngine engine(client, target.data, options);
    SyncReport report;

    Result<void> ran = engine.run(token, report);
    if (!ran.success) return fail("error syncing directories: " + ran.message);

    printSyncSummary(report);
    if (report.hasErrors()) return 1;
    Log::info("s3mirror", "Sync operation completed successfully!");
    return 0;
}

int runCopy(const CommandLine& cmd, const S3Config& s3, const CancelToken& token) {
    const SyncOptions& options = cmd.options;
    bool sourceRemote = PathUtils::isS3Url(options.source);
    bool destinationRemote = PathUtils::isS3Url(options.destination);
    if (sourceRemote && destinationRemote) return fail("S3 to S3 copy is not supported");
    if (!sourceRemote && !destinationRemote) return fail("at least one of source or destination must be S3");

    Result<S3Location> remote = PathUtils::parseS3Url(sourceRemote ? options.source : options.destination,
                                                      options.bucket);
    if (!remote.success) return fail(remote.message);

    S3Client client(s3, remote.data.bucket);
    CopyEngine engine(client, options);
    SyncReport report;

    Result<void> ran = sourceRemote
        ? engine.download(token, remote.data.key, options.destination, report)
        : engine.upload(token, options.source, remote.data.key, report);
    if (!ran.success) {
        return fail(std::string(sourceRemote ? "error downloading from S3: " : "error uploading to S3: ") + ran.message);
    }

    std::vector<std::string> errors = report.errors();
    for (const auto& error : errors) Log::error("s3mirror", error);
    if (!errors.empty()) return 1;

    Log::info("s3mirror", "Copy operation completed successfully!");
    return 0;
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Result<CommandLine> parsed = parseCommandLine(args);
    if (!parsed.success) {
        std::cerr << usage();
        return fail(parsed.message);
    }
    CommandLine cmd = parsed.data;
    if (cmd.help) {
        std::cout << usage();
        return 0;
    }
    Log::setLevel(cmd.options.logLevel);

    Result<S3Config> s3 = S3Config::fromEnvironment();
    if (!s3.success) return fail(s3.message);

    Result<IgnoreMatcher> ignore = IgnoreMatcher::load(cmd.ignorePatterns, cmd.ignoreFile);
    if (!ignore.success) return fail("error initializing ignore patterns: " + ignore.message);
    cmd.options.ignore = ignore.data.predicate();

    Result<void> passphrase = resolvePassphrase(cmd);
    if (!passphrase.success) return fail(passphrase.message);

    CancelToken token = cmd.options.timeoutSeconds > 0
        ? CancelToken::withTimeout(std::chrono::seconds(cmd.options.timeoutSeconds))
        : CancelToken();

    return cmd.options.sync ? runSync(cmd, s3.data, token) : runCopy(cmd, s3.data, token);
}
