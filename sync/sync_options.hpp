#pragma once
#include "../common/config.hpp"
#include "../common/ignore_matcher.hpp"
#include "../common/log.hpp"
#include "../transfer/transfer.hpp"
#include "change_detector.hpp"
#include <string>

// Everything one invocation was asked to do, built once from the command
// line and handed to every component.
struct SyncOptions {
    std::string source;
    std::string destination;
    std::string bucket;               // overrides the bucket of an s3:// location
    bool sync = false;                // mirror instead of copy
    bool recursive = false;
    int maxWorkers = Config::DEFAULT_MAX_WORKERS;
    bool dryRun = false;
    bool force = false;
    LogLevel logLevel = LogLevel::Normal;
    CompareMode compare = CompareMode::Checksum;
    long timeoutSeconds = 0;          // whole run, 0 for none
    TransferOptions transfer;         // encryption, passphrase, retry budget
    IgnorePredicate ignore;
};
