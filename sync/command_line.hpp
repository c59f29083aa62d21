#pragma once
#include "../common/result.hpp"
#include "sync_options.hpp"
#include <string>
#include <vector>

struct CommandLine {
    SyncOptions options;
    std::string ignorePatterns;   // comma-separated
    std::string ignoreFile;
    bool help = false;
};

// s3mirror [options] <source> <destination>
Result<CommandLine> parseCommandLine(const std::vector<std::string>& args);

// falls back to S3MIRROR_PASSWORD; an encrypting run without one is a config error
Result<void> resolvePassphrase(CommandLine& cmd);

std::string usage();
