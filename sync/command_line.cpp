#include "command_line.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace {
bool parseInt(const std::string& text, long& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    value = std::strtol(text.c_str(), &end, 10);
    return errno != ERANGE && end != nullptr && *end == '\0';
}

// "--flag=value" or "--flag value"
bool takeValue(const std::vector<std::string>& args, size_t& i, const std::string& inlineValue,
               bool hasInline, std::string& value) {
    if (hasInline) {
        value = inlineValue;
        return true;
    }
    if (i + 1 >= args.size()) return false;
    value = args[++i];
    return true;
}
}

Result<CommandLine> parseCommandLine(const std::vector<std::string>& args) {
    CommandLine cmd;
    SyncOptions& opts = cmd.options;
    std::vector<std::string> positional;
    bool quiet = false;
    bool verbose = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        if (arg.size() < 2 || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }

        std::string inlineValue;
        bool hasInline = false;
        size_t eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            inlineValue = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            hasInline = true;
        }

        std::string value;
        auto needValue = [&](const std::string& name) -> Result<void> {
            if (!takeValue(args, i, inlineValue, hasInline, value)) {
                return Result<void>::Error("flag " + name + " needs a value", ErrorCode::Config);
            }
            return Result<void>::Ok();
        };
        auto needInt = [&](const std::string& name, long& out) -> Result<void> {
            Result<void> got = needValue(name);
            if (!got.success) return got;
            if (!parseInt(value, out)) {
                return Result<void>::Error("flag " + name + " expects a number, got '" + value + "'", ErrorCode::Config);
            }
            return Result<void>::Ok();
        };
        // values that end up in an int
        auto needSmallInt = [&](const std::string& name, int& out) -> Result<void> {
            long wide = 0;
            Result<void> got = needInt(name, wide);
            if (!got.success) return got;
            if (wide < INT_MIN || wide > INT_MAX) {
                return Result<void>::Error("flag " + name + " is out of range: " + value, ErrorCode::Config);
            }
            out = static_cast<int>(wide);
            return Result<void>::Ok();
        };

        Result<void> ok = Result<void>::Ok();
        long number = 0;
        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "--sync") {
            opts.sync = true;
        } else if (arg == "-r" || arg == "--recursive") {
            opts.recursive = true;
        } else if (arg == "-e" || arg == "--encrypt") {
            opts.transfer.encrypt = true;
        } else if (arg == "--dry-run") {
            opts.dryRun = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--force" || arg == "--force-overwrite") {
            opts.force = true;
        } else if (arg == "-s" || arg == "--source") {
            ok = needValue(arg);
            opts.source = value;
        } else if (arg == "-d" || arg == "--destination") {
            ok = needValue(arg);
            opts.destination = value;
        } else if (arg == "-b" || arg == "--bucket") {
            ok = needValue(arg);
            opts.bucket = value;
        } else if (arg == "-p" || arg == "--password") {
            ok = needValue(arg);
            opts.transfer.passphrase = value;
        } else if (arg == "--ignore") {
            ok = needValue(arg);
            cmd.ignorePatterns = value;
        } else if (arg == "--ignore-file") {
            ok = needValue(arg);
            cmd.ignoreFile = value;
        } else if (arg == "--compare") {
            ok = needValue(arg);
            if (ok.success) {
                Result<CompareMode> mode = parseCompareMode(value);
                if (!mode.success) return Result<CommandLine>::From(mode);
                opts.compare = mode.data;
            }
        } else if (arg == "--max-workers") {
            ok = needSmallInt(arg, opts.maxWorkers);
        } else if (arg == "--timeout") {
            ok = needInt(arg, number);
            opts.timeoutSeconds = number;
        } else if (arg == "--retries") {
            ok = needSmallInt(arg, opts.transfer.attempts);
        } else {
            return Result<CommandLine>::Error("unknown flag " + arg, ErrorCode::Config);
        }
        if (!ok.success) return Result<CommandLine>::From(ok);
    }

    if (cmd.help) return Result<CommandLine>::Ok(cmd);

    if (!positional.empty() && opts.source.empty()) {
        opts.source = positional.front();
        positional.erase(positional.begin());
    }
    if (!positional.empty() && opts.destination.empty()) {
        opts.destination = positional.front();
        positional.erase(positional.begin());
    }
    if (!positional.empty()) {
        return Result<CommandLine>::Error("unexpected argument " + positional.front(), ErrorCode::Config);
    }
    if (opts.source.empty()) {
        return Result<CommandLine>::Error("source is required", ErrorCode::Config);
    }
    if (opts.destination.empty()) {
        return Result<CommandLine>::Error("destination is required", ErrorCode::Config);
    }
    if (opts.maxWorkers < 1) {
        return Result<CommandLine>::Error("max workers must be at least 1, got " + std::to_string(opts.maxWorkers),
                                          ErrorCode::Config);
    }
    if (opts.transfer.attempts < 1) {
        return Result<CommandLine>::Error("retries must be at least 1", ErrorCode::Config);
    }
    if (opts.timeoutSeconds < 0) {
        return Result<CommandLine>::Error("timeout cannot be negative", ErrorCode::Config);
    }

    if (quiet) opts.logLevel = LogLevel::Quiet;
    else if (verbose) opts.logLevel = LogLevel::Verbose;
    return Result<CommandLine>::Ok(cmd);
}

Result<void> resolvePassphrase(CommandLine& cmd) {
    TransferOptions& transfer = cmd.options.transfer;
    if (!transfer.encrypt) return Result<void>::Ok();
    if (transfer.passphrase.empty()) {
        const char* env = std::getenv("S3MIRROR_PASSWORD");
        if (env != nullptr) transfer.passphrase = env;
    }
    if (transfer.passphrase.empty()) {
        return Result<void>::Error("empty password provided for encryption, use --password or S3MIRROR_PASSWORD",
                                   ErrorCode::Config);
    }
    return Result<void>::Ok();
}

std::string usage() {
    std::ostringstream out;
    out << "Usage: s3mirror [options] <source> <destination>\n"
        << "Copy or mirror files between local storage and S3-compatible storage.\n\n"
        << "  --sync                  make destination exactly match source (deletes extra files)\n"
        << "  -r, --recursive         copy directories recursively\n"
        << "  -b, --bucket NAME       bucket, when not given as s3://bucket/key\n"
        << "  -e, --encrypt           encrypt uploads / decrypt downloads\n"
        << "  -p, --password PASS     encryption password (or S3MIRROR_PASSWORD)\n"
        << "  --ignore PATTERNS       comma-separated gitignore-style patterns\n"
        << "  --ignore-file FILE      file with one ignore pattern per line\n"
        << "  --max-workers N         concurrent transfers (default 5)\n"
        << "  --compare MODE          checksum (default) or size-time\n"
        << "  --dry-run               show what would be done\n"
        << "  --force                 transfer even when the copy already matches\n"
        << "  --timeout SECONDS       give up after this long (0 for none)\n"
        << "  --retries N             attempts for transient failures (default 3)\n"
        << "  --quiet                 errors only\n"
        << "  --verbose               explain every decision\n"
        << "  -h, --help              this text\n\n"
        << "Environment: S3MIRROR_ENDPOINT, S3MIRROR_ACCESS_KEY, S3MIRROR_SECRET_KEY,\n"
        << "             S3MIRROR_REGION, S3MIRROR_USE_PATH_STYLE\n";
    return out.str();
}
