#include "transfer.hpp"
#include "../common/byte_pipe.hpp"
#include "../common/byte_stream.hpp"
#include "../common/hash_utils.hpp"
#include "../common/log.hpp"
#include "../crypto/stream_cipher.hpp"
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <thread>
#include <system_error>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>
#include <utime.h>

namespace fs = std::filesystem;

Result<void> ensureDirectory(const std::string& path) {
    if (path.empty()) return Result<void>::Ok();
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec && !fs::is_directory(path)) {
        return Result<void>::Error("failed to create directory " + path + ": " + ec.message(), ErrorCode::Io);
    }
    return Result<void>::Ok();
}

namespace {
// ".<name>.XXXXXX" beside localPath, created exclusively
Result<std::string> createTempFile(const std::string& localPath) {
    fs::path target(localPath);
    std::string pattern = (target.parent_path() / ("." + target.filename().string() + ".XXXXXX")).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return Result<std::string>::Error("failed to create temporary file for " + localPath + ": " +
                                          std::strerror(errno), ErrorCode::Io);
    }
    // mkstemp creates 0600; downloads get the usual rw-r--r--
    ::fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    ::close(fd);
    return Result<std::string>::Ok(std::string(name.data()));
}
}

Transfer::Transfer(ObjectStore& store, TransferOptions options) : store_(store), options_(std::move(options)) {}

Result<void> Transfer::withRetries(const CancelToken& token, const std::string& what,
                                   const std::function<Result<void>()>& attempt) const {
    int attempts = options_.attempts < 1 ? 1 : options_.attempts;
    Result<void> last = Result<void>::Ok();
    for (int i = 1; i <= attempts; ++i) {
        Result<void> live = token.status();
        if (!live.success) return live;

        last = attempt();
        if (last.success || last.code != ErrorCode::Transient) return last;
        if (i == attempts) break;

        auto delay = std::chrono::milliseconds(Config::RETRY_BASE_DELAY_MS << (i - 1));
        Log::verbose("Transfer", what + " failed (" + last.message + "), retrying in " +
                                 std::to_string(delay.count()) + "ms");
        if (!token.sleepFor(delay)) return token.status();
    }
    return Result<void>::From(last, what + " failed after " + std::to_string(attempts) + " attempts");
}

Result<bool> Transfer::remoteMatches(const std::string& key, const std::string& localMd5) const {
    Result<ObjectHead> head = store_.head(key);
    if (!head.success) return Result<bool>::From(head, "could not check object");
    if (!head.data.exists) return Result<bool>::Ok(false);

    if (head.data.etag == localMd5) {
        Log::verbose("Transfer", key + ": ETag matches");
        return Result<bool>::Ok(true);
    }
    auto it = head.data.metadata.find(Config::META_LOCAL_MD5);
    if (it == head.data.metadata.end()) {
        Log::verbose("Transfer", key + ": no checksum metadata, will transfer");
        return Result<bool>::Ok(false);
    }
    if (it->second == localMd5) {
        Log::verbose("Transfer", key + ": local-md5 matches");
        return Result<bool>::Ok(true);
    }
    Log::verbose("Transfer", key + ": checksum differs (local " + localMd5 + ", metadata " + it->second + ")");
    return Result<bool>::Ok(false);
}

Result<TransferOutcome> Transfer::upload(const CancelToken& token, const std::string& localPath,
                                         const std::string& key, bool skipIdentical) const {
    if (skipIdentical && !options_.encrypt) {
        Result<std::string> md5 = HashUtils::fileMd5Hex(localPath);
        if (!md5.success) return Result<TransferOutcome>::From(md5);
        Result<bool> same = remoteMatches(key, md5.data);
        if (!same.success) {
            Log::verbose("Transfer", same.message);
        } else if (same.data) {
            Log::info("Upload", "Skipping " + localPath + " (already exists with same checksum)");
            return Result<TransferOutcome>::Ok(TransferOutcome::Skipped);
        }
    }

    Result<void> done = withRetries(token, "upload " + localPath, [&]() { return uploadOnce(localPath, key); });
    if (!done.success) return Result<TransferOutcome>::From(done);
    return Result<TransferOutcome>::Ok(TransferOutcome::Transferred);
}

Result<void> Transfer::uploadOnce(const std::string& localPath, const std::string& key) const {
    struct stat st;
    if (::stat(localPath.c_str(), &st) != 0) {
        return Result<void>::Error("failed to stat " + localPath, ErrorCode::Io);
    }
    uint64_t size = static_cast<uint64_t>(st.st_size);

    ObjectMetadata metadata;
    metadata[Config::META_LOCAL_MTIME] = std::to_string(static_cast<int64_t>(st.st_mtime));

    FileSource file(localPath);
    if (!file.isOpen()) {
        return Result<void>::Error("failed to open file " + localPath, ErrorCode::Io);
    }

    if (!options_.encrypt) {
        Result<std::string> md5 = HashUtils::fileMd5Hex(localPath);
        if (md5.success) {
            metadata[Config::META_LOCAL_MD5] = md5.data;
        } else {
            Log::verbose("Upload", "could not checksum " + localPath + ": " + md5.message);
        }
        return store_.put(key, file, size, metadata);
    }

    // encrypt on a second thread straight into the request body
    StreamCipher cipher(options_.passphrase);
    BytePipe pipe;
    Result<void> encrypted = Result<void>::Ok();
    std::thread encryptor([&]() {
        encrypted = cipher.encrypt(file, pipe.writer());
        pipe.closeWrite(encrypted);
    });

    Result<void> stored = store_.put(key, pipe.reader(), StreamCipher::encryptedSize(size), metadata);
    // releases the encryptor if the upload stopped reading early
    pipe.closeRead(stored);
    encryptor.join();

    // an encryption failure reaches the upload through the pipe, so stored carries it
    if (!stored.success) return stored;
    if (!encrypted.success) return Result<void>::From(encrypted, "encryption failed");
    return Result<void>::Ok();
}

Result<TransferOutcome> Transfer::download(const CancelToken& token, const std::string& key,
                                           const std::string& localPath, bool skipIdentical,
                                           int64_t remoteModTime) const {
    std::error_code ec;
    if (skipIdentical && !options_.encrypt && fs::is_regular_file(localPath, ec)) {
        Result<std::string> md5 = HashUtils::fileMd5Hex(localPath);
        if (!md5.success) {
            Log::verbose("Download", "could not checksum " + localPath + ": " + md5.message);
        } else {
            Result<bool> same = remoteMatches(key, md5.data);
            if (!same.success) {
                Log::verbose("Download", same.message);
            } else if (same.data) {
                Log::info("Download", "Skipping " + localPath + " (local file already exists with same checksum)");
                return Result<TransferOutcome>::Ok(TransferOutcome::Skipped);
            }
        }
    }

    Result<void> dir = ensureDirectory(fs::path(localPath).parent_path().string());
    if (!dir.success) return Result<TransferOutcome>::From(dir);

    Result<void> done = withRetries(token, "download " + key, [&]() { return downloadOnce(key, localPath); });
    if (!done.success) return Result<TransferOutcome>::From(done);

    if (options_.preserveMtime && remoteModTime > 0) {
        struct utimbuf times;
        times.actime = static_cast<time_t>(remoteModTime);
        times.modtime = static_cast<time_t>(remoteModTime);
        if (::utime(localPath.c_str(), &times) != 0) {
            Log::verbose("Download", "Warning: failed to set file mtime for " + localPath);
        }
    }
    return Result<TransferOutcome>::Ok(TransferOutcome::Transferred);
}

Result<void> Transfer::downloadOnce(const std::string& key, const std::string& localPath) const {
    Result<std::string> temp = createTempFile(localPath);
    if (!temp.success) return Result<void>::From(temp);
    const std::string& tempFilePath = temp.data;

    FileSink tempFile(tempFilePath);
    if (!tempFile.isOpen()) {
        std::remove(tempFilePath.c_str());
        return Result<void>::Error("failed to open file " + tempFilePath, ErrorCode::Io);
    }

    Result<void> fetched = Result<void>::Ok();
    if (!options_.encrypt) {
        fetched = store_.get(key, tempFile);
    } else {
        StreamCipher cipher(options_.passphrase);
        BytePipe pipe;
        Result<void> decrypted = Result<void>::Ok();
        std::thread decryptor([&]() {
            decrypted = cipher.decrypt(pipe.reader(), tempFile);
            pipe.closeRead(decrypted);
        });

        Result<void> got = store_.get(key, pipe.writer());
        pipe.closeWrite(got);
        decryptor.join();

        // a failed fetch reaches the decryptor through the pipe, so decrypted carries it
        fetched = decrypted.success ? got : decrypted;
    }

    Result<void> closed = tempFile.close();
    if (fetched.success && !closed.success) fetched = closed;

    if (!fetched.success) {
        std::remove(tempFilePath.c_str());
        return fetched;
    }

    // atomic swap
    if (std::rename(tempFilePath.c_str(), localPath.c_str()) != 0) {
        std::remove(tempFilePath.c_str());
        return Result<void>::Error("failed to move " + tempFilePath + " into place", ErrorCode::Io);
    }
    return Result<void>::Ok();
}
