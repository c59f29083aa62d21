// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

namespace Config {
    // encrypted container layout
    inline constexpr size_t ENCRYPTION_CHUNK_SIZE = 1024 * 1024;   // plaintext bytes per sealed chunk
    inline constexpr size_t SALT_SIZE = 32;
    inline constexpr size_t NONCE_SIZE = 12;
    inline constexpr size_t KEY_SIZE = 32;
    inline constexpr size_t TAG_SIZE = 16;
    inline constexpr size_t HEADER_SIZE = SALT_SIZE + NONCE_SIZE;
    inline constexpr size_t CHUNK_LENGTH_PREFIX = 4;

    // Argon2id, must match bit-for-bit across every reader and writer
    inline constexpr uint32_t KDF_TIME_COST = 3;
    inline constexpr uint32_t KDF_MEMORY_KIB = 64 * 1024;
    inline constexpr uint32_t KDF_PARALLELISM = 4;

    // worker queue holds this many tasks per worker
    inline constexpr size_t WORKER_QUEUE_MULTIPLIER = 2;

    inline constexpr size_t PIPE_CAPACITY = 2 * ENCRYPTION_CHUNK_SIZE;
    inline constexpr size_t COPY_BUFFER_SIZE = 256 * 1024;

    inline constexpr uint64_t MULTIPART_THRESHOLD = 64ull * 1024 * 1024;
    inline constexpr uint64_t MULTIPART_PART_SIZE = 16ull * 1024 * 1024;

    inline constexpr int DEFAULT_MAX_WORKERS = 5;
    inline constexpr int DEFAULT_RETRIES = 3;
    inline constexpr int RETRY_BASE_DELAY_MS = 200;

    // clock skew allowed between local mtime and the store's LastModified
    inline constexpr int64_t MTIME_TOLERANCE_SECONDS = 1;

    inline constexpr const char* META_LOCAL_MD5 = "local-md5";
    inline constexpr const char* META_LOCAL_MTIME = "local-mtime";
}
