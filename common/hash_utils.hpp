#pragma once
#include "result.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

class HashUtils {
public:

    static std::string toHex(const unsigned char* data, size_t len) {
        static const char* hex = "0123456789abcdef";
        std::string result;
        result.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            result += hex[(data[i] >> 4) & 0xF];
            result += hex[data[i] & 0xF];
        }
        return result;
    }

    static std::string md5Hex(const char* data, size_t len) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;
        EVP_Digest(data, len, digest, &digestLen, EVP_md5(), nullptr);
        return toHex(digest, digestLen);
    }

    // MD5 of a whole file, read in fixed-size pieces so memory stays flat
    static Result<std::string> fileMd5Hex(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string>::Error("Failed to open file: " + path, ErrorCode::Io);
        }

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
            return Result<std::string>::Error("Failed to initialise MD5 digest", ErrorCode::Io);
        }

        std::vector<char> buffer(256 * 1024);
        while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount()));
        }
        if (file.bad()) {
            return Result<std::string>::Error("Read error while hashing: " + path, ErrorCode::Io);
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen);
        return Result<std::string>::Ok(toHex(digest, digestLen));
    }

    static std::string sha256Hex(const std::string& data) {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
        return toHex(hash, SHA256_DIGEST_LENGTH);
    }

    // raw (binary) HMAC-SHA256, used to chain the request-signing keys
    static std::string hmacSha256(const std::string& key, const std::string& data) {
        unsigned char mac[EVP_MAX_MD_SIZE];
        unsigned int macLen = 0;
        HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac, &macLen);
        return std::string(reinterpret_cast<char*>(mac), macLen);
    }

};
