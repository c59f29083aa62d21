#include "stream_cipher.hpp"
#include "../common/config.hpp"
#include <cstring>
#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

const char* DECRYPTION_FAILED = "decryption failed (wrong passphrase or corrupted data)";

// wipes the derived key when it goes out of scope
struct KeyGuard {
    std::vector<unsigned char>& key;
    ~KeyGuard() {
        if (!key.empty()) OPENSSL_cleanse(key.data(), key.size());
    }
};

void chunkNonce(const unsigned char* baseNonce, uint64_t counter, unsigned char* out) {
    std::memcpy(out, baseNonce, Config::NONCE_SIZE);
    for (int i = 0; i < 8; ++i) {
        out[Config::NONCE_SIZE - 1 - i] = static_cast<unsigned char>(counter >> (8 * i));
    }
}

void putUint32(unsigned char* out, uint32_t value) {
    out[0] = static_cast<unsigned char>(value >> 24);
    out[1] = static_cast<unsigned char>(value >> 16);
    out[2] = static_cast<unsigned char>(value >> 8);
    out[3] = static_cast<unsigned char>(value);
}

uint32_t getUint32(const unsigned char* in) {
    return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

// ciphertext || tag into out; out must hold len + TAG_SIZE bytes
bool sealChunk(EVP_CIPHER_CTX* ctx, const unsigned char* key, const unsigned char* nonce,
               const unsigned char* in, size_t len, unsigned char* out) {
    int outLen = 0;
    int finalLen = 0;
    if (EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) return false;
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(Config::NONCE_SIZE), nullptr) != 1) return false;
    if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key, nonce) != 1) return false;
    if (len > 0 && EVP_EncryptUpdate(ctx, out, &outLen, in, static_cast<int>(len)) != 1) return false;
    if (EVP_EncryptFinal_ex(ctx, out + outLen, &finalLen) != 1) return false;
    return EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, static_cast<int>(Config::TAG_SIZE),
                               out + len) == 1;
}

// verifies the trailing tag and writes len - TAG_SIZE plaintext bytes
bool openChunk(EVP_CIPHER_CTX* ctx, const unsigned char* key, const unsigned char* nonce,
               const unsigned char* in, size_t len, unsigned char* out) {
    size_t bodyLen = len - Config::TAG_SIZE;
    unsigned char tag[Config::TAG_SIZE];
    std::memcpy(tag, in + bodyLen, Config::TAG_SIZE);

    int outLen = 0;
    int finalLen = 0;
    if (EVP_DecryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) return false;
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(Config::NONCE_SIZE), nullptr) != 1) return false;
    if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key, nonce) != 1) return false;
    if (bodyLen > 0 && EVP_DecryptUpdate(ctx, out, &outLen, in, static_cast<int>(bodyLen)) != 1) return false;
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, static_cast<int>(Config::TAG_SIZE), tag) != 1) return false;
    return EVP_DecryptFinal_ex(ctx, out + outLen, &finalLen) == 1;
}

}

StreamCipher::StreamCipher(std::string passphrase) : passphrase_(std::move(passphrase)) {}

bool StreamCipher::kdfAvailable() {
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr);
    if (kdf == nullptr) return false;
    EVP_KDF_free(kdf);
    return true;
}

Result<std::vector<unsigned char>> StreamCipher::deriveKey(const std::string& passphrase,
                                                           const unsigned char* salt, size_t saltLen) {
    std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)> kdf(EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr), &EVP_KDF_free);
    if (!kdf) {
        return Result<std::vector<unsigned char>>::Error(
            "Argon2id key derivation is not available in this OpenSSL build (3.2 or newer required)",
            ErrorCode::Config);
    }
    std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)> ctx(EVP_KDF_CTX_new(kdf.get()), &EVP_KDF_CTX_free);
    if (!ctx) {
        return Result<std::vector<unsigned char>>::Error("failed to create KDF context", ErrorCode::Io);
    }

    uint32_t iterations = Config::KDF_TIME_COST;
    uint32_t lanes = Config::KDF_PARALLELISM;
    uint32_t memoryKib = Config::KDF_MEMORY_KIB;
    // lanes fix the output; threads only affect speed, and OpenSSL refuses more
    // threads than its pool was configured with
    uint32_t threads = 1;

    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_octet_string("pass", const_cast<char*>(passphrase.data()), passphrase.size()),
        OSSL_PARAM_construct_octet_string("salt", const_cast<unsigned char*>(salt), saltLen),
        OSSL_PARAM_construct_uint32("iter", &iterations),
        OSSL_PARAM_construct_uint32("lanes", &lanes),
        OSSL_PARAM_construct_uint32("threads", &threads),
        OSSL_PARAM_construct_uint32("memcost", &memoryKib),
        OSSL_PARAM_construct_end()
    };

    std::vector<unsigned char> key(Config::KEY_SIZE);
    if (EVP_KDF_derive(ctx.get(), key.data(), key.size(), params) != 1) {
        return Result<std::vector<unsigned char>>::Error("key derivation failed", ErrorCode::Io);
    }
    return Result<std::vector<unsigned char>>::Ok(key);
}

uint64_t StreamCipher::encryptedSize(uint64_t plainSize) {
    uint64_t chunks = (plainSize + Config::ENCRYPTION_CHUNK_SIZE - 1) / Config::ENCRYPTION_CHUNK_SIZE;
    return Config::HEADER_SIZE + plainSize + chunks * (Config::CHUNK_LENGTH_PREFIX + Config::TAG_SIZE);
}

bool StreamCipher::plaintextSize(uint64_t encryptedSize, uint64_t& plainSize) {
    if (encryptedSize < Config::HEADER_SIZE) return false;
    const uint64_t overhead = Config::CHUNK_LENGTH_PREFIX + Config::TAG_SIZE;
    const uint64_t fullChunk = Config::ENCRYPTION_CHUNK_SIZE + overhead;

    uint64_t body = encryptedSize - Config::HEADER_SIZE;
    uint64_t chunks = (body + fullChunk - 1) / fullChunk;
    if (body < chunks * overhead) return false;
    plainSize = body - chunks * overhead;
    return StreamCipher::encryptedSize(plainSize) == encryptedSize;
}

Result<void> StreamCipher::encrypt(ByteSource& plaintext, ByteSink& ciphertext) const {
    unsigned char header[Config::HEADER_SIZE];
    unsigned char* salt = header;
    unsigned char* baseNonce = header + Config::SALT_SIZE;
    if (RAND_bytes(salt, static_cast<int>(Config::SALT_SIZE)) != 1) {
        return Result<void>::Error("failed to generate salt", ErrorCode::Io);
    }
    if (RAND_bytes(baseNonce, static_cast<int>(Config::NONCE_SIZE)) != 1) {
        return Result<void>::Error("failed to generate base nonce", ErrorCode::Io);
    }

    Result<std::vector<unsigned char>> derived = deriveKey(passphrase_, salt, Config::SALT_SIZE);
    if (!derived.success) return Result<void>::From(derived);
    std::vector<unsigned char> key = std::move(derived.data);
    KeyGuard guard{key};

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) return Result<void>::Error("failed to create AEAD cipher", ErrorCode::Io);

    Result<void> written = ciphertext.write(reinterpret_cast<const char*>(header), sizeof(header));
    if (!written.success) return Result<void>::From(written, "failed to write encryption header");

    std::vector<unsigned char> buffer(Config::ENCRYPTION_CHUNK_SIZE);
    // length prefix and sealed chunk go out in one write
    std::vector<unsigned char> record(Config::CHUNK_LENGTH_PREFIX + Config::ENCRYPTION_CHUNK_SIZE + Config::TAG_SIZE);
    unsigned char nonce[Config::NONCE_SIZE];
    uint64_t counter = 0;

    for (;;) {
        Result<size_t> got = readFull(plaintext, reinterpret_cast<char*>(buffer.data()), buffer.size());
        if (!got.success) return Result<void>::From(got, "failed to read from source");
        size_t n = got.data;
        if (n == 0) break;

        chunkNonce(baseNonce, counter, nonce);
        unsigned char* sealed = record.data() + Config::CHUNK_LENGTH_PREFIX;
        if (!sealChunk(ctx.get(), key.data(), nonce, buffer.data(), n, sealed)) {
            return Result<void>::Error("failed to seal chunk", ErrorCode::Io);
        }
        size_t sealedLen = n + Config::TAG_SIZE;
        putUint32(record.data(), static_cast<uint32_t>(sealedLen));

        written = ciphertext.write(reinterpret_cast<const char*>(record.data()),
                                   Config::CHUNK_LENGTH_PREFIX + sealedLen);
        if (!written.success) return Result<void>::From(written, "failed to write encrypted chunk");
        ++counter;

        if (n < buffer.size()) break;   // short read means the source is exhausted
    }
    return Result<void>::Ok();
}

Result<void> StreamCipher::decrypt(ByteSource& ciphertext, ByteSink& plaintext) const {
    unsigned char header[Config::HEADER_SIZE];
    Result<size_t> got = readFull(ciphertext, reinterpret_cast<char*>(header), sizeof(header));
    if (!got.success) return Result<void>::From(got, "failed to read encryption header");
    if (got.data != sizeof(header)) {
        return Result<void>::Error("corrupt header: encrypted stream shorter than its header", ErrorCode::Integrity);
    }
    const unsigned char* salt = header;
    const unsigned char* baseNonce = header + Config::SALT_SIZE;

    Result<std::vector<unsigned char>> derived = deriveKey(passphrase_, salt, Config::SALT_SIZE);
    if (!derived.success) return Result<void>::From(derived);
    std::vector<unsigned char> key = std::move(derived.data);
    KeyGuard guard{key};

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) return Result<void>::Error("failed to create AEAD cipher", ErrorCode::Io);

    std::vector<unsigned char> sealed(Config::ENCRYPTION_CHUNK_SIZE + Config::TAG_SIZE);
    std::vector<unsigned char> opened(Config::ENCRYPTION_CHUNK_SIZE);
    unsigned char nonce[Config::NONCE_SIZE];
    uint64_t counter = 0;

    for (;;) {
        unsigned char prefix[Config::CHUNK_LENGTH_PREFIX];
        got = readFull(ciphertext, reinterpret_cast<char*>(prefix), sizeof(prefix));
        if (!got.success) return Result<void>::From(got, "failed to read chunk size");
        if (got.data == 0) break;   // clean end of stream
        if (got.data != sizeof(prefix)) {
            return Result<void>::Error("truncated ciphertext: partial chunk length", ErrorCode::Integrity);
        }

        uint32_t sealedLen = getUint32(prefix);
        if (sealedLen < Config::TAG_SIZE || sealedLen > sealed.size()) {
            return Result<void>::Error(DECRYPTION_FAILED, ErrorCode::Integrity);
        }

        got = readFull(ciphertext, reinterpret_cast<char*>(sealed.data()), sealedLen);
        if (!got.success) return Result<void>::From(got, "failed to read encrypted chunk");
        if (got.data != sealedLen) {
            return Result<void>::Error("truncated ciphertext: partial chunk", ErrorCode::Integrity);
        }

        chunkNonce(baseNonce, counter, nonce);
        if (!openChunk(ctx.get(), key.data(), nonce, sealed.data(), sealedLen, opened.data())) {
            return Result<void>::Error(DECRYPTION_FAILED, ErrorCode::Integrity);
        }

        Result<void> written = plaintext.write(reinterpret_cast<const char*>(opened.data()),
                                               sealedLen - Config::TAG_SIZE);
        if (!written.success) return Result<void>::From(written, "failed to write decrypted data");
        ++counter;
    }
    return Result<void>::Ok();
}
