#pragma once
#include "../common/byte_stream.hpp"
#include "../common/result.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Chunked ChaCha20-Poly1305 container keyed by an Argon2id passphrase hash.
//
//   [0:32]   salt
//   [32:44]  base nonce
//   repeated until end of stream:
//     [0:4]    big-endian length N of the sealed chunk
//     [4:4+N]  sealed chunk (at most 1 MiB of plaintext plus a 16-byte tag)
//
// Chunk i is sealed under the base nonce with its low 8 bytes replaced by
// big-endian i. Memory use is one chunk regardless of object size.
class StreamCipher {
public:
    explicit StreamCipher(std::string passphrase);

    Result<void> encrypt(ByteSource& plaintext, ByteSink& ciphertext) const;

    // A wrong passphrase and tampered data both fail as "decryption failed";
    // there is no way to tell them apart.
    Result<void> decrypt(ByteSource& ciphertext, ByteSink& plaintext) const;

    static uint64_t encryptedSize(uint64_t plainSize);

    // inverse of encryptedSize(); false when no plaintext length produces encryptedSize
    static bool plaintextSize(uint64_t encryptedSize, uint64_t& plainSize);

    // whether the linked OpenSSL offers Argon2id (3.2 and later)
    static bool kdfAvailable();

    static Result<std::vector<unsigned char>> deriveKey(const std::string& passphrase,
                                                        const unsigned char* salt, size_t saltLen);

private:
    std::string passphrase_;
};
