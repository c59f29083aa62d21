#include <gtest/gtest.h>
#include "../common/config.hpp"
#include "../crypto/stream_cipher.hpp"
#include "test_helpers.hpp"

namespace {

class StreamCipherTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!StreamCipher::kdfAvailable()) {
            GTEST_SKIP() << "OpenSSL without Argon2id";
        }
    }

    static std::string encrypt(const std::string& passphrase, const std::string& plain) {
        BufferSource source(plain);
        BufferSink sink;
        Result<void> r = StreamCipher(passphrase).encrypt(source, sink);
        EXPECT_TRUE(r.success) << r.message;
        return sink.data();
    }

    static Result<std::string> decrypt(const std::string& passphrase, const std::string& cipher) {
        BufferSource source(cipher);
        BufferSink sink;
        Result<void> r = StreamCipher(passphrase).decrypt(source, sink);
        if (!r.success) return Result<std::string>::From(r);
        return Result<std::string>::Ok(sink.data());
    }
};

TEST_F(StreamCipherTest, RoundTripsAcrossChunkBoundaries) {
    const size_t chunk = Config::ENCRYPTION_CHUNK_SIZE;
    for (size_t size : {size_t(0), size_t(1), chunk - 1, chunk, chunk + 1, 3 * chunk + 17}) {
        std::string plain = patternBytes(size, static_cast<unsigned>(size));
        std::string cipher = encrypt("correct horse", plain);
        EXPECT_EQ(cipher.size(), StreamCipher::encryptedSize(size)) << "size " << size;

        Result<std::string> back = decrypt("correct horse", cipher);
        ASSERT_TRUE(back.success) << back.message;
        EXPECT_EQ(back.data, plain) << "size " << size;
    }
}

TEST_F(StreamCipherTest, EmptyInputIsJustTheHeader) {
    std::string cipher = encrypt("pw", "");
    EXPECT_EQ(cipher.size(), Config::HEADER_SIZE);
}

TEST_F(StreamCipherTest, TwoEncryptionsDiffer) {
    std::string plain = "same plaintext";
    EXPECT_NE(encrypt("pw", plain), encrypt("pw", plain));
}

TEST_F(StreamCipherTest, WrongPassphraseFails) {
    std::string cipher = encrypt("alpha", "secret contents");
    Result<std::string> back = decrypt("beta", cipher);
    ASSERT_FALSE(back.success);
    EXPECT_EQ(back.code, ErrorCode::Integrity);
    EXPECT_NE(back.message.find("decryption failed"), std::string::npos);
}

TEST_F(StreamCipherTest, AnyFlippedByteIsDetected) {
    std::string plain = patternBytes(Config::ENCRYPTION_CHUNK_SIZE + 100);
    std::string cipher = encrypt("pw", plain);

    // salt, nonce prefix, first length prefix, first chunk body, tag, second chunk. The
    // low 8 nonce bytes are replaced by the counter and carry nothing.
    const size_t second = Config::HEADER_SIZE + Config::CHUNK_LENGTH_PREFIX + Config::ENCRYPTION_CHUNK_SIZE +
                          Config::TAG_SIZE;
    for (size_t offset : {size_t(0), size_t(33), size_t(45), size_t(1000), second - 1, second + 10,
                          cipher.size() - 1}) {
        std::string tampered = cipher;
        tampered[offset] = static_cast<char>(tampered[offset] ^ 0x01);
        Result<std::string> back = decrypt("pw", tampered);
        EXPECT_FALSE(back.success) << "offset " << offset;
        EXPECT_EQ(back.code, ErrorCode::Integrity) << "offset " << offset;
    }
}

TEST_F(StreamCipherTest, ShortHeaderIsCorrupt) {
    Result<std::string> back = decrypt("pw", std::string(20, 'x'));
    ASSERT_FALSE(back.success);
    EXPECT_EQ(back.code, ErrorCode::Integrity);
    EXPECT_NE(back.message.find("corrupt header"), std::string::npos);
}

TEST_F(StreamCipherTest, TruncatedChunkIsReported) {
    std::string cipher = encrypt("pw", patternBytes(5000));
    Result<std::string> back = decrypt("pw", cipher.substr(0, cipher.size() - 10));
    ASSERT_FALSE(back.success);
    EXPECT_EQ(back.code, ErrorCode::Integrity);
    EXPECT_NE(back.message.find("truncated"), std::string::npos);

    back = decrypt("pw", cipher.substr(0, Config::HEADER_SIZE + 2));
    ASSERT_FALSE(back.success);
    EXPECT_NE(back.message.find("truncated"), std::string::npos);
}

TEST_F(StreamCipherTest, DroppedTrailingChunkGoesUnnoticed) {
    // no terminator record: a cut exactly at a chunk boundary decrypts the prefix
    std::string plain = patternBytes(Config::ENCRYPTION_CHUNK_SIZE + 10);
    std::string cipher = encrypt("pw", plain);
    size_t firstRecordEnd = Config::HEADER_SIZE + Config::CHUNK_LENGTH_PREFIX + Config::ENCRYPTION_CHUNK_SIZE +
                            Config::TAG_SIZE;
    Result<std::string> back = decrypt("pw", cipher.substr(0, firstRecordEnd));
    ASSERT_TRUE(back.success) << back.message;
    EXPECT_EQ(back.data, plain.substr(0, Config::ENCRYPTION_CHUNK_SIZE));
}

}

TEST(StreamCipherSizeTest, EncryptedSizeAddsHeaderAndPerChunkOverhead) {
    const uint64_t chunk = Config::ENCRYPTION_CHUNK_SIZE;
    EXPECT_EQ(StreamCipher::encryptedSize(0), 44u);
    EXPECT_EQ(StreamCipher::encryptedSize(1), 44u + 1 + 20);
    EXPECT_EQ(StreamCipher::encryptedSize(chunk), 44u + chunk + 20);
    EXPECT_EQ(StreamCipher::encryptedSize(chunk + 1), 44u + chunk + 1 + 40);
}

TEST(StreamCipherSizeTest, PlaintextSizeInvertsEncryptedSize) {
    const uint64_t chunk = Config::ENCRYPTION_CHUNK_SIZE;
    for (uint64_t plain : {uint64_t(0), uint64_t(1), uint64_t(999), chunk - 1, chunk, chunk + 1, 5 * chunk}) {
        uint64_t back = 0;
        ASSERT_TRUE(StreamCipher::plaintextSize(StreamCipher::encryptedSize(plain), back)) << plain;
        EXPECT_EQ(back, plain);
    }
    uint64_t ignored = 0;
    EXPECT_FALSE(StreamCipher::plaintextSize(10, ignored));
    EXPECT_FALSE(StreamCipher::plaintextSize(44 + 5, ignored));
}
