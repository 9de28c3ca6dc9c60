#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include <cstring>
#include "tessera/crypto/crypto_stream.hpp"
#include "tessera/crypto/digest.hpp"
#include "test_utils.hpp"

using namespace tessera::crypto;

class CryptoStreamTest : public ::testing::Test {
protected:
    CryptoStream crypto;
    std::vector<uint8_t> key;
    std::vector<uint8_t> iv;

    void SetUp() override {
        tessera::test::quiet_logging();
        key.resize(CryptoStream::KEY_SIZE, 0x42);
        iv.resize(CryptoStream::IV_SIZE, 0x24);
        crypto.initialize(key, iv);
    }
};

// NIST SP 800-38A F.2.5, first block of CBC-AES256
TEST_F(CryptoStreamTest, MatchesKnownAnswerVector) {
    CryptoStream nist;
    nist.initialize(from_hex("603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4"),
                    from_hex("000102030405060708090a0b0c0d0e0f"));

    const auto block = from_hex("6bc1bee22e409f96e93d7e117393172a");
    std::stringstream input(std::string(block.begin(), block.end()));
    std::stringstream encrypted;
    EXPECT_EQ(nist.encrypt(input, encrypted), 32u);  // one data block plus a full padding block

    const std::string out = encrypted.str();
    ASSERT_EQ(out.size(), 32u);
    EXPECT_EQ(to_hex(std::vector<uint8_t>(out.begin(), out.begin() + 16)), "f58c4c04d6b5f0d15ba4f8b25b5d5a7c");
}

TEST_F(CryptoStreamTest, BasicStreamOperation) {
    const std::string plaintext = "Hello, World! This is a test of stream encryption.";
    std::stringstream input(plaintext);
    std::stringstream encrypted;
    std::stringstream decrypted;

    crypto.encrypt(input, encrypted);
    ASSERT_NE(encrypted.str(), plaintext);
    EXPECT_EQ(encrypted.str().size(), CryptoStream::padded_size(plaintext.size()));

    crypto.decrypt(encrypted, decrypted);
    ASSERT_EQ(decrypted.str(), plaintext);
}

TEST_F(CryptoStreamTest, UninitializedError) {
    CryptoStream uninitialized;
    std::stringstream input("test"), output;
    EXPECT_THROW(uninitialized.encrypt(input, output), InitializationError);
}

TEST_F(CryptoStreamTest, RejectsBadKeyAndIvSizes) {
    CryptoStream other;
    EXPECT_THROW(other.initialize(std::vector<uint8_t>(16, 1), iv), InitializationError);
    EXPECT_THROW(other.initialize(key, std::vector<uint8_t>(8, 1)), InitializationError);
}

TEST_F(CryptoStreamTest, EmptyStreamProducesOnePaddingBlock) {
    std::stringstream empty, output, decrypted;
    crypto.encrypt(empty, output);
    EXPECT_EQ(output.str().size(), CryptoStream::BLOCK_SIZE);

    crypto.decrypt(output, decrypted);
    EXPECT_TRUE(decrypted.str().empty());
}

TEST_F(CryptoStreamTest, LargePayloadAcrossBuffers) {
    const auto data = tessera::test::pattern_bytes(100000, 7);
    std::stringstream input(std::string(data.begin(), data.end()));
    std::stringstream encrypted, decrypted;

    crypto.encrypt(input, encrypted);
    crypto.decrypt(encrypted, decrypted);

    const std::string out = decrypted.str();
    ASSERT_EQ(out.size(), data.size());
    EXPECT_EQ(std::memcmp(out.data(), data.data(), data.size()), 0);
}

TEST_F(CryptoStreamTest, SameInputsGiveSameCiphertext) {
    std::stringstream a("repeatable"), b("repeatable");
    std::stringstream out_a, out_b;
    crypto.encrypt(a, out_a);
    crypto.encrypt(b, out_b);
    EXPECT_EQ(out_a.str(), out_b.str());
}

TEST_F(CryptoStreamTest, WrongKeyFailsPaddingCheck) {
    std::stringstream input("secret message that spans more than one block"), encrypted;
    crypto.encrypt(input, encrypted);

    // A different key almost always yields invalid padding on the last block
    CryptoStream other;
    other.initialize(std::vector<uint8_t>(CryptoStream::KEY_SIZE, 0x43), iv);
    std::stringstream decrypted;
    try {
        other.decrypt(encrypted, decrypted);
        EXPECT_NE(decrypted.str(), "secret message that spans more than one block");
    } catch (const DecryptionError&) {
        SUCCEED();
    }
}

TEST(DigestTest, Sha256KnownAnswer) {
    EXPECT_EQ(to_hex(sha256(tessera::test::bytes_of("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, HexRoundTripAndErrors) {
    const std::vector<uint8_t> data{0x00, 0x7f, 0xff, 0x10};
    EXPECT_EQ(to_hex(data), "007fff10");
    EXPECT_EQ(from_hex("007FFF10"), data);
    EXPECT_THROW(from_hex("abc"), CryptoError);
    EXPECT_THROW(from_hex("zz"), CryptoError);
}

TEST(DigestTest, ConstantTimeEquals) {
    EXPECT_TRUE(constant_time_equals({1, 2, 3}, {1, 2, 3}));
    EXPECT_FALSE(constant_time_equals({1, 2, 3}, {1, 2, 4}));
    EXPECT_FALSE(constant_time_equals({1, 2, 3}, {1, 2}));
}

TEST(DigestTest, RandomBytesHaveRequestedLength) {
    auto a = random_bytes(32);
    auto b = random_bytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
}
