#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "tessera/crypto/crypto_provider.hpp"
#include "tessera/crypto/digest.hpp"
#include "tessera/crypto/provider_crypto_provider.hpp"
#include "tessera/crypto/stream_crypto_provider.hpp"
#include "test_utils.hpp"

using namespace tessera::crypto;
using tessera::test::bytes_of;

namespace {

// Low iteration count keeps the suite fast, the format does not depend on it
constexpr unsigned TEST_ITERATIONS = 1000;

} // namespace

class CryptoProviderTest : public ::testing::TestWithParam<CryptoBackend> {
protected:
    std::unique_ptr<CryptoProvider> provider;
    SessionKey key;

    void SetUp() override {
        tessera::test::quiet_logging();
        provider = make_crypto_provider(GetParam(), TEST_ITERATIONS);
        key = provider->derive_key("correct horse", "session-1");
    }

    std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext) {
        return provider->encrypt(key, provider->derive_iv(key, plaintext), plaintext);
    }
};

// RFC 7914 section 11, PBKDF2-HMAC-SHA256 with one iteration
TEST_P(CryptoProviderTest, DerivesKnownPbkdf2Output) {
    auto single = make_crypto_provider(GetParam(), 1);
    auto derived = single->derive_key("passwd", "salt");
    EXPECT_EQ(to_hex(derived.cipher_key), "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc");
    EXPECT_EQ(to_hex(derived.mac_key), "49ca9cccf179b645991664b39d77ef317c71b845b1e30bd509112041d3a19783");
}

// RFC 4231 test case 2, truncated to the IV length
TEST_P(CryptoProviderTest, DerivesIvFromHmac) {
    SessionKey jefe;
    jefe.cipher_key.assign(CryptoProvider::KEY_SIZE, 0x01);
    jefe.mac_key = bytes_of("Jefe");
    auto iv = provider->derive_iv(jefe, bytes_of("what do ya want for nothing?"));
    EXPECT_EQ(to_hex(iv), "5bdcc146bf60754e6a042426089575c7");
}

TEST_P(CryptoProviderTest, KeysDependOnPassphraseAndSalt) {
    EXPECT_EQ(key.cipher_key.size(), CryptoProvider::KEY_SIZE);
    EXPECT_EQ(key.mac_key.size(), CryptoProvider::KEY_SIZE);
    EXPECT_NE(key.cipher_key, key.mac_key);

    auto same = provider->derive_key("correct horse", "session-1");
    EXPECT_EQ(same.cipher_key, key.cipher_key);

    EXPECT_NE(provider->derive_key("correct horse", "session-2").cipher_key, key.cipher_key);
    EXPECT_NE(provider->derive_key("battery staple", "session-1").cipher_key, key.cipher_key);
}

TEST_P(CryptoProviderTest, FingerprintIsStableAndDistinctFromKeys) {
    auto fp = provider->fingerprint("correct horse");
    EXPECT_EQ(fp.size(), CryptoProvider::FINGERPRINT_SIZE);
    EXPECT_EQ(fp, provider->fingerprint("correct horse"));
    EXPECT_NE(fp, provider->fingerprint("correct horsf"));
    EXPECT_NE(fp, key.cipher_key);
    EXPECT_NE(fp, key.mac_key);
}

TEST_P(CryptoProviderTest, EncryptDecryptRoundTrip) {
    const auto plaintext = tessera::test::pattern_bytes(5000, 3);
    const auto iv = provider->derive_iv(key, plaintext);
    const auto ciphertext = provider->encrypt(key, iv, plaintext);

    EXPECT_EQ(ciphertext.size(), (plaintext.size() / 16 + 1) * 16 + CryptoProvider::TAG_SIZE);
    EXPECT_EQ(provider->decrypt(key, iv, ciphertext), plaintext);
}

TEST_P(CryptoProviderTest, EmptyPlaintextStillProducesCiphertext) {
    const std::vector<uint8_t> empty;
    const auto iv = provider->derive_iv(key, empty);
    const auto ciphertext = provider->encrypt(key, iv, empty);
    EXPECT_EQ(ciphertext.size(), 16u + CryptoProvider::TAG_SIZE);
    EXPECT_TRUE(provider->decrypt(key, iv, ciphertext).empty());
}

TEST_P(CryptoProviderTest, EncryptionIsDeterministic) {
    const auto plaintext = bytes_of("same bytes, same ciphertext");
    EXPECT_EQ(seal(plaintext), seal(plaintext));
    EXPECT_NE(seal(plaintext), seal(bytes_of("different bytes")));
}

TEST_P(CryptoProviderTest, TamperedCiphertextIsRejected) {
    const auto plaintext = bytes_of("attack at dawn");
    const auto iv = provider->derive_iv(key, plaintext);
    auto ciphertext = provider->encrypt(key, iv, plaintext);

    auto flipped = ciphertext;
    flipped[3] ^= 0x01;
    EXPECT_THROW(provider->decrypt(key, iv, flipped), IntegrityError);

    auto bad_tag = ciphertext;
    bad_tag.back() ^= 0x80;
    EXPECT_THROW(provider->decrypt(key, iv, bad_tag), IntegrityError);

    auto other_iv = iv;
    other_iv[0] ^= 0x01;
    EXPECT_THROW(provider->decrypt(key, other_iv, ciphertext), IntegrityError);

    auto truncated = std::vector<uint8_t>(ciphertext.begin(), ciphertext.end() - 1);
    EXPECT_THROW(provider->decrypt(key, iv, truncated), IntegrityError);
    EXPECT_THROW(provider->decrypt(key, iv, std::vector<uint8_t>(10, 0)), IntegrityError);
}

TEST_P(CryptoProviderTest, WrongKeyIsRejected) {
    const auto plaintext = bytes_of("for members only");
    const auto iv = provider->derive_iv(key, plaintext);
    const auto ciphertext = provider->encrypt(key, iv, plaintext);

    auto intruder = provider->derive_key("wrong passphrase", "session-1");
    EXPECT_THROW(provider->decrypt(intruder, iv, ciphertext), IntegrityError);
}

TEST_P(CryptoProviderTest, ValidatesArguments) {
    SessionKey short_key{std::vector<uint8_t>(16, 1), key.mac_key};
    EXPECT_THROW(provider->encrypt(short_key, std::vector<uint8_t>(16, 0), bytes_of("x")), InitializationError);
    EXPECT_THROW(provider->encrypt(key, std::vector<uint8_t>(12, 0), bytes_of("x")), InitializationError);
}

INSTANTIATE_TEST_SUITE_P(Backends, CryptoProviderTest,
                         ::testing::Values(CryptoBackend::Stream, CryptoBackend::Provider),
                         [](const ::testing::TestParamInfo<CryptoBackend>& info) {
                             return to_string(info.param);
                         });

TEST(CryptoBackendTest, ParsesNames) {
    EXPECT_EQ(parse_crypto_backend("stream"), CryptoBackend::Stream);
    EXPECT_EQ(parse_crypto_backend("provider"), CryptoBackend::Provider);
    EXPECT_THROW(parse_crypto_backend("rot13"), InitializationError);
    EXPECT_EQ(make_crypto_provider(CryptoBackend::Stream)->name(), "stream");
    EXPECT_EQ(make_crypto_provider(CryptoBackend::Provider)->name(), "provider");
}

// Content sealed by one backend must open with the other
TEST(CrossBackendTest, OutputsAreByteIdentical) {
    tessera::test::quiet_logging();
    StreamCryptoProvider stream(TEST_ITERATIONS);
    ProviderCryptoProvider modern(TEST_ITERATIONS);

    const auto stream_key = stream.derive_key("shared secret", "room-42");
    const auto modern_key = modern.derive_key("shared secret", "room-42");
    ASSERT_EQ(stream_key.cipher_key, modern_key.cipher_key);
    ASSERT_EQ(stream_key.mac_key, modern_key.mac_key);
    EXPECT_EQ(stream.fingerprint("shared secret"), modern.fingerprint("shared secret"));

    for (std::size_t size : {0u, 1u, 15u, 16u, 17u, 4096u, 70000u}) {
        const auto plaintext = tessera::test::pattern_bytes(size, static_cast<uint8_t>(size));
        const auto iv = stream.derive_iv(stream_key, plaintext);
        ASSERT_EQ(iv, modern.derive_iv(modern_key, plaintext));

        const auto from_stream = stream.encrypt(stream_key, iv, plaintext);
        const auto from_modern = modern.encrypt(modern_key, iv, plaintext);
        EXPECT_EQ(from_stream, from_modern) << "size " << size;

        EXPECT_EQ(modern.decrypt(modern_key, iv, from_stream), plaintext);
        EXPECT_EQ(stream.decrypt(stream_key, iv, from_modern), plaintext);
    }
}
