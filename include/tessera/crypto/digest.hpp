#ifndef TESSERA_CRYPTO_DIGEST_HPP
#define TESSERA_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace tessera::crypto {

static constexpr size_t SHA256_SIZE = 32;

// SHA-256 of a byte buffer (EVP_Digest)
std::vector<uint8_t> sha256(const uint8_t* data, std::size_t size);
std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

// Lowercase hex encoding and decoding, decode throws CryptoError on malformed input
std::string to_hex(const std::vector<uint8_t>& data);
std::vector<uint8_t> from_hex(const std::string& hex);

// Cryptographically secure random bytes (RAND_bytes)
std::vector<uint8_t> random_bytes(std::size_t count);

// Length-checked constant time comparison
bool constant_time_equals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

} // namespace tessera::crypto

#endif // TESSERA_CRYPTO_DIGEST_HPP
