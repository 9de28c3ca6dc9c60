#include "tessera/crypto/digest.hpp"
#include "tessera/crypto/crypto_error.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <iomanip>
#include <sstream>

namespace tessera::crypto {

std::vector<uint8_t> sha256(const uint8_t* data, std::size_t size) {
  std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;

  if (EVP_Digest(data, size, digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
    throw CryptoError("Digest: Failed to compute SHA-256");
  }
  digest.resize(digest_len);
  return digest;
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
  return sha256(data.data(), data.size());
}

std::string to_hex(const std::vector<uint8_t>& data) {
  std::stringstream ss;
  for (uint8_t byte : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::vector<uint8_t> from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw CryptoError("Digest: Hex string has odd length");
  }

  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw CryptoError("Digest: Invalid hex character");
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::vector<uint8_t> random_bytes(std::size_t count) {
  std::vector<uint8_t> out(count);
  if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    throw CryptoError("Digest: Failed to generate random bytes");
  }
  return out;
}

bool constant_time_equals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  return a.empty() || CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace tessera::crypto
