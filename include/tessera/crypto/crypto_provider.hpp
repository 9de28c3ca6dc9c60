#ifndef TESSERA_CRYPTO_PROVIDER_HPP
#define TESSERA_CRYPTO_PROVIDER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace tessera::crypto {

// Session key material derived from the passphrase.
// cipher_key feeds AES-256-CBC, mac_key feeds HMAC-SHA256.
struct SessionKey {
  std::vector<uint8_t> cipher_key;
  std::vector<uint8_t> mac_key;
};

/**
 * Key derivation, fingerprinting and deterministic authenticated encryption.
 *
 * Ciphertext layout: AES-256-CBC(PKCS#7) || HMAC-SHA256(mac_key, iv || cbc).
 * Every implementation must produce byte-identical output for identical input,
 * so content encrypted by one client can be decrypted by any other.
 */
class CryptoProvider {
public:
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t IV_SIZE = 16;
  static constexpr size_t TAG_SIZE = 32;
  static constexpr size_t FINGERPRINT_SIZE = 32;
  static constexpr unsigned DEFAULT_ITERATIONS = 100000;

  // Salt mixed into the fingerprint so it never equals a derived key
  static constexpr const char* FINGERPRINT_SALT = "tessera-fingerprint-v1";

  virtual ~CryptoProvider() = default;

  // PBKDF2-HMAC-SHA256, 64 bytes split into cipher and mac keys
  virtual SessionKey derive_key(const std::string& passphrase, const std::string& salt) const = 0;
  // One-way membership token
  virtual std::vector<uint8_t> fingerprint(const std::string& passphrase) const = 0;
  // Content-derived IV: first 16 bytes of HMAC-SHA256(mac_key, plaintext)
  virtual std::vector<uint8_t> derive_iv(const SessionKey& key,
                                         const std::vector<uint8_t>& plaintext) const = 0;

  virtual std::vector<uint8_t> encrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                                       const std::vector<uint8_t>& plaintext) const = 0;
  // Throws IntegrityError when authentication or padding fails
  virtual std::vector<uint8_t> decrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                                       const std::vector<uint8_t>& ciphertext) const = 0;

  virtual std::string name() const = 0;

protected:
  // Shared argument checks, throws InitializationError
  static void validate(const SessionKey& key, const std::vector<uint8_t>& iv);
};

enum class CryptoBackend {
  Stream,
  Provider
};

// Throws InitializationError for unknown names ("stream" or "provider")
CryptoBackend parse_crypto_backend(const std::string& name);
std::string to_string(CryptoBackend backend);

std::unique_ptr<CryptoProvider> make_crypto_provider(CryptoBackend backend,
    unsigned iterations = CryptoProvider::DEFAULT_ITERATIONS);

} // namespace tessera::crypto

#endif // TESSERA_CRYPTO_PROVIDER_HPP
