#include "tessera/crypto/provider_crypto_provider.hpp"
#include "tessera/crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/core_names.h>
#include <openssl/params.h>
#include <boost/log/trivial.hpp>

namespace tessera::crypto {

namespace {

// Owning handles for fetched algorithms and their contexts
struct KdfDeleter { void operator()(EVP_KDF* p) const { EVP_KDF_free(p); } };
struct KdfCtxDeleter { void operator()(EVP_KDF_CTX* p) const { EVP_KDF_CTX_free(p); } };
struct MacDeleter { void operator()(EVP_MAC* p) const { EVP_MAC_free(p); } };
struct MacCtxDeleter { void operator()(EVP_MAC_CTX* p) const { EVP_MAC_CTX_free(p); } };
struct CipherDeleter { void operator()(EVP_CIPHER* p) const { EVP_CIPHER_free(p); } };
struct CipherCtxDeleter { void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); } };

using KdfPtr = std::unique_ptr<EVP_KDF, KdfDeleter>;
using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter>;
using MacPtr = std::unique_ptr<EVP_MAC, MacDeleter>;
using MacCtxPtr = std::unique_ptr<EVP_MAC_CTX, MacCtxDeleter>;
using CipherPtr = std::unique_ptr<EVP_CIPHER, CipherDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

char DIGEST_NAME[] = "SHA256";

} // namespace

ProviderCryptoProvider::ProviderCryptoProvider(unsigned iterations) : iterations_(iterations) {
  if (iterations_ == 0) {
    throw InitializationError("PBKDF2 iteration count must be positive");
  }
}

//==============================================
// KEY DERIVATION
//==============================================

std::vector<uint8_t> ProviderCryptoProvider::kdf(const std::string& passphrase, const std::string& salt,
                                                 std::size_t length) const {
  KdfPtr algorithm(EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_PBKDF2, nullptr));
  if (!algorithm) {
    throw InitializationError("Provider: PBKDF2 is not available");
  }
  KdfCtxPtr ctx(EVP_KDF_CTX_new(algorithm.get()));
  if (!ctx) {
    throw InitializationError("Provider: Failed to create KDF context");
  }

  // Empty passwords are legal, the octet string only needs a valid pointer
  std::string password = passphrase;
  std::string salt_copy = salt;
  unsigned int iterations = iterations_;
  int pkcs5_compat = 1;  // disable the SP 800-132 minimum length checks

  OSSL_PARAM params[] = {
    OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, password.data(), password.size()),
    OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, salt_copy.data(), salt_copy.size()),
    OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iterations),
    OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, DIGEST_NAME, 0),
    OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5_compat),
    OSSL_PARAM_construct_end()
  };

  std::vector<uint8_t> out(length);
  if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) != 1) {
    throw InitializationError("Provider: PBKDF2 derivation failed");
  }
  return out;
}

SessionKey ProviderCryptoProvider::derive_key(const std::string& passphrase, const std::string& salt) const {
  auto material = kdf(passphrase, salt, KEY_SIZE * 2);
  SessionKey key;
  key.cipher_key.assign(material.begin(), material.begin() + KEY_SIZE);
  key.mac_key.assign(material.begin() + KEY_SIZE, material.end());
  return key;
}

std::vector<uint8_t> ProviderCryptoProvider::fingerprint(const std::string& passphrase) const {
  return kdf(passphrase, FINGERPRINT_SALT, FINGERPRINT_SIZE);
}

std::vector<uint8_t> ProviderCryptoProvider::mac(const std::vector<uint8_t>& key,
                                                 const std::vector<uint8_t>& first,
                                                 const std::vector<uint8_t>& second) const {
  MacPtr algorithm(EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr));
  if (!algorithm) {
    throw EncryptionError("Provider: HMAC is not available");
  }
  MacCtxPtr ctx(EVP_MAC_CTX_new(algorithm.get()));
  if (!ctx) {
    throw EncryptionError("Provider: Failed to create MAC context");
  }

  OSSL_PARAM params[] = {
    OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, DIGEST_NAME, 0),
    OSSL_PARAM_construct_end()
  };

  if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1 ||
      EVP_MAC_update(ctx.get(), first.data(), first.size()) != 1 ||
      EVP_MAC_update(ctx.get(), second.data(), second.size()) != 1) {
    throw EncryptionError("Provider: HMAC computation failed");
  }

  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  std::size_t out_len = 0;
  if (EVP_MAC_final(ctx.get(), out.data(), &out_len, out.size()) != 1) {
    throw EncryptionError("Provider: HMAC finalization failed");
  }
  out.resize(out_len);
  return out;
}

std::vector<uint8_t> ProviderCryptoProvider::derive_iv(const SessionKey& key,
                                                       const std::vector<uint8_t>& plaintext) const {
  if (key.mac_key.empty()) {
    throw InitializationError("Missing MAC key");
  }
  auto tag = mac(key.mac_key, {}, plaintext);
  return std::vector<uint8_t>(tag.begin(), tag.begin() + IV_SIZE);
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::vector<uint8_t> ProviderCryptoProvider::cipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv,
                                                    const std::vector<uint8_t>& input, bool encrypting) const {
  CipherPtr algorithm(EVP_CIPHER_fetch(nullptr, "AES-256-CBC", nullptr));
  if (!algorithm) {
    throw InitializationError("Provider: AES-256-CBC is not available");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw InitializationError("Provider: Failed to create cipher context");
  }

  if (EVP_CipherInit_ex2(ctx.get(), algorithm.get(), key.data(), iv.data(),
                         encrypting ? 1 : 0, nullptr) != 1) {
    if (encrypting) {
      throw EncryptionError("Provider: Failed to initialize encryption");
    }
    throw DecryptionError("Provider: Failed to initialize decryption");
  }

  std::vector<uint8_t> out(input.size() + EVP_MAX_BLOCK_LENGTH);
  int update_len = 0;
  if (EVP_CipherUpdate(ctx.get(), out.data(), &update_len, input.data(), static_cast<int>(input.size())) != 1) {
    if (encrypting) {
      throw EncryptionError("Provider: Failed to process data");
    }
    throw DecryptionError("Provider: Failed to process data");
  }

  int final_len = 0;
  if (EVP_CipherFinal_ex(ctx.get(), out.data() + update_len, &final_len) != 1) {
    if (encrypting) {
      throw EncryptionError("Provider: Failed to finalize encryption");
    }
    throw DecryptionError("Provider: Failed to finalize decryption");
  }

  out.resize(static_cast<std::size_t>(update_len + final_len));
  return out;
}

std::vector<uint8_t> ProviderCryptoProvider::encrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                                                     const std::vector<uint8_t>& plaintext) const {
  validate(key, iv);

  auto ciphertext = cipher(key.cipher_key, iv, plaintext, true);
  auto tag = mac(key.mac_key, iv, ciphertext);
  ciphertext.insert(ciphertext.end(), tag.begin(), tag.end());

  BOOST_LOG_TRIVIAL(debug) << "Provider: Encrypted " << plaintext.size() << " bytes into "
                           << ciphertext.size() << " bytes";
  return ciphertext;
}

std::vector<uint8_t> ProviderCryptoProvider::decrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                                                     const std::vector<uint8_t>& ciphertext) const {
  validate(key, iv);

  constexpr std::size_t block_size = 16;
  if (ciphertext.size() < TAG_SIZE + block_size || (ciphertext.size() - TAG_SIZE) % block_size != 0) {
    throw IntegrityError("ciphertext has invalid length " + std::to_string(ciphertext.size()));
  }

  const std::vector<uint8_t> body(ciphertext.begin(), ciphertext.end() - TAG_SIZE);
  const std::vector<uint8_t> tag(ciphertext.end() - TAG_SIZE, ciphertext.end());
  if (!constant_time_equals(mac(key.mac_key, iv, body), tag)) {
    BOOST_LOG_TRIVIAL(warning) << "Provider: Authentication tag mismatch";
    throw IntegrityError("authentication tag mismatch");
  }

  try {
    return cipher(key.cipher_key, iv, body, false);
  } catch (const DecryptionError& e) {
    throw IntegrityError(e.what());
  }
}

} // namespace tessera::crypto
