#include "tessera/crypto/stream_crypto_provider.hpp"
#include "tessera/crypto/crypto_stream.hpp"
#include "tessera/crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace tessera::crypto {

StreamCryptoProvider::StreamCryptoProvider(unsigned iterations) : iterations_(iterations) {
  if (iterations_ == 0) {
    throw InitializationError("PBKDF2 iteration count must be positive");
  }
}

//==============================================
// KEY DERIVATION
//==============================================

std::vector<uint8_t> StreamCryptoProvider::pbkdf2(const std::string& passphrase, const std::string& salt,
                                                  std::size_t length) const {
  std::vector<uint8_t> out(length);
  if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                        reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                        static_cast<int>(iterations_), EVP_sha256(),
                        static_cast<int>(length), out.data()) != 1) {
    throw InitializationError("Stream provider: PBKDF2 derivation failed");
  }
  return out;
}

SessionKey StreamCryptoProvider::derive_key(const std::string& passphrase, const std::string& salt) const {
  auto material = pbkdf2(passphrase, salt, KEY_SIZE * 2);
  SessionKey key;
  key.cipher_key.assign(material.begin(), material.begin() + KEY_SIZE);
  key.mac_key.assign(material.begin() + KEY_SIZE, material.end());
  return key;
}

std::vector<uint8_t> StreamCryptoProvider::fingerprint(const std::string& passphrase) const {
  return pbkdf2(passphrase, FINGERPRINT_SALT, FINGERPRINT_SIZE);
}

std::vector<uint8_t> StreamCryptoProvider::hmac(const std::vector<uint8_t>& key,
                                                const std::vector<uint8_t>& first,
                                                const std::vector<uint8_t>& second) const {
  std::vector<uint8_t> message;
  message.reserve(first.size() + second.size());
  message.insert(message.end(), first.begin(), first.end());
  message.insert(message.end(), second.begin(), second.end());

  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int out_len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            message.data(), message.size(), out.data(), &out_len)) {
    throw EncryptionError("Stream provider: HMAC computation failed");
  }
  out.resize(out_len);
  return out;
}

std::vector<uint8_t> StreamCryptoProvider::derive_iv(const SessionKey& key,
                                                     const std::vector<uint8_t>& plaintext) const {
  if (key.mac_key.empty()) {
    throw InitializationError("Missing MAC key");
  }
  auto tag = hmac(key.mac_key, {}, plaintext);
  return std::vector<uint8_t>(tag.begin(), tag.begin() + IV_SIZE);
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::vector<uint8_t> StreamCryptoProvider::encrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                                                   const std::vector<uint8_t>& plaintext) const {
  validate(key, iv);

  CryptoStream stream;
  stream.initialize(key.cipher_key, iv);

  std::istringstream input(std::string(plaintext.begin(), plaintext.end()));
  std::ostringstream output;
  stream.encrypt(input, output);

  const std::string cbc = output.str();
  std::vector<uint8_t> ciphertext(cbc.begin(), cbc.end());
  auto tag = hmac(key.mac_key, iv, ciphertext);
  ciphertext.insert(ciphertext.end(), tag.begin(), tag.end());

  BOOST_LOG_TRIVIAL(debug) << "Stream provider: Encrypted " << plaintext.size() << " bytes into "
                           << ciphertext.size() << " bytes";
  return ciphertext;
}

std::vector<uint8_t> StreamCryptoProvider::decrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                                                   const std::vector<uint8_t>& ciphertext) const {
  validate(key, iv);

  if (ciphertext.size() < TAG_SIZE + CryptoStream::BLOCK_SIZE ||
      (ciphertext.size() - TAG_SIZE) % CryptoStream::BLOCK_SIZE != 0) {
    throw IntegrityError("ciphertext has invalid length " + std::to_string(ciphertext.size()));
  }

  const std::vector<uint8_t> body(ciphertext.begin(), ciphertext.end() - TAG_SIZE);
  const std::vector<uint8_t> tag(ciphertext.end() - TAG_SIZE, ciphertext.end());
  if (!constant_time_equals(hmac(key.mac_key, iv, body), tag)) {
    BOOST_LOG_TRIVIAL(warning) << "Stream provider: Authentication tag mismatch";
    throw IntegrityError("authentication tag mismatch");
  }

  CryptoStream stream;
  stream.initialize(key.cipher_key, iv);

  std::istringstream input(std::string(body.begin(), body.end()));
  std::ostringstream output;
  try {
    stream.decrypt(input, output);
  } catch (const DecryptionError& e) {
    throw IntegrityError(e.what());
  }

  const std::string plain = output.str();
  return std::vector<uint8_t>(plain.begin(), plain.end());
}

} // namespace tessera::crypto
