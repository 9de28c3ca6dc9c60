#ifndef TESSERA_STREAM_CRYPTO_PROVIDER_HPP
#define TESSERA_STREAM_CRYPTO_PROVIDER_HPP

#include "crypto_provider.hpp"

namespace tessera::crypto {

// CryptoProvider on top of CryptoStream and the classic PKCS5/HMAC one-shot calls
class StreamCryptoProvider : public CryptoProvider {
public:
  explicit StreamCryptoProvider(unsigned iterations = DEFAULT_ITERATIONS);

  SessionKey derive_key(const std::string& passphrase, const std::string& salt) const override;
  std::vector<uint8_t> fingerprint(const std::string& passphrase) const override;
  std::vector<uint8_t> derive_iv(const SessionKey& key,
                                 const std::vector<uint8_t>& plaintext) const override;
  std::vector<uint8_t> encrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                               const std::vector<uint8_t>& plaintext) const override;
  std::vector<uint8_t> decrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                               const std::vector<uint8_t>& ciphertext) const override;
  std::string name() const override { return "stream"; }

private:
  unsigned iterations_;

  std::vector<uint8_t> pbkdf2(const std::string& passphrase, const std::string& salt,
                              std::size_t length) const;
  std::vector<uint8_t> hmac(const std::vector<uint8_t>& key,
                            const std::vector<uint8_t>& first,
                            const std::vector<uint8_t>& second) const;
};

} // namespace tessera::crypto

#endif // TESSERA_STREAM_CRYPTO_PROVIDER_HPP
