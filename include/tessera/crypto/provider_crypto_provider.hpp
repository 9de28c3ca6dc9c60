#ifndef TESSERA_PROVIDER_CRYPTO_PROVIDER_HPP
#define TESSERA_PROVIDER_CRYPTO_PROVIDER_HPP

#include "crypto_provider.hpp"

namespace tessera::crypto {

// CryptoProvider on the OpenSSL 3 provider API: algorithms are fetched by name
// and configured with OSSL_PARAM arrays, buffers are processed in one shot.
class ProviderCryptoProvider : public CryptoProvider {
public:
  explicit ProviderCryptoProvider(unsigned iterations = DEFAULT_ITERATIONS);

  SessionKey derive_key(const std::string& passphrase, const std::string& salt) const override;
  std::vector<uint8_t> fingerprint(const std::string& passphrase) const override;
  std::vector<uint8_t> derive_iv(const SessionKey& key,
                                 const std::vector<uint8_t>& plaintext) const override;
  std::vector<uint8_t> encrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                               const std::vector<uint8_t>& plaintext) const override;
  std::vector<uint8_t> decrypt(const SessionKey& key, const std::vector<uint8_t>& iv,
                               const std::vector<uint8_t>& ciphertext) const override;
  std::string name() const override { return "provider"; }

private:
  unsigned iterations_;

  std::vector<uint8_t> kdf(const std::string& passphrase, const std::string& salt,
                           std::size_t length) const;
  std::vector<uint8_t> mac(const std::vector<uint8_t>& key,
                           const std::vector<uint8_t>& first,
                           const std::vector<uint8_t>& second) const;
  std::vector<uint8_t> cipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv,
                              const std::vector<uint8_t>& input, bool encrypting) const;
};

} // namespace tessera::crypto

#endif // TESSERA_PROVIDER_CRYPTO_PROVIDER_HPP
