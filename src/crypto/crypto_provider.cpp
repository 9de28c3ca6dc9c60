#include "tessera/crypto/crypto_provider.hpp"
#include "tessera/crypto/stream_crypto_provider.hpp"
#include "tessera/crypto/provider_crypto_provider.hpp"
#include <boost/log/trivial.hpp>

namespace tessera::crypto {

void CryptoProvider::validate(const SessionKey& key, const std::vector<uint8_t>& iv) {
  if (key.cipher_key.size() != KEY_SIZE) {
    throw InitializationError("Invalid cipher key size " + std::to_string(key.cipher_key.size()));
  }
  if (key.mac_key.empty()) {
    throw InitializationError("Missing MAC key");
  }
  if (iv.size() != IV_SIZE) {
    throw InitializationError("Invalid IV size " + std::to_string(iv.size()));
  }
}

CryptoBackend parse_crypto_backend(const std::string& name) {
  if (name == "stream") {
    return CryptoBackend::Stream;
  }
  if (name == "provider") {
    return CryptoBackend::Provider;
  }
  throw InitializationError("Unknown crypto backend: " + name);
}

std::string to_string(CryptoBackend backend) {
  switch (backend) {
    case CryptoBackend::Stream:   return "stream";
    case CryptoBackend::Provider: return "provider";
  }
  return "unknown";
}

std::unique_ptr<CryptoProvider> make_crypto_provider(CryptoBackend backend, unsigned iterations) {
  BOOST_LOG_TRIVIAL(info) << "Crypto provider: Using " << to_string(backend) << " backend";
  switch (backend) {
    case CryptoBackend::Stream:
      return std::make_unique<StreamCryptoProvider>(iterations);
    case CryptoBackend::Provider:
      return std::make_unique<ProviderCryptoProvider>(iterations);
  }
  throw InitializationError("Unsupported crypto backend");
}

} // namespace tessera::crypto
