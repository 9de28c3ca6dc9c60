#ifndef TESSERA_CRYPTO_ERROR_HPP
#define TESSERA_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tessera::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message) 
        : CryptoError("Initialization error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message) 
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message) 
        : CryptoError("Decryption error: " + message) {}
};

// Ciphertext failed tag verification, padding or length checks
class IntegrityError : public CryptoError {
public:
    explicit IntegrityError(const std::string& message) 
        : CryptoError("Integrity error: " + message) {}
};

} // namespace tessera::crypto

#endif // TESSERA_CRYPTO_ERROR_HPP
