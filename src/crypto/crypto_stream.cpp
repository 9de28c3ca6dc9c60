#include "tessera/crypto/crypto_stream.hpp"
#include <openssl/evp.h>
#include <array>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace tessera::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Crypto stream: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoStream::CryptoStream() : context_(std::make_unique<CipherContext>()) {
  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: Cipher context created";
}

CryptoStream::~CryptoStream() = default;

//==============================================
// CRYPTO UNIT INITIALIZATION
//==============================================

void CryptoStream::initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid key size: " << key.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }
  if (iv.size() != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid IV size: " << iv.size() << " bytes (expected " << IV_SIZE << " bytes)";
    throw InitializationError("Invalid IV size");
  }

  key_ = key;
  iv_ = iv;
  is_initialized_ = true;
}

void CryptoStream::initialize_cipher(bool encrypting) {
  if (!is_initialized_) {
    throw InitializationError("Crypto stream: CryptoStream not initialized");
  }

  // Reset the context state so the stream can be reused
  EVP_CIPHER_CTX_reset(context_->get());

  const EVP_CIPHER* cipher = EVP_aes_256_cbc();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw EncryptionError("Crypto stream: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw DecryptionError("Crypto stream: Failed to initialize decryption context");
    }
  }
}

//==============================================
// STREAM PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

std::size_t CryptoStream::process_stream(std::istream& input, std::ostream& output, bool encrypting) {
  if (!output.good()) {
    throw std::runtime_error("Crypto stream: Invalid stream state");
  }

  initialize_cipher(encrypting);

  std::array<uint8_t, BUFFER_SIZE> inbuf;
  std::array<uint8_t, BUFFER_SIZE + EVP_MAX_BLOCK_LENGTH> outbuf;
  std::size_t total_bytes_processed = 0;

  // Process the input stream in buffer-sized pieces
  while (input.good()) {
    input.read(reinterpret_cast<char*>(inbuf.data()), inbuf.size());
    auto bytes_read = input.gcount();

    if (bytes_read <= 0) {
      if (!input.eof()) {
        throw std::runtime_error("Crypto stream: Failed to read from input stream");
      }
      break;
    }

    auto outlen = process_data_block(inbuf.data(), static_cast<size_t>(bytes_read), outbuf.data(), encrypting);
    write_output_block(output, outbuf.data(), outlen);
    total_bytes_processed += outlen;
  }

  // Final block carries the padding
  int final_outlen = 0;
  process_final_block(outbuf.data(), final_outlen, encrypting);
  write_output_block(output, outbuf.data(), static_cast<size_t>(final_outlen));
  total_bytes_processed += static_cast<size_t>(final_outlen);

  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: Completed " << (encrypting ? "encryption" : "decryption")
                           << ", " << total_bytes_processed << " bytes out";
  return total_bytes_processed;
}

std::size_t CryptoStream::process_data_block(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf, 
                                             bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptUpdate(context_->get(), outbuf, &outlen,
                           inbuf, static_cast<int>(bytes_read))) {
      throw EncryptionError("Crypto stream: Failed to encrypt data block");
    }
  } else {
    if (!EVP_DecryptUpdate(context_->get(), outbuf, &outlen,
                           inbuf, static_cast<int>(bytes_read))) {
      throw DecryptionError("Crypto stream: Failed to decrypt data block");
    }
  }
  return static_cast<size_t>(outlen);
}

void CryptoStream::write_output_block(std::ostream& output, const uint8_t* data, size_t length) {
  if (length > 0) {
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!output.good()) {
      throw std::runtime_error("Crypto stream: Failed to write to output stream");
    }
  }
}

void CryptoStream::process_final_block(uint8_t* outbuf, int& outlen, bool encrypting) {
  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw EncryptionError("Crypto stream: Failed to finalize encryption");
    }
  } else {
    // Fails on bad padding or a length that is not a block multiple
    if (!EVP_DecryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw DecryptionError("Crypto stream: Failed to finalize decryption");
    }
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================
  
std::size_t CryptoStream::encrypt(std::istream& input, std::ostream& output) {
  return process_stream(input, output, true);
}

std::size_t CryptoStream::decrypt(std::istream& input, std::ostream& output) {
  return process_stream(input, output, false);
}

} // namespace tessera::crypto
