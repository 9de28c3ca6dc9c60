#ifndef TESSERA_CRYPTO_STREAM_HPP
#define TESSERA_CRYPTO_STREAM_HPP

#include <istream>
#include <ostream>
#include <vector>
#include <memory>
#include <cstdint>
#include "crypto_error.hpp"

namespace tessera::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Streaming AES-256-CBC (PKCS#7) over iostreams, used for payloads of any size
class CryptoStream {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CryptoStream();
  ~CryptoStream();

  CryptoStream(const CryptoStream&) = delete;
  CryptoStream& operator=(const CryptoStream&) = delete;

  
  // ---- INITIALIZATION ----
  // Sets key and IV, both must have the exact AES-256-CBC sizes
  void initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);

  
  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Both return the number of bytes written to output
  std::size_t encrypt(std::istream& input, std::ostream& output);
  std::size_t decrypt(std::istream& input, std::ostream& output);

  // Size of the ciphertext produced for a plaintext of the given size
  static std::size_t padded_size(std::size_t plaintext_size) {
    return (plaintext_size / BLOCK_SIZE + 1) * BLOCK_SIZE;
  }

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> key_;
  std::vector<uint8_t> iv_;
  std::unique_ptr<CipherContext> context_;
  bool is_initialized_ = false;
  static constexpr size_t BUFFER_SIZE = 8192; 

  
  // ---- INITIALIZATION ----  
  // Resets and initializes the cipher context for one pass
  void initialize_cipher(bool encrypting);


  // ---- STREAM PROCESSING - ENCRYPTION/DECRYPTION ----
  // Performs the main encryption/decryption loop on the input stream
  std::size_t process_stream(std::istream& input, std::ostream& output, bool encrypting);
  // Encrypts or decrypts a single buffer of data using the configured cipher
  std::size_t process_data_block(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf, 
                                 bool encrypting);
  // Writes a block of processed data to the output stream
  void write_output_block(std::ostream& output, const uint8_t* data, size_t length);
  // Handles the final block with padding
  void process_final_block(uint8_t* outbuf, int& outlen, bool encrypting);
};
  
} // namespace tessera::crypto

#endif // TESSERA_CRYPTO_STREAM_HPP
