#ifndef TESSERA_STORE_ERROR_HPP
#define TESSERA_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tessera {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Same (content id, index) already holds different bytes, or the content id
// was declared with different totals or by another session
class ChunkConflictError : public StoreError {
public:
  explicit ChunkConflictError(const std::string& message)
    : StoreError("Chunk conflict: " + message) {}
};

// Chunk violates the size, index or checksum invariants
class InvalidChunkError : public StoreError {
public:
  explicit InvalidChunkError(const std::string& message)
    : StoreError("Invalid chunk: " + message) {}
};

// Content is absent, deleted or not yet finalized
class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& message)
    : StoreError("Not found: " + message) {}
};

// Storage medium or metadata database cannot complete a write
class StorageUnavailableError : public StoreError {
public:
  explicit StorageUnavailableError(const std::string& message)
    : StoreError("Storage unavailable: " + message) {}
};

} // namespace store
} // namespace tessera

#endif // TESSERA_STORE_ERROR_HPP
