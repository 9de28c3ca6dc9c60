#ifndef TESSERA_CHUNK_ERROR_HPP
#define TESSERA_CHUNK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tessera::chunk {

class ChunkError : public std::runtime_error {
public:
    explicit ChunkError(const std::string& message) 
        : std::runtime_error(message) {}
};

// A required chunk index is missing
class IncompleteContentError : public ChunkError {
public:
    explicit IncompleteContentError(const std::string& message) 
        : ChunkError("Incomplete content: " + message) {}
};

// The same index appears twice with different bytes
class OrderingError : public ChunkError {
public:
    explicit OrderingError(const std::string& message) 
        : ChunkError("Ordering error: " + message) {}
};

} // namespace tessera::chunk

#endif // TESSERA_CHUNK_ERROR_HPP
