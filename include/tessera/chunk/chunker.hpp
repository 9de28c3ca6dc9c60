#ifndef TESSERA_CHUNK_CHUNKER_HPP
#define TESSERA_CHUNK_CHUNKER_HPP

#include <cstdint>
#include <vector>
#include "chunk_error.hpp"

namespace tessera::chunk {

static constexpr uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;

struct Chunk {
  uint32_t index = 0;
  std::vector<uint8_t> data;
};

// ---- SPLITTING ----
// Slices bytes into ordered chunks of chunk_size, the last one may be shorter.
// An empty payload yields no chunks. Throws ChunkError when chunk_size is zero.
std::vector<Chunk> split(const std::vector<uint8_t>& bytes, uint32_t chunk_size);


// ---- REASSEMBLY ----
// Concatenates chunks in index order regardless of the order given.
// Missing indices throw IncompleteContentError, conflicting duplicates throw OrderingError.
std::vector<uint8_t> reassemble(std::vector<Chunk> chunks);
// Same, with the expected number of chunks known up front
std::vector<uint8_t> reassemble(std::vector<Chunk> chunks, uint32_t expected_count);


// ---- SIZE INVARIANTS ----
// ceil(total_size / chunk_size)
uint32_t expected_chunk_count(uint64_t total_size, uint32_t chunk_size);
// Size of the chunk at index, the last one holds ((total_size - 1) % chunk_size) + 1 bytes
uint64_t expected_chunk_size(uint32_t index, uint64_t total_size, uint32_t chunk_size);

} // namespace tessera::chunk

#endif // TESSERA_CHUNK_CHUNKER_HPP
