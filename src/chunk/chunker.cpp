#include "tessera/chunk/chunker.hpp"
#include <algorithm>
#include <string>
#include <boost/log/trivial.hpp>

namespace tessera::chunk {

//==============================================
// SPLITTING
//==============================================

std::vector<Chunk> split(const std::vector<uint8_t>& bytes, uint32_t chunk_size) {
  if (chunk_size == 0) {
    throw ChunkError("Chunk size must be positive");
  }

  std::vector<Chunk> chunks;
  chunks.reserve(expected_chunk_count(bytes.size(), chunk_size));

  for (std::size_t offset = 0; offset < bytes.size(); offset += chunk_size) {
    const std::size_t length = std::min<std::size_t>(chunk_size, bytes.size() - offset);
    Chunk chunk;
    chunk.index = static_cast<uint32_t>(chunks.size());
    chunk.data.assign(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                      bytes.begin() + static_cast<std::ptrdiff_t>(offset + length));
    chunks.push_back(std::move(chunk));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split " << bytes.size() << " bytes into "
                           << chunks.size() << " chunks of " << chunk_size;
  return chunks;
}

//==============================================
// REASSEMBLY
//==============================================

std::vector<uint8_t> reassemble(std::vector<Chunk> chunks) {
  uint32_t expected_count = 0;
  for (const auto& chunk : chunks) {
    expected_count = std::max(expected_count, chunk.index + 1);
  }
  return reassemble(std::move(chunks), expected_count);
}

std::vector<uint8_t> reassemble(std::vector<Chunk> chunks, uint32_t expected_count) {
  std::stable_sort(chunks.begin(), chunks.end(),
                   [](const Chunk& a, const Chunk& b) { return a.index < b.index; });

  std::vector<uint8_t> out;
  uint32_t next_index = 0;

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const Chunk& chunk = chunks[i];

    if (i > 0 && chunks[i - 1].index == chunk.index) {
      if (chunks[i - 1].data != chunk.data) {
        BOOST_LOG_TRIVIAL(error) << "Chunker: Conflicting duplicates for index " << chunk.index;
        throw OrderingError("index " + std::to_string(chunk.index) + " appears with differing content");
      }
      continue;
    }

    if (chunk.index >= expected_count) {
      throw OrderingError("index " + std::to_string(chunk.index) + " beyond expected count " +
                          std::to_string(expected_count));
    }
    if (chunk.index != next_index) {
      throw IncompleteContentError("missing chunk index " + std::to_string(next_index));
    }

    out.insert(out.end(), chunk.data.begin(), chunk.data.end());
    ++next_index;
  }

  if (next_index != expected_count) {
    throw IncompleteContentError("missing chunk index " + std::to_string(next_index));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Reassembled " << expected_count << " chunks into "
                           << out.size() << " bytes";
  return out;
}

//==============================================
// SIZE INVARIANTS
//==============================================

uint32_t expected_chunk_count(uint64_t total_size, uint32_t chunk_size) {
  if (chunk_size == 0) {
    throw ChunkError("Chunk size must be positive");
  }
  return static_cast<uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

uint64_t expected_chunk_size(uint32_t index, uint64_t total_size, uint32_t chunk_size) {
  const uint32_t count = expected_chunk_count(total_size, chunk_size);
  if (index >= count) {
    throw ChunkError("Chunk index " + std::to_string(index) + " out of range");
  }
  if (index + 1 < count) {
    return chunk_size;
  }
  return ((total_size - 1) % chunk_size) + 1;
}

} // namespace tessera::chunk
