#ifndef TESSERA_STORE_CONTENT_HPP
#define TESSERA_STORE_CONTENT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace tessera {
namespace store {

// One chunk as submitted by a client
struct ChunkUpload {
  std::string content_id;
  uint32_t index = 0;
  uint32_t total_chunks = 0;
  uint64_t total_size = 0;
  std::vector<uint8_t> iv;
  std::string content_type;
  std::string name;
  std::vector<uint8_t> data;
  std::vector<uint8_t> checksum;  // SHA-256 of data, empty when not supplied
};

struct ContentMetadata {
  std::string id;
  std::string session_id;
  std::string content_type;
  std::string name;
  uint32_t total_chunks = 0;
  uint64_t total_size = 0;
  int64_t created_at = 0;      // ms since epoch
  std::vector<uint8_t> iv;
  bool complete = false;
  bool pinned = false;
  int64_t last_accessed = 0;   // ms since epoch
};

struct StoredChunk {
  uint32_t index = 0;
  std::vector<uint8_t> data;
  std::vector<uint8_t> checksum;
};

struct PutResult {
  bool duplicate = false;   // identical bytes were already stored
  bool finalized = false;   // this write completed the content
};

struct ContentPage {
  std::vector<ContentMetadata> items;
  uint64_t total = 0;
  uint32_t offset = 0;
  uint32_t limit = 0;

  bool has_more() const { return offset + items.size() < total; }
};

struct SessionRecord {
  std::string id;
  std::vector<uint8_t> fingerprint;
  int64_t created_at = 0;
  int64_t last_active = 0;
};

struct ReconcileReport {
  std::size_t removed_files = 0;
  std::size_t removed_directories = 0;
  std::size_t demoted_content = 0;
};

// Session and content ids become directory names: 1-128 chars of [A-Za-z0-9_-]
bool is_valid_identifier(const std::string& id);

// Milliseconds since the Unix epoch
int64_t now_millis();

} // namespace store
} // namespace tessera

#endif // TESSERA_STORE_CONTENT_HPP
