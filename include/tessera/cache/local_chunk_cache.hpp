#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "tessera/chunk/chunker.hpp"
#include "tessera/store/sqlite.hpp"

namespace tessera {
namespace cache {

struct CachedContentInfo {
  std::string content_id;
  std::string session_id;
  std::string content_type;
  std::string name;
  uint32_t total_chunks = 0;
  uint64_t total_size = 0;
  std::vector<uint8_t> iv;
};

/**
 * Client side chunk cache in an embedded SQLite file.
 *
 * Keyed by (content id, index). Chunks can arrive in any order. Eviction is
 * least recently used over whole content items and skips protected ids (those
 * with an active transfer), so a partially received item is never trimmed.
 */
class LocalChunkCache {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  LocalChunkCache(const std::filesystem::path& db_path, uint64_t max_bytes);


  // ---- CHUNK OPERATIONS ----
  // Stores a chunk, registering the content on first use. Cached chunks are immutable.
  // Returns the ids evicted to stay within budget.
  std::vector<std::string> put(const CachedContentInfo& info, uint32_t index, const std::vector<uint8_t>& data);
  std::optional<std::vector<uint8_t>> get(const std::string& content_id, uint32_t index);
  // Every cached chunk of one item, read from a single snapshot
  std::vector<chunk::Chunk> read_all(const std::string& content_id);


  // ---- CONTENT OPERATIONS ----
  std::optional<CachedContentInfo> info(const std::string& content_id);
  // Registers content without chunks, used by uploads that seed the cache
  void register_content(const CachedContentInfo& info);
  bool has_all(const std::string& content_id);
  // Indices not yet cached, empty when the content is unknown
  std::vector<uint32_t> missing(const std::string& content_id);
  std::vector<std::string> content_ids();
  bool remove(const std::string& content_id);
  void clear();


  // ---- EVICTION ----
  // Protected content is skipped by eviction
  void protect(const std::string& content_id);
  void unprotect(const std::string& content_id);
  bool is_protected(const std::string& content_id) const;
  std::vector<std::string> evict_if_needed();

  uint64_t size_bytes();
  uint64_t max_bytes() const { return max_bytes_; }

private:
  // ---- PARAMETERS ----
  uint64_t max_bytes_;
  mutable std::mutex mutex_;
  std::unique_ptr<store::Database> db_;
  std::set<std::string> protected_;

  void create_schema();
  void touch_locked(const std::string& content_id);
  uint64_t size_bytes_locked();
  std::optional<CachedContentInfo> info_locked(const std::string& content_id);
  void register_locked(const CachedContentInfo& info);
  std::vector<std::string> evict_locked();
  bool remove_locked(const std::string& content_id);
};

} // namespace cache
} // namespace tessera
