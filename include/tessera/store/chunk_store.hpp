#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "tessera/store/content.hpp"
#include "tessera/store/metadata_db.hpp"
#include "tessera/store/store_error.hpp"

namespace tessera {
namespace store {

/**
 * Durable chunk storage for the server.
 *
 * Chunk bytes live at <root>/<session>/<content>/<index>.bin, presence and
 * content state live in the metadata database. A chunk file is written and
 * synced before its row is committed, so a crash between the two steps
 * leaves the content pending. Content turns complete inside the transaction
 * that inserts its last chunk row. Locking is per content id.
 */
class ChunkStore {
public:
  // Runs after finalize commits, with the content lock still held
  using FinalizeHandler = std::function<void(const ContentMetadata& meta)>;
  // Runs once per item whose deletion is durable
  using RemovalHandler = std::function<void(const std::string& content_id)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkStore(const std::filesystem::path& root, MetadataDb& db, uint32_t chunk_size);


  // ---- CORE STORAGE OPERATIONS ----
  // Persists one chunk, idempotent on (content id, index)
  PutResult put_chunk(const std::string& session_id, const ChunkUpload& chunk,
                      const FinalizeHandler& on_finalized = {});
  // All chunks of finalized content in index order, NotFoundError otherwise
  std::vector<StoredChunk> get_content(const std::string& content_id);
  // One chunk of finalized content
  StoredChunk get_chunk(const std::string& content_id, uint32_t index);
  // Removes metadata, then chunk files. Returns false if nothing existed.
  bool delete_content(const std::string& content_id);
  // Deletes every content item of the session, oldest first, and returns the
  // removed ids. A failure stops the sweep; items reported to on_removed stay deleted.
  std::vector<std::string> delete_session_content(const std::string& session_id,
                                                  const RemovalHandler& on_removed = {});


  // ---- METADATA OPERATIONS ----
  // Metadata in any state, NotFoundError if unknown
  ContentMetadata get_metadata(const std::string& content_id);
  std::optional<ContentMetadata> find_metadata(const std::string& content_id);
  bool is_finalized(const std::string& content_id);
  // Finalized content of a session, newest first
  ContentPage list_content(const std::string& session_id, uint32_t offset, uint32_t limit);
  void rename_content(const std::string& content_id, const std::string& name);
  void set_pinned(const std::string& content_id, bool pinned);


  // ---- HOUSEKEEPING ----
  // Deletes the oldest unpinned finalized items beyond max_items
  std::vector<ContentMetadata> enforce_retention(const std::string& session_id, uint32_t max_items);
  // Deletes content that stayed pending longer than max_age
  std::vector<ContentMetadata> collect_stale_pending(std::chrono::milliseconds max_age);
  // Removes files without metadata and demotes content with missing files
  ReconcileReport reconcile();
  // Storage root writable and metadata reachable
  bool healthy();


  // ---- GETTERS ----
  uint32_t chunk_size() const { return chunk_size_; }
  std::filesystem::path content_dir(const std::string& session_id, const std::string& content_id) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;
  MetadataDb& db_;
  uint32_t chunk_size_;

  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> content_locks_;


  // ---- LOCKING ----
  // Returns the mutex guarding writes to one content id
  std::shared_ptr<std::mutex> lock_for(const std::string& content_id);


  // ---- VALIDATION ----
  void validate_chunk(const std::string& session_id, const ChunkUpload& chunk) const;


  // ---- FILE OPERATIONS ----
  std::filesystem::path chunk_path(const std::string& session_id, const std::string& content_id,
                                   uint32_t index) const;
  // Writes to a temp file, fsyncs and renames into place
  void write_chunk_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) const;
  std::vector<uint8_t> read_chunk_file(const std::filesystem::path& path) const;
  void remove_content_files(const std::string& session_id, const std::string& content_id) const;

  // Deletes one item while its content lock is held
  std::optional<ContentMetadata> delete_locked(const std::string& content_id);
};

} // namespace store
} // namespace tessera
