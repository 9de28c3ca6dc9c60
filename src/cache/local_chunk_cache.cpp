#include "tessera/cache/local_chunk_cache.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace tessera {
namespace cache {

using store::Statement;
using store::Transaction;

//==============================================
// CONSTRUCTOR
//==============================================

LocalChunkCache::LocalChunkCache(const std::filesystem::path& db_path, uint64_t max_bytes)
  : max_bytes_(max_bytes) {
  if (max_bytes_ == 0) {
    throw store::StoreError("Chunk cache: budget must be positive");
  }
  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      throw store::StorageUnavailableError("cannot create cache directory: " + ec.message());
    }
  }
  db_ = std::make_unique<store::Database>(db_path);
  create_schema();
  BOOST_LOG_TRIVIAL(info) << "Chunk cache: Opened " << db_path.string() << " with budget " << max_bytes_ << " bytes";
}

void LocalChunkCache::create_schema() {
  db_->exec(R"(
    CREATE TABLE IF NOT EXISTS cache_content (
      content_id TEXT PRIMARY KEY,
      session_id TEXT NOT NULL,
      type TEXT NOT NULL,
      name TEXT NOT NULL,
      total_chunks INTEGER NOT NULL,
      total_size INTEGER NOT NULL,
      iv BLOB NOT NULL,
      last_access INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS cache_chunks (
      content_id TEXT NOT NULL,
      chunk_index INTEGER NOT NULL,
      data BLOB NOT NULL,
      PRIMARY KEY (content_id, chunk_index)
    );
  )");
}

//==============================================
// CHUNK OPERATIONS
//==============================================

std::vector<std::string> LocalChunkCache::put(const CachedContentInfo& info, uint32_t index,
                                              const std::vector<uint8_t>& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  {
    Transaction tx(*db_);
    register_locked(info);

    Statement stmt(*db_, "INSERT OR IGNORE INTO cache_chunks (content_id, chunk_index, data) VALUES (?, ?, ?)");
    stmt.bind(1, info.content_id).bind(2, static_cast<int64_t>(index)).bind_blob(3, data);
    stmt.run();
    if (db_->changes() == 0) {
      BOOST_LOG_TRIVIAL(debug) << "Chunk cache: Chunk " << index << " of " << info.content_id << " already cached";
    }
    touch_locked(info.content_id);
    tx.commit();
  }
  return evict_locked();
}

std::optional<std::vector<uint8_t>> LocalChunkCache::get(const std::string& content_id, uint32_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(*db_, "SELECT data FROM cache_chunks WHERE content_id = ? AND chunk_index = ?");
  stmt.bind(1, content_id).bind(2, static_cast<int64_t>(index));
  if (!stmt.step()) {
    return std::nullopt;
  }
  auto data = stmt.column_blob(0);
  touch_locked(content_id);
  return data;
}

std::vector<chunk::Chunk> LocalChunkCache::read_all(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<chunk::Chunk> chunks;
  {
    Transaction snapshot(*db_, false);
    Statement stmt(*db_, "SELECT chunk_index, data FROM cache_chunks WHERE content_id = ? ORDER BY chunk_index");
    stmt.bind(1, content_id);
    while (stmt.step()) {
      chunk::Chunk chunk;
      chunk.index = static_cast<uint32_t>(stmt.column_int(0));
      chunk.data = stmt.column_blob(1);
      chunks.push_back(std::move(chunk));
    }
    snapshot.commit();
  }
  touch_locked(content_id);
  return chunks;
}

//==============================================
// CONTENT OPERATIONS
//==============================================

std::optional<CachedContentInfo> LocalChunkCache::info(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return info_locked(content_id);
}

std::optional<CachedContentInfo> LocalChunkCache::info_locked(const std::string& content_id) {
  Statement stmt(*db_,
      "SELECT content_id, session_id, type, name, total_chunks, total_size, iv FROM cache_content WHERE content_id = ?");
  stmt.bind(1, content_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  CachedContentInfo info;
  info.content_id = stmt.column_text(0);
  info.session_id = stmt.column_text(1);
  info.content_type = stmt.column_text(2);
  info.name = stmt.column_text(3);
  info.total_chunks = static_cast<uint32_t>(stmt.column_int(4));
  info.total_size = static_cast<uint64_t>(stmt.column_int(5));
  info.iv = stmt.column_blob(6);
  return info;
}

void LocalChunkCache::register_content(const CachedContentInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  register_locked(info);
}

void LocalChunkCache::register_locked(const CachedContentInfo& info) {
  Statement stmt(*db_,
      "INSERT INTO cache_content (content_id, session_id, type, name, total_chunks, total_size, iv, last_access) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, (SELECT COALESCE(MAX(last_access), 0) + 1 FROM cache_content)) "
      "ON CONFLICT(content_id) DO UPDATE SET name = excluded.name");
  stmt.bind(1, info.content_id)
      .bind(2, info.session_id)
      .bind(3, info.content_type)
      .bind(4, info.name)
      .bind(5, static_cast<int64_t>(info.total_chunks))
      .bind(6, static_cast<int64_t>(info.total_size))
      .bind_blob(7, info.iv);
  stmt.run();
}

bool LocalChunkCache::has_all(const std::string& content_id) {
  auto indices = missing(content_id);
  std::lock_guard<std::mutex> lock(mutex_);
  return indices.empty() && info_locked(content_id).has_value();
}

std::vector<uint32_t> LocalChunkCache::missing(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto meta = info_locked(content_id);
  if (!meta) {
    return {};
  }

  std::set<uint32_t> present;
  Statement stmt(*db_, "SELECT chunk_index FROM cache_chunks WHERE content_id = ?");
  stmt.bind(1, content_id);
  while (stmt.step()) {
    present.insert(static_cast<uint32_t>(stmt.column_int(0)));
  }

  std::vector<uint32_t> result;
  for (uint32_t i = 0; i < meta->total_chunks; ++i) {
    if (present.count(i) == 0) {
      result.push_back(i);
    }
  }
  return result;
}

std::vector<std::string> LocalChunkCache::content_ids() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  Statement stmt(*db_, "SELECT content_id FROM cache_content ORDER BY last_access DESC");
  while (stmt.step()) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

bool LocalChunkCache::remove(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return remove_locked(content_id);
}

bool LocalChunkCache::remove_locked(const std::string& content_id) {
  Transaction tx(*db_);
  Statement chunks(*db_, "DELETE FROM cache_chunks WHERE content_id = ?");
  chunks.bind(1, content_id);
  chunks.run();
  Statement content(*db_, "DELETE FROM cache_content WHERE content_id = ?");
  content.bind(1, content_id);
  content.run();
  const bool removed = db_->changes() > 0;
  tx.commit();
  return removed;
}

void LocalChunkCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(*db_);
  db_->exec("DELETE FROM cache_chunks; DELETE FROM cache_content;");
  tx.commit();
  BOOST_LOG_TRIVIAL(info) << "Chunk cache: Cleared";
}

//==============================================
// EVICTION
//==============================================

void LocalChunkCache::protect(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  protected_.insert(content_id);
}

void LocalChunkCache::unprotect(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  protected_.erase(content_id);
}

bool LocalChunkCache::is_protected(const std::string& content_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return protected_.count(content_id) > 0;
}

std::vector<std::string> LocalChunkCache::evict_if_needed() {
  std::lock_guard<std::mutex> lock(mutex_);
  return evict_locked();
}

std::vector<std::string> LocalChunkCache::evict_locked() {
  std::vector<std::string> evicted;
  uint64_t used = size_bytes_locked();
  if (used <= max_bytes_) {
    return evicted;
  }

  std::vector<std::pair<std::string, uint64_t>> candidates;
  {
    Statement stmt(*db_,
        "SELECT c.content_id, COALESCE(SUM(LENGTH(k.data)), 0) FROM cache_content c "
        "LEFT JOIN cache_chunks k ON k.content_id = c.content_id "
        "GROUP BY c.content_id ORDER BY c.last_access ASC");
    while (stmt.step()) {
      candidates.emplace_back(stmt.column_text(0), static_cast<uint64_t>(stmt.column_int(1)));
    }
  }

  for (const auto& [content_id, bytes] : candidates) {
    if (used <= max_bytes_) {
      break;
    }
    if (protected_.count(content_id) > 0) {
      continue;
    }
    remove_locked(content_id);
    used -= std::min(used, bytes);
    evicted.push_back(content_id);
    BOOST_LOG_TRIVIAL(info) << "Chunk cache: Evicted " << content_id << " (" << bytes << " bytes)";
  }
  return evicted;
}

uint64_t LocalChunkCache::size_bytes() {
  std::lock_guard<std::mutex> lock(mutex_);
  return size_bytes_locked();
}

uint64_t LocalChunkCache::size_bytes_locked() {
  Statement stmt(*db_, "SELECT COALESCE(SUM(LENGTH(data)), 0) FROM cache_chunks");
  return stmt.step() ? static_cast<uint64_t>(stmt.column_int(0)) : 0;
}

void LocalChunkCache::touch_locked(const std::string& content_id) {
  // last_access is a logical clock, so recency is exact even within one millisecond
  Statement stmt(*db_,
      "UPDATE cache_content SET last_access = (SELECT COALESCE(MAX(last_access), 0) + 1 FROM cache_content) "
      "WHERE content_id = ?");
  stmt.bind(1, content_id);
  stmt.run();
}

} // namespace cache
} // namespace tessera
