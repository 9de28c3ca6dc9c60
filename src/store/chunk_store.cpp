#include "tessera/store/chunk_store.hpp"
#include "tessera/chunk/chunker.hpp"
#include "tessera/crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <set>
#include <unistd.h>

namespace tessera {
namespace store {

namespace {

constexpr const char* CONTENT_COLUMNS =
    "id, session_id, type, name, total_chunks, total_size, created_at, iv, is_complete, is_pinned, last_accessed";
constexpr std::size_t IV_SIZE = 16;
constexpr std::size_t MAX_NAME_LENGTH = 255;

std::string select_content(const std::string& where) {
  return std::string("SELECT ") + CONTENT_COLUMNS + " FROM content " + where;
}

ContentMetadata read_metadata_row(const Statement& stmt) {
  ContentMetadata meta;
  meta.id = stmt.column_text(0);
  meta.session_id = stmt.column_text(1);
  meta.content_type = stmt.column_text(2);
  meta.name = stmt.column_text(3);
  meta.total_chunks = static_cast<uint32_t>(stmt.column_int(4));
  meta.total_size = static_cast<uint64_t>(stmt.column_int(5));
  meta.created_at = stmt.column_int(6);
  meta.iv = stmt.column_blob(7);
  meta.complete = stmt.column_int(8) != 0;
  meta.pinned = stmt.column_int(9) != 0;
  meta.last_accessed = stmt.column_int(10);
  return meta;
}

std::optional<ContentMetadata> query_metadata(Database& db, const std::string& content_id) {
  const std::string sql = select_content("WHERE id = ?");
  Statement stmt(db, sql.c_str());
  stmt.bind(1, content_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_metadata_row(stmt);
}

// Snapshot of a directory listing, safe to delete from while walking it
std::vector<std::filesystem::directory_entry> list_entries(const std::filesystem::path& dir) {
  std::vector<std::filesystem::directory_entry> entries;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    entries.push_back(entry);
  }
  return entries;
}

std::string errno_message() {
  return std::strerror(errno);
}

// Flushes directory entries so a rename survives a crash
void sync_directory(const std::filesystem::path& dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Cannot open directory for sync: " << dir.string();
    return;
  }
  if (::fsync(fd) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Directory sync failed for " << dir.string() << ": " << errno_message();
  }
  ::close(fd);
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

ChunkStore::ChunkStore(const std::filesystem::path& root, MetadataDb& db, uint32_t chunk_size)
  : root_(root)
  , db_(db)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw StoreError("Chunk store: chunk size must be positive");
  }
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw StorageUnavailableError("cannot create storage root " + root_.string() + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Initialized at " << root_.string()
                          << " with chunk size " << chunk_size_;
}

//==============================================
// LOCKING
//==============================================

std::shared_ptr<std::mutex> ChunkStore::lock_for(const std::string& content_id) {
  std::lock_guard<std::mutex> guard(locks_mutex_);

  auto it = content_locks_.find(content_id);
  if (it != content_locks_.end()) {
    if (auto existing = it->second.lock()) {
      return existing;
    }
  }

  // Drop entries whose content is no longer being written
  for (auto stale = content_locks_.begin(); stale != content_locks_.end();) {
    stale = stale->second.expired() ? content_locks_.erase(stale) : std::next(stale);
  }

  auto mutex = std::make_shared<std::mutex>();
  content_locks_[content_id] = mutex;
  return mutex;
}

//==============================================
// VALIDATION
//==============================================

void ChunkStore::validate_chunk(const std::string& session_id, const ChunkUpload& chunk) const {
  if (!is_valid_identifier(session_id)) {
    throw InvalidChunkError("malformed session id");
  }
  if (!is_valid_identifier(chunk.content_id)) {
    throw InvalidChunkError("malformed content id");
  }
  if (chunk.total_chunks == 0 || chunk.total_size == 0) {
    throw InvalidChunkError("content must declare at least one byte");
  }
  if (chunk.total_chunks != chunk::expected_chunk_count(chunk.total_size, chunk_size_)) {
    throw InvalidChunkError("declared " + std::to_string(chunk.total_chunks) + " chunks for " +
                            std::to_string(chunk.total_size) + " bytes");
  }
  if (chunk.index >= chunk.total_chunks) {
    throw InvalidChunkError("index " + std::to_string(chunk.index) + " out of range");
  }
  const uint64_t expected = chunk::expected_chunk_size(chunk.index, chunk.total_size, chunk_size_);
  if (chunk.data.size() != expected) {
    throw InvalidChunkError("chunk " + std::to_string(chunk.index) + " has " +
                            std::to_string(chunk.data.size()) + " bytes, expected " + std::to_string(expected));
  }
  if (chunk.iv.size() != IV_SIZE) {
    throw InvalidChunkError("IV must be " + std::to_string(IV_SIZE) + " bytes");
  }
  if (chunk.name.size() > MAX_NAME_LENGTH) {
    throw InvalidChunkError("name too long");
  }
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

PutResult ChunkStore::put_chunk(const std::string& session_id, const ChunkUpload& chunk,
                                const FinalizeHandler& on_finalized) {
  validate_chunk(session_id, chunk);

  const auto checksum = crypto::sha256(chunk.data);
  if (!chunk.checksum.empty() && chunk.checksum != checksum) {
    throw InvalidChunkError("checksum mismatch for chunk " + std::to_string(chunk.index));
  }

  auto content_lock = lock_for(chunk.content_id);
  std::lock_guard<std::mutex> guard(*content_lock);
  auto db = db_.acquire();

  // Declared totals must agree with the first chunk that created the content
  if (auto existing = query_metadata(*db, chunk.content_id)) {
    if (existing->session_id != session_id) {
      throw ChunkConflictError("content " + chunk.content_id + " belongs to another session");
    }
    if (existing->total_chunks != chunk.total_chunks || existing->total_size != chunk.total_size ||
        existing->iv != chunk.iv) {
      throw ChunkConflictError("content " + chunk.content_id + " was declared with different totals");
    }
  }

  {
    Statement stmt(*db, "SELECT checksum FROM chunks WHERE content_id = ? AND chunk_index = ?");
    stmt.bind(1, chunk.content_id).bind(2, static_cast<int64_t>(chunk.index));
    if (stmt.step()) {
      if (crypto::constant_time_equals(stmt.column_blob(0), checksum)) {
        BOOST_LOG_TRIVIAL(debug) << "Chunk store: Duplicate chunk " << chunk.index
                                 << " for " << chunk.content_id;
        return PutResult{true, false};
      }
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Rejecting differing bytes for chunk " << chunk.index
                                 << " of " << chunk.content_id;
      throw ChunkConflictError("chunk " + std::to_string(chunk.index) + " of " + chunk.content_id +
                               " already stored with different bytes");
    }
  }

  // Step one: bytes on disk. Step two: presence row and finalize in one transaction.
  const auto path = chunk_path(session_id, chunk.content_id, chunk.index);
  write_chunk_file(path, chunk.data);

  PutResult result;
  try {
    Transaction tx(*db);
    const int64_t now = now_millis();

    {
      Statement stmt(*db,
          "INSERT OR IGNORE INTO content (id, session_id, type, name, total_chunks, total_size, created_at, iv, "
          "is_complete, is_pinned, last_accessed) VALUES (?, ?, ?, ?, ?, ?, ?, ?, 0, 0, ?)");
      stmt.bind(1, chunk.content_id)
          .bind(2, session_id)
          .bind(3, chunk.content_type)
          .bind(4, chunk.name)
          .bind(5, static_cast<int64_t>(chunk.total_chunks))
          .bind(6, static_cast<int64_t>(chunk.total_size))
          .bind(7, now)
          .bind_blob(8, chunk.iv)
          .bind(9, now);
      stmt.run();
    }

    {
      Statement stmt(*db,
          "INSERT INTO chunks (content_id, chunk_index, size, checksum, stored_at) VALUES (?, ?, ?, ?, ?)");
      stmt.bind(1, chunk.content_id)
          .bind(2, static_cast<int64_t>(chunk.index))
          .bind(3, static_cast<int64_t>(chunk.data.size()))
          .bind_blob(4, checksum)
          .bind(5, now);
      stmt.run();
    }

    // Count inside the write transaction so finalize never sees a stale total
    int64_t present = 0;
    {
      Statement stmt(*db, "SELECT COUNT(*) FROM chunks WHERE content_id = ?");
      stmt.bind(1, chunk.content_id);
      if (stmt.step()) {
        present = stmt.column_int(0);
      }
    }

    if (present == static_cast<int64_t>(chunk.total_chunks)) {
      Statement stmt(*db, "UPDATE content SET is_complete = 1 WHERE id = ? AND is_complete = 0");
      stmt.bind(1, chunk.content_id);
      stmt.run();
      result.finalized = db->changes() == 1;
    }

    tx.commit();
  } catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Metadata commit failed for chunk " << chunk.index
                             << " of " << chunk.content_id << ": " << e.what();
    std::error_code ec;
    std::filesystem::remove(path, ec);
    throw;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Stored chunk " << chunk.index << "/" << chunk.total_chunks
                           << " of " << chunk.content_id;
  if (result.finalized) {
    BOOST_LOG_TRIVIAL(info) << "Chunk store: Finalized content " << chunk.content_id << " ("
                            << chunk.total_size << " bytes in " << chunk.total_chunks << " chunks)";
    // A delete of this content waits on the lock until the handler returns
    if (on_finalized) {
      if (auto meta = query_metadata(*db, chunk.content_id)) {
        on_finalized(*meta);
      }
    }
  }
  return result;
}

std::vector<StoredChunk> ChunkStore::get_content(const std::string& content_id) {
  std::vector<StoredChunk> chunks;
  {
    auto db = db_.acquire();
    Transaction snapshot(*db, false);

    auto meta = query_metadata(*db, content_id);
    if (!meta || !meta->complete) {
      throw NotFoundError("content " + content_id);
    }

    Statement stmt(*db, "SELECT chunk_index, checksum FROM chunks WHERE content_id = ? ORDER BY chunk_index");
    stmt.bind(1, content_id);
    while (stmt.step()) {
      StoredChunk chunk;
      chunk.index = static_cast<uint32_t>(stmt.column_int(0));
      chunk.checksum = stmt.column_blob(1);
      chunk.data = read_chunk_file(chunk_path(meta->session_id, content_id, chunk.index));
      chunks.push_back(std::move(chunk));
    }
    snapshot.commit();

    if (chunks.size() != meta->total_chunks) {
      throw NotFoundError("content " + content_id + " is missing chunks");
    }

    Statement touch(*db, "UPDATE content SET last_accessed = ? WHERE id = ?");
    touch.bind(1, now_millis()).bind(2, content_id);
    touch.run();
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Read " << chunks.size() << " chunks of " << content_id;
  return chunks;
}

StoredChunk ChunkStore::get_chunk(const std::string& content_id, uint32_t index) {
  auto db = db_.acquire();
  Transaction snapshot(*db, false);

  auto meta = query_metadata(*db, content_id);
  if (!meta || !meta->complete) {
    throw NotFoundError("content " + content_id);
  }

  Statement stmt(*db, "SELECT checksum FROM chunks WHERE content_id = ? AND chunk_index = ?");
  stmt.bind(1, content_id).bind(2, static_cast<int64_t>(index));
  if (!stmt.step()) {
    throw NotFoundError("chunk " + std::to_string(index) + " of " + content_id);
  }

  StoredChunk chunk;
  chunk.index = index;
  chunk.checksum = stmt.column_blob(0);
  chunk.data = read_chunk_file(chunk_path(meta->session_id, content_id, index));
  snapshot.commit();
  return chunk;
}

bool ChunkStore::delete_content(const std::string& content_id) {
  auto content_lock = lock_for(content_id);
  std::lock_guard<std::mutex> guard(*content_lock);
  return delete_locked(content_id).has_value();
}

std::optional<ContentMetadata> ChunkStore::delete_locked(const std::string& content_id) {
  std::optional<ContentMetadata> meta;
  {
    auto db = db_.acquire();
    Transaction tx(*db);

    meta = query_metadata(*db, content_id);
    if (!meta) {
      return std::nullopt;
    }

    Statement chunks(*db, "DELETE FROM chunks WHERE content_id = ?");
    chunks.bind(1, content_id);
    chunks.run();

    Statement content(*db, "DELETE FROM content WHERE id = ?");
    content.bind(1, content_id);
    content.run();

    tx.commit();
  }

  // Metadata is gone, leftover files are orphans the reconcile sweep removes
  remove_content_files(meta->session_id, content_id);
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Deleted content " << content_id;
  return meta;
}

std::vector<std::string> ChunkStore::delete_session_content(const std::string& session_id,
                                                            const RemovalHandler& on_removed) {
  std::vector<std::string> ids;
  {
    auto db = db_.acquire();
    Statement stmt(*db, "SELECT id FROM content WHERE session_id = ? ORDER BY created_at, rowid");
    stmt.bind(1, session_id);
    while (stmt.step()) {
      ids.push_back(stmt.column_text(0));
    }
  }

  std::vector<std::string> removed;
  for (const auto& id : ids) {
    if (delete_content(id)) {
      removed.push_back(id);
      if (on_removed) {
        on_removed(id);
      }
    }
  }

  if (is_valid_identifier(session_id)) {
    std::error_code ec;
    std::filesystem::remove(root_ / session_id, ec);  // only succeeds when empty
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Deleted " << removed.size() << " items of session " << session_id;
  return removed;
}

//==============================================
// METADATA OPERATIONS
//==============================================

ContentMetadata ChunkStore::get_metadata(const std::string& content_id) {
  auto meta = find_metadata(content_id);
  if (!meta) {
    throw NotFoundError("content " + content_id);
  }
  return *meta;
}

std::optional<ContentMetadata> ChunkStore::find_metadata(const std::string& content_id) {
  auto db = db_.acquire();
  return query_metadata(*db, content_id);
}

bool ChunkStore::is_finalized(const std::string& content_id) {
  auto meta = find_metadata(content_id);
  return meta && meta->complete;
}

ContentPage ChunkStore::list_content(const std::string& session_id, uint32_t offset, uint32_t limit) {
  ContentPage page;
  page.offset = offset;
  page.limit = limit;

  auto db = db_.acquire();
  Transaction snapshot(*db, false);
  {
    Statement stmt(*db, "SELECT COUNT(*) FROM content WHERE session_id = ? AND is_complete = 1");
    stmt.bind(1, session_id);
    if (stmt.step()) {
      page.total = static_cast<uint64_t>(stmt.column_int(0));
    }
  }
  {
    const std::string sql = select_content(
        "WHERE session_id = ? AND is_complete = 1 ORDER BY created_at DESC, rowid DESC LIMIT ? OFFSET ?");
    Statement stmt(*db, sql.c_str());
    stmt.bind(1, session_id).bind(2, static_cast<int64_t>(limit)).bind(3, static_cast<int64_t>(offset));
    while (stmt.step()) {
      page.items.push_back(read_metadata_row(stmt));
    }
  }
  snapshot.commit();
  return page;
}

void ChunkStore::rename_content(const std::string& content_id, const std::string& name) {
  if (name.size() > MAX_NAME_LENGTH) {
    throw StoreError("Chunk store: name too long");
  }
  auto db = db_.acquire();
  Statement stmt(*db, "UPDATE content SET name = ? WHERE id = ? AND is_complete = 1");
  stmt.bind(1, name).bind(2, content_id);
  stmt.run();
  if (db->changes() == 0) {
    throw NotFoundError("content " + content_id);
  }
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Renamed " << content_id << " to '" << name << "'";
}

void ChunkStore::set_pinned(const std::string& content_id, bool pinned) {
  auto db = db_.acquire();
  Statement stmt(*db, "UPDATE content SET is_pinned = ? WHERE id = ? AND is_complete = 1");
  stmt.bind(1, static_cast<int64_t>(pinned ? 1 : 0)).bind(2, content_id);
  stmt.run();
  if (db->changes() == 0) {
    throw NotFoundError("content " + content_id);
  }
  BOOST_LOG_TRIVIAL(info) << "Chunk store: " << (pinned ? "Pinned " : "Unpinned ") << content_id;
}

//==============================================
// HOUSEKEEPING
//==============================================

std::vector<ContentMetadata> ChunkStore::enforce_retention(const std::string& session_id, uint32_t max_items) {
  std::vector<std::string> victims;
  {
    auto db = db_.acquire();
    int64_t total = 0;
    {
      Statement stmt(*db, "SELECT COUNT(*) FROM content WHERE session_id = ? AND is_complete = 1");
      stmt.bind(1, session_id);
      if (stmt.step()) {
        total = stmt.column_int(0);
      }
    }
    if (total <= static_cast<int64_t>(max_items)) {
      return {};
    }

    Statement stmt(*db,
        "SELECT id FROM content WHERE session_id = ? AND is_complete = 1 AND is_pinned = 0 "
        "ORDER BY created_at ASC, rowid ASC LIMIT ?");
    stmt.bind(1, session_id).bind(2, total - static_cast<int64_t>(max_items));
    while (stmt.step()) {
      victims.push_back(stmt.column_text(0));
    }
  }

  std::vector<ContentMetadata> removed;
  for (const auto& id : victims) {
    auto content_lock = lock_for(id);
    std::lock_guard<std::mutex> guard(*content_lock);
    if (auto meta = delete_locked(id)) {
      removed.push_back(std::move(*meta));
    }
  }

  if (!removed.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Chunk store: Retention removed " << removed.size()
                            << " items from session " << session_id;
  }
  return removed;
}

std::vector<ContentMetadata> ChunkStore::collect_stale_pending(std::chrono::milliseconds max_age) {
  std::vector<std::string> stale;
  {
    auto db = db_.acquire();
    Statement stmt(*db, "SELECT id FROM content WHERE is_complete = 0 AND created_at < ?");
    stmt.bind(1, now_millis() - static_cast<int64_t>(max_age.count()));
    while (stmt.step()) {
      stale.push_back(stmt.column_text(0));
    }
  }

  std::vector<ContentMetadata> removed;
  for (const auto& id : stale) {
    auto content_lock = lock_for(id);
    std::lock_guard<std::mutex> guard(*content_lock);
    // Re-check under the lock, a late chunk may have finalized it
    auto meta = find_metadata(id);
    if (!meta || meta->complete) {
      continue;
    }
    if (auto deleted = delete_locked(id)) {
      removed.push_back(std::move(*deleted));
    }
  }

  if (!removed.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Chunk store: Collected " << removed.size() << " stale pending items";
  }
  return removed;
}

ReconcileReport ChunkStore::reconcile() {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Reconciling " << root_.string();
  ReconcileReport report;
  namespace fs = std::filesystem;

  // Pass one: files and directories without metadata
  for (const auto& session_entry : list_entries(root_)) {
    if (!session_entry.is_directory()) {
      continue;
    }
    const std::string session_id = session_entry.path().filename().string();

    for (const auto& content_entry : list_entries(session_entry.path())) {
      const std::string content_id = content_entry.path().filename().string();
      auto content_lock = lock_for(content_id);
      std::lock_guard<std::mutex> guard(*content_lock);

      auto meta = find_metadata(content_id);
      if (!content_entry.is_directory() || !meta || meta->session_id != session_id) {
        std::error_code ec;
        fs::remove_all(content_entry.path(), ec);
        ++report.removed_directories;
        BOOST_LOG_TRIVIAL(info) << "Chunk store: Removed orphaned " << content_entry.path().string();
        continue;
      }

      std::set<uint32_t> indices;
      {
        auto db = db_.acquire();
        Statement stmt(*db, "SELECT chunk_index FROM chunks WHERE content_id = ?");
        stmt.bind(1, content_id);
        while (stmt.step()) {
          indices.insert(static_cast<uint32_t>(stmt.column_int(0)));
        }
      }

      for (const auto& file : list_entries(content_entry.path())) {
        bool keep = false;
        if (file.path().extension() == ".bin") {
          try {
            std::size_t consumed = 0;
            const auto stem = file.path().stem().string();
            const unsigned long index = std::stoul(stem, &consumed);
            keep = consumed == stem.size() && indices.count(static_cast<uint32_t>(index)) > 0;
          } catch (const std::exception&) {
            keep = false;
          }
        }
        if (!keep) {
          std::error_code ec;
          fs::remove(file.path(), ec);
          ++report.removed_files;
          BOOST_LOG_TRIVIAL(info) << "Chunk store: Removed orphaned chunk file " << file.path().string();
        }
      }
    }

    std::error_code ec;
    if (fs::is_empty(session_entry.path(), ec) && !ec) {
      fs::remove(session_entry.path(), ec);
      ++report.removed_directories;
    }
  }

  // Pass two: presence rows whose file vanished demote the content to pending
  std::vector<ContentMetadata> all;
  {
    auto db = db_.acquire();
    const std::string sql = select_content("");
    Statement stmt(*db, sql.c_str());
    while (stmt.step()) {
      all.push_back(read_metadata_row(stmt));
    }
  }

  for (const auto& meta : all) {
    auto content_lock = lock_for(meta.id);
    std::lock_guard<std::mutex> guard(*content_lock);
    auto db = db_.acquire();

    std::vector<uint32_t> missing;
    {
      Statement stmt(*db, "SELECT chunk_index FROM chunks WHERE content_id = ?");
      stmt.bind(1, meta.id);
      while (stmt.step()) {
        const auto index = static_cast<uint32_t>(stmt.column_int(0));
        if (!fs::exists(chunk_path(meta.session_id, meta.id, index))) {
          missing.push_back(index);
        }
      }
    }
    if (missing.empty()) {
      continue;
    }

    Transaction tx(*db);
    for (uint32_t index : missing) {
      Statement stmt(*db, "DELETE FROM chunks WHERE content_id = ? AND chunk_index = ?");
      stmt.bind(1, meta.id).bind(2, static_cast<int64_t>(index));
      stmt.run();
    }
    Statement demote(*db, "UPDATE content SET is_complete = 0 WHERE id = ?");
    demote.bind(1, meta.id);
    demote.run();
    tx.commit();

    ++report.demoted_content;
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Content " << meta.id << " lost " << missing.size()
                               << " chunk files, marked pending";
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Reconcile removed " << report.removed_files << " files, "
                          << report.removed_directories << " directories, demoted "
                          << report.demoted_content << " items";
  return report;
}

bool ChunkStore::healthy() {
  try {
    {
      auto db = db_.acquire();
      Statement stmt(*db, "SELECT 1");
      stmt.step();
    }
    const auto probe = root_ / ".health";
    write_chunk_file(probe, {0x01});
    std::filesystem::remove(probe);
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Health check failed: " << e.what();
    return false;
  }
}

//==============================================
// FILE OPERATIONS
//==============================================

std::filesystem::path ChunkStore::content_dir(const std::string& session_id, const std::string& content_id) const {
  return root_ / session_id / content_id;
}

std::filesystem::path ChunkStore::chunk_path(const std::string& session_id, const std::string& content_id,
                                             uint32_t index) const {
  return content_dir(session_id, content_id) / (std::to_string(index) + ".bin");
}

void ChunkStore::write_chunk_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) const {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw StorageUnavailableError("cannot create " + path.parent_path().string() + ": " + ec.message());
  }

  const std::string tmp = path.string() + ".tmp";
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw StorageUnavailableError("cannot create " + tmp + ": " + errno_message());
  }

  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string message = errno_message();
      ::close(fd);
      ::unlink(tmp.c_str());
      throw StorageUnavailableError("write to " + tmp + " failed: " + message);
    }
    written += static_cast<std::size_t>(n);
  }

  if (::fsync(fd) != 0) {
    const std::string message = errno_message();
    ::close(fd);
    ::unlink(tmp.c_str());
    throw StorageUnavailableError("fsync of " + tmp + " failed: " + message);
  }
  if (::close(fd) != 0) {
    ::unlink(tmp.c_str());
    throw StorageUnavailableError("close of " + tmp + " failed: " + errno_message());
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    ::unlink(tmp.c_str());
    throw StorageUnavailableError("rename to " + path.string() + " failed: " + ec.message());
  }
  sync_directory(path.parent_path());
}

std::vector<uint8_t> ChunkStore::read_chunk_file(const std::filesystem::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Missing chunk file " << path.string();
    throw NotFoundError("chunk file " + path.filename().string());
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw StorageUnavailableError("read of " + path.string() + " failed");
  }
  return data;
}

void ChunkStore::remove_content_files(const std::string& session_id, const std::string& content_id) const {
  std::error_code ec;
  std::filesystem::remove_all(content_dir(session_id, content_id), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Could not remove files of " << content_id << ": " << ec.message();
  }
}

} // namespace store
} // namespace tessera
