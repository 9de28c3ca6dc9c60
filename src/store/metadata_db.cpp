#include "tessera/store/metadata_db.hpp"
#include "tessera/store/content.hpp"
#include <boost/log/trivial.hpp>
#include <chrono>

namespace tessera {
namespace store {

namespace {

std::filesystem::path prepare_root(const std::filesystem::path& root) {
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    throw StorageUnavailableError("cannot create storage root " + root.string() + ": " + ec.message());
  }
  return root / MetadataDb::FILE_NAME;
}

} // namespace

MetadataDb::MetadataDb(const std::filesystem::path& root, std::size_t pool_size)
  : path_(prepare_root(root))
  , pool_(path_, pool_size) {
  create_schema();
  BOOST_LOG_TRIVIAL(info) << "Metadata: Database ready at " << path_.string();
}

void MetadataDb::create_schema() {
  auto db = pool_.acquire();
  db->exec(R"(
    CREATE TABLE IF NOT EXISTS sessions (
      id TEXT PRIMARY KEY,
      fingerprint BLOB NOT NULL,
      created_at INTEGER NOT NULL,
      last_active INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS content (
      id TEXT PRIMARY KEY,
      session_id TEXT NOT NULL,
      type TEXT NOT NULL,
      name TEXT NOT NULL DEFAULT '',
      total_chunks INTEGER NOT NULL,
      total_size INTEGER NOT NULL,
      created_at INTEGER NOT NULL,
      iv BLOB NOT NULL,
      is_complete INTEGER NOT NULL DEFAULT 0,
      is_pinned INTEGER NOT NULL DEFAULT 0,
      last_accessed INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS chunks (
      content_id TEXT NOT NULL REFERENCES content(id) ON DELETE CASCADE,
      chunk_index INTEGER NOT NULL,
      size INTEGER NOT NULL,
      checksum BLOB NOT NULL,
      stored_at INTEGER NOT NULL,
      PRIMARY KEY (content_id, chunk_index)
    );
    CREATE INDEX IF NOT EXISTS idx_content_session ON content(session_id, is_complete, created_at);
  )");
}

//==============================================
// SHARED HELPERS
//==============================================

bool is_valid_identifier(const std::string& id) {
  if (id.empty() || id.size() > 128) {
    return false;
  }
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

int64_t now_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace store
} // namespace tessera
