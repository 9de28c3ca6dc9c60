#include "tessera/store/session_registry.hpp"
#include "tessera/crypto/digest.hpp"
#include <boost/log/trivial.hpp>

namespace tessera {
namespace store {

namespace {

SessionRecord read_session_row(const Statement& stmt) {
  SessionRecord record;
  record.id = stmt.column_text(0);
  record.fingerprint = stmt.column_blob(1);
  record.created_at = stmt.column_int(2);
  record.last_active = stmt.column_int(3);
  return record;
}

} // namespace

SessionRegistry::SessionRegistry(MetadataDb& db) : db_(db) {}

bool SessionRegistry::verify_or_create(const std::string& session_id, const std::vector<uint8_t>& fingerprint) {
  auto db = db_.acquire();
  Transaction tx(*db);

  {
    Statement stmt(*db, "SELECT fingerprint FROM sessions WHERE id = ?");
    stmt.bind(1, session_id);
    if (stmt.step()) {
      if (!crypto::constant_time_equals(stmt.column_blob(0), fingerprint)) {
        BOOST_LOG_TRIVIAL(warning) << "Session registry: Fingerprint mismatch for session " << session_id;
        return false;  // rolled back, nothing touched
      }
      Statement touch(*db, "UPDATE sessions SET last_active = ? WHERE id = ?");
      touch.bind(1, now_millis()).bind(2, session_id);
      touch.run();
      tx.commit();
      return true;
    }
  }

  const int64_t now = now_millis();
  Statement insert(*db, "INSERT INTO sessions (id, fingerprint, created_at, last_active) VALUES (?, ?, ?, ?)");
  insert.bind(1, session_id).bind_blob(2, fingerprint).bind(3, now).bind(4, now);
  insert.run();
  tx.commit();

  BOOST_LOG_TRIVIAL(info) << "Session registry: Created session " << session_id;
  return true;
}

std::optional<SessionRecord> SessionRegistry::find(const std::string& session_id) {
  auto db = db_.acquire();
  Statement stmt(*db, "SELECT id, fingerprint, created_at, last_active FROM sessions WHERE id = ?");
  stmt.bind(1, session_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_session_row(stmt);
}

void SessionRegistry::touch(const std::string& session_id) {
  auto db = db_.acquire();
  Statement stmt(*db, "UPDATE sessions SET last_active = ? WHERE id = ?");
  stmt.bind(1, now_millis()).bind(2, session_id);
  stmt.run();
}

std::vector<SessionRecord> SessionRegistry::expired(std::chrono::milliseconds timeout) {
  std::vector<SessionRecord> records;
  auto db = db_.acquire();
  Statement stmt(*db, "SELECT id, fingerprint, created_at, last_active FROM sessions WHERE last_active < ?");
  stmt.bind(1, now_millis() - static_cast<int64_t>(timeout.count()));
  while (stmt.step()) {
    records.push_back(read_session_row(stmt));
  }
  return records;
}

bool SessionRegistry::remove(const std::string& session_id) {
  auto db = db_.acquire();
  Statement stmt(*db, "DELETE FROM sessions WHERE id = ?");
  stmt.bind(1, session_id);
  stmt.run();
  const bool removed = db->changes() > 0;
  if (removed) {
    BOOST_LOG_TRIVIAL(info) << "Session registry: Removed session " << session_id;
  }
  return removed;
}

} // namespace store
} // namespace tessera
