#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "tessera/store/content.hpp"
#include "tessera/store/metadata_db.hpp"

namespace tessera {
namespace store {

// Persistent session records: the fingerprint a session was created with and
// its activity timestamps. The passphrase itself is never stored.
class SessionRegistry {
public:
  explicit SessionRegistry(MetadataDb& db);

  // Creates the session on first use. Returns false on fingerprint mismatch,
  // in which case nothing is modified.
  bool verify_or_create(const std::string& session_id, const std::vector<uint8_t>& fingerprint);

  std::optional<SessionRecord> find(const std::string& session_id);
  // Updates last_active to now
  void touch(const std::string& session_id);
  // Sessions idle for longer than timeout
  std::vector<SessionRecord> expired(std::chrono::milliseconds timeout);
  bool remove(const std::string& session_id);

private:
  MetadataDb& db_;
};

} // namespace store
} // namespace tessera
