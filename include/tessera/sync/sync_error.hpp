#ifndef TESSERA_SYNC_ERROR_HPP
#define TESSERA_SYNC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tessera {
namespace sync {

class SyncError : public std::runtime_error {
public:
  explicit SyncError(const std::string& message)
    : std::runtime_error(message) {}
};

// Fingerprint does not match the session's stored fingerprint
class AuthenticationError : public SyncError {
public:
  explicit AuthenticationError(const std::string& message)
    : SyncError("Authentication error: " + message) {}
};

// Client and server disagree on session parameters such as chunk size
class ConfigurationError : public SyncError {
public:
  explicit ConfigurationError(const std::string& message)
    : SyncError("Configuration error: " + message) {}
};

} // namespace sync
} // namespace tessera

#endif // TESSERA_SYNC_ERROR_HPP
