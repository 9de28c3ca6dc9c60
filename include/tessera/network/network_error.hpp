#ifndef TESSERA_NETWORK_ERROR_HPP
#define TESSERA_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tessera {
namespace network {

class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed, truncated or oversized frame
class CodecError : public NetworkError {
public:
    explicit CodecError(const std::string& message)
        : NetworkError("Codec error: " + message) {}
};

class ConnectionError : public NetworkError {
public:
    explicit ConnectionError(const std::string& message)
        : NetworkError("Connection error: " + message) {}
};

} // namespace network
} // namespace tessera

#endif // TESSERA_NETWORK_ERROR_HPP
