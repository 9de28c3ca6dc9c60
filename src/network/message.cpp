#include "tessera/network/message.hpp"

namespace tessera {
namespace network {

std::string to_string(MessageType type) {
    switch (type) {
        case MessageType::JOIN:              return "join";
        case MessageType::JOIN_RESULT:       return "join-result";
        case MessageType::CHUNK:             return "chunk";
        case MessageType::CHUNK_ACK:         return "chunk-ack";
        case MessageType::CHUNK_ERROR:       return "chunk-error";
        case MessageType::REQUEST_CHUNK:     return "request-chunk";
        case MessageType::CONTENT_AVAILABLE: return "content-available";
        case MessageType::CONTENT_REMOVED:   return "content-removed";
        case MessageType::CONTENT_UPDATED:   return "content-updated";
        case MessageType::CONTENT_PAGE:      return "content-page";
        case MessageType::LIST_CONTENT:      return "list-content";
        case MessageType::REMOVE_CONTENT:    return "remove-content";
        case MessageType::RENAME_CONTENT:    return "rename-content";
        case MessageType::PIN_CONTENT:       return "pin-content";
        case MessageType::CLEAR_ALL:         return "clear-all";
        case MessageType::SESSION_CLEARED:   return "session-cleared";
        case MessageType::SESSION_EXPIRED:   return "session-expired";
        case MessageType::CLIENT_JOINED:     return "client-joined";
        case MessageType::CLIENT_LEFT:       return "client-left";
        case MessageType::PING:              return "ping";
        case MessageType::PONG:              return "pong";
        case MessageType::HEALTH:            return "health";
        case MessageType::HEALTH_STATUS:     return "health-status";
        case MessageType::ERROR:             return "error";
    }
    return "unknown";
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:           return "none";
        case ErrorCode::AUTHENTICATION: return "authentication";
        case ErrorCode::CONFIGURATION:  return "configuration";
        case ErrorCode::CHUNK_CONFLICT: return "chunk-conflict";
        case ErrorCode::INVALID_CHUNK:  return "invalid-chunk";
        case ErrorCode::NOT_FOUND:      return "not-found";
        case ErrorCode::STORAGE:        return "storage";
        case ErrorCode::PROTOCOL:       return "protocol";
    }
    return "unknown";
}

} // namespace network
} // namespace tessera
