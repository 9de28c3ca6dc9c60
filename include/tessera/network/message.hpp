#ifndef TESSERA_NETWORK_MESSAGE_HPP
#define TESSERA_NETWORK_MESSAGE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tessera {
namespace network {

// Message type, first byte of every frame body
enum class MessageType : uint8_t {
    JOIN = 0x01,
    JOIN_RESULT = 0x02,
    CHUNK = 0x10,
    CHUNK_ACK = 0x11,
    CHUNK_ERROR = 0x12,
    REQUEST_CHUNK = 0x13,
    CONTENT_AVAILABLE = 0x20,
    CONTENT_REMOVED = 0x21,
    CONTENT_UPDATED = 0x22,
    CONTENT_PAGE = 0x23,
    LIST_CONTENT = 0x24,
    REMOVE_CONTENT = 0x25,
    RENAME_CONTENT = 0x26,
    PIN_CONTENT = 0x27,
    CLEAR_ALL = 0x30,
    SESSION_CLEARED = 0x31,
    SESSION_EXPIRED = 0x32,
    CLIENT_JOINED = 0x40,
    CLIENT_LEFT = 0x41,
    PING = 0x50,
    PONG = 0x51,
    HEALTH = 0x52,
    HEALTH_STATUS = 0x53,
    ERROR = 0xFF
};

// Error codes carried in join results, chunk errors and error messages
enum class ErrorCode : uint8_t {
    NONE = 0,
    AUTHENTICATION,
    CONFIGURATION,
    CHUNK_CONFLICT,
    INVALID_CHUNK,
    NOT_FOUND,
    STORAGE,
    PROTOCOL
};

std::string to_string(MessageType type);
std::string to_string(ErrorCode code);

// Metadata announced for finalized content
struct ContentInfo {
    std::string content_id;
    std::string content_type;
    std::string name;
    uint32_t total_chunks = 0;
    uint64_t total_size = 0;
    std::vector<uint8_t> iv;
    int64_t created_at = 0;
    bool pinned = false;
};

// ---- SESSION MEMBERSHIP ----
struct JoinRequest {
    static constexpr MessageType TYPE = MessageType::JOIN;
    std::string session_id;
    std::vector<uint8_t> fingerprint;
    uint32_t chunk_size = 0;
    std::string client_name;
    std::vector<std::string> cached_ids;
};

struct JoinResult {
    static constexpr MessageType TYPE = MessageType::JOIN_RESULT;
    bool accepted = false;
    ErrorCode error = ErrorCode::NONE;
    std::string reason;
    std::string client_id;
    std::vector<std::string> members;
};

struct ClientJoined {
    static constexpr MessageType TYPE = MessageType::CLIENT_JOINED;
    std::string client_id;
    std::string client_name;
};

struct ClientLeft {
    static constexpr MessageType TYPE = MessageType::CLIENT_LEFT;
    std::string client_id;
    std::string client_name;
};

// ---- CHUNK TRANSFER ----
struct ChunkMessage {
    static constexpr MessageType TYPE = MessageType::CHUNK;
    std::string content_id;
    uint32_t index = 0;
    uint32_t total_chunks = 0;
    uint64_t total_size = 0;
    std::vector<uint8_t> iv;
    std::string content_type;
    std::string name;
    std::vector<uint8_t> data;
    std::vector<uint8_t> checksum;
};

struct ChunkAck {
    static constexpr MessageType TYPE = MessageType::CHUNK_ACK;
    std::string content_id;
    uint32_t index = 0;
    bool duplicate = false;
};

struct ChunkErrorMessage {
    static constexpr MessageType TYPE = MessageType::CHUNK_ERROR;
    std::string content_id;
    uint32_t index = 0;
    ErrorCode code = ErrorCode::NONE;
    std::string reason;
};

struct RequestChunk {
    static constexpr MessageType TYPE = MessageType::REQUEST_CHUNK;
    std::string content_id;
    uint32_t index = 0;
};

// ---- CONTENT INDEX ----
struct ContentAvailable {
    static constexpr MessageType TYPE = MessageType::CONTENT_AVAILABLE;
    ContentInfo info;
};

struct ContentRemoved {
    static constexpr MessageType TYPE = MessageType::CONTENT_REMOVED;
    std::string content_id;
};

struct ContentUpdated {
    static constexpr MessageType TYPE = MessageType::CONTENT_UPDATED;
    ContentInfo info;
};

struct ListContent {
    static constexpr MessageType TYPE = MessageType::LIST_CONTENT;
    uint32_t offset = 0;
    uint32_t limit = 0;
};

struct ContentPage {
    static constexpr MessageType TYPE = MessageType::CONTENT_PAGE;
    uint64_t total = 0;
    uint32_t offset = 0;
    std::vector<ContentInfo> items;
};

struct RemoveContent {
    static constexpr MessageType TYPE = MessageType::REMOVE_CONTENT;
    std::string content_id;
};

struct RenameContent {
    static constexpr MessageType TYPE = MessageType::RENAME_CONTENT;
    std::string content_id;
    std::string name;
};

struct PinContent {
    static constexpr MessageType TYPE = MessageType::PIN_CONTENT;
    std::string content_id;
    bool pinned = false;
};

struct ClearAll {
    static constexpr MessageType TYPE = MessageType::CLEAR_ALL;
    std::string session_id;
};

struct SessionCleared {
    static constexpr MessageType TYPE = MessageType::SESSION_CLEARED;
    std::string session_id;
};

struct SessionExpired {
    static constexpr MessageType TYPE = MessageType::SESSION_EXPIRED;
    std::string session_id;
};

// ---- LIVENESS ----
struct Ping {
    static constexpr MessageType TYPE = MessageType::PING;
    uint64_t nonce = 0;
};

struct Pong {
    static constexpr MessageType TYPE = MessageType::PONG;
    uint64_t nonce = 0;
};

struct HealthCheck {
    static constexpr MessageType TYPE = MessageType::HEALTH;
};

struct HealthStatus {
    static constexpr MessageType TYPE = MessageType::HEALTH_STATUS;
    bool healthy = false;
    std::string detail;
};

struct ErrorMessage {
    static constexpr MessageType TYPE = MessageType::ERROR;
    ErrorCode code = ErrorCode::NONE;
    std::string reason;
};

using MessageBody = std::variant<
    JoinRequest, JoinResult, ClientJoined, ClientLeft,
    ChunkMessage, ChunkAck, ChunkErrorMessage, RequestChunk,
    ContentAvailable, ContentRemoved, ContentUpdated, ListContent, ContentPage,
    RemoveContent, RenameContent, PinContent,
    ClearAll, SessionCleared, SessionExpired,
    Ping, Pong, HealthCheck, HealthStatus, ErrorMessage>;

// Typed message: the type tag always matches the active body alternative
struct Message {
    MessageType type = MessageType::ERROR;
    MessageBody body = ErrorMessage{};

    template <typename T>
    static Message make(T body) {
        return Message{T::TYPE, MessageBody(std::move(body))};
    }

    template <typename T>
    const T& as() const { return std::get<T>(body); }
};

} // namespace network
} // namespace tessera

#endif // TESSERA_NETWORK_MESSAGE_HPP
