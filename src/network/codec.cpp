#include "tessera/network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <sstream>

namespace tessera {
namespace network {

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t Codec::serialize(const Message& message, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw CodecError("invalid output stream");
  }

  std::ostringstream body;
  write_u8(body, static_cast<uint8_t>(message.type));
  std::visit([&body](const auto& typed) { write_body(body, typed); }, message.body);

  const std::string bytes = body.str();
  if (bytes.size() > MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Message of " << bytes.size() << " bytes exceeds frame limit";
    throw CodecError("frame exceeds " + std::to_string(MAX_FRAME_SIZE) + " bytes");
  }
  write_bytes(output, bytes.data(), bytes.size());

  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized " << to_string(message.type) << " (" << bytes.size() << " bytes)";
  return bytes.size();
}

Message Codec::deserialize(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw CodecError("invalid input stream");
  }

  const auto type = static_cast<MessageType>(read_u8(input));
  Message message;

  switch (type) {
    case MessageType::JOIN: {
      JoinRequest body;
      body.session_id = read_string(input);
      body.fingerprint = read_blob(input);
      body.chunk_size = read_u32(input);
      body.client_name = read_string(input);
      body.cached_ids = read_strings(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::JOIN_RESULT: {
      JoinResult body;
      body.accepted = read_bool(input);
      body.error = read_error_code(input);
      body.reason = read_string(input);
      body.client_id = read_string(input);
      body.members = read_strings(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::CLIENT_JOINED: {
      ClientJoined body;
      body.client_id = read_string(input);
      body.client_name = read_string(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::CLIENT_LEFT: {
      ClientLeft body;
      body.client_id = read_string(input);
      body.client_name = read_string(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::CHUNK: {
      ChunkMessage body;
      body.content_id = read_string(input);
      body.index = read_u32(input);
      body.total_chunks = read_u32(input);
      body.total_size = read_u64(input);
      body.iv = read_blob(input);
      body.content_type = read_string(input);
      body.name = read_string(input);
      body.data = read_blob(input);
      body.checksum = read_blob(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::CHUNK_ACK: {
      ChunkAck body;
      body.content_id = read_string(input);
      body.index = read_u32(input);
      body.duplicate = read_bool(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::CHUNK_ERROR: {
      ChunkErrorMessage body;
      body.content_id = read_string(input);
      body.index = read_u32(input);
      body.code = read_error_code(input);
      body.reason = read_string(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::REQUEST_CHUNK: {
      RequestChunk body;
      body.content_id = read_string(input);
      body.index = read_u32(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::CONTENT_AVAILABLE:
      message = Message::make(ContentAvailable{read_info(input)});
      break;
    case MessageType::CONTENT_REMOVED:
      message = Message::make(ContentRemoved{read_string(input)});
      break;
    case MessageType::CONTENT_UPDATED:
      message = Message::make(ContentUpdated{read_info(input)});
      break;
    case MessageType::LIST_CONTENT: {
      ListContent body;
      body.offset = read_u32(input);
      body.limit = read_u32(input);
      message = Message::make(body);
      break;
    }
    case MessageType::CONTENT_PAGE: {
      ContentPage body;
      body.total = read_u64(input);
      body.offset = read_u32(input);
      const uint32_t count = read_u32(input);
      if (count > MAX_LIST_SIZE) {
        throw CodecError("content page of " + std::to_string(count) + " items");
      }
      for (uint32_t i = 0; i < count; ++i) {
        body.items.push_back(read_info(input));
      }
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::REMOVE_CONTENT:
      message = Message::make(RemoveContent{read_string(input)});
      break;
    case MessageType::RENAME_CONTENT: {
      RenameContent body;
      body.content_id = read_string(input);
      body.name = read_string(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::PIN_CONTENT: {
      PinContent body;
      body.content_id = read_string(input);
      body.pinned = read_bool(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::CLEAR_ALL:
      message = Message::make(ClearAll{read_string(input)});
      break;
    case MessageType::SESSION_CLEARED:
      message = Message::make(SessionCleared{read_string(input)});
      break;
    case MessageType::SESSION_EXPIRED:
      message = Message::make(SessionExpired{read_string(input)});
      break;
    case MessageType::PING:
      message = Message::make(Ping{read_u64(input)});
      break;
    case MessageType::PONG:
      message = Message::make(Pong{read_u64(input)});
      break;
    case MessageType::HEALTH:
      message = Message::make(HealthCheck{});
      break;
    case MessageType::HEALTH_STATUS: {
      HealthStatus body;
      body.healthy = read_bool(input);
      body.detail = read_string(input);
      message = Message::make(std::move(body));
      break;
    }
    case MessageType::ERROR: {
      ErrorMessage body;
      body.code = read_error_code(input);
      body.reason = read_string(input);
      message = Message::make(std::move(body));
      break;
    }
    default:
      BOOST_LOG_TRIVIAL(warning) << "Codec: Unknown message type " << static_cast<int>(type);
      throw CodecError("unknown message type " + std::to_string(static_cast<int>(type)));
  }

  if (input.peek() != std::char_traits<char>::eof()) {
    throw CodecError("trailing bytes after " + to_string(type));
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Deserialized " << to_string(type);
  return message;
}

//==============================================
// FRAMING
//==============================================

std::string Codec::encode_frame(const Message& message) {
  std::ostringstream body;
  serialize(message, body);
  const std::string bytes = body.str();

  std::string frame;
  frame.reserve(HEADER_SIZE + bytes.size());
  const uint32_t length = boost::endian::native_to_big(static_cast<uint32_t>(bytes.size()));
  frame.append(reinterpret_cast<const char*>(&length), sizeof(length));
  frame.append(bytes);
  return frame;
}

uint32_t Codec::decode_header(const uint8_t (&header)[HEADER_SIZE]) {
  uint32_t length = 0;
  std::memcpy(&length, header, sizeof(length));
  length = boost::endian::big_to_native(length);
  if (length == 0 || length > MAX_FRAME_SIZE) {
    throw CodecError("invalid frame length " + std::to_string(length));
  }
  return length;
}

Message Codec::decode_body(const std::string& body) {
  std::istringstream input(body);
  return deserialize(input);
}

//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw CodecError("failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Failed to read " << size << " bytes from input stream";
    throw CodecError("truncated message");
  }
}

//==============================================
// FIELD ENCODING
//==============================================

void Codec::write_u8(std::ostream& output, uint8_t value) {
  write_bytes(output, &value, sizeof(value));
}

void Codec::write_u32(std::ostream& output, uint32_t value) {
  const uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

void Codec::write_u64(std::ostream& output, uint64_t value) {
  const uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

void Codec::write_string(std::ostream& output, const std::string& value) {
  write_u32(output, static_cast<uint32_t>(value.size()));
  write_bytes(output, value.data(), value.size());
}

void Codec::write_blob(std::ostream& output, const std::vector<uint8_t>& value) {
  write_u32(output, static_cast<uint32_t>(value.size()));
  write_bytes(output, value.data(), value.size());
}

void Codec::write_strings(std::ostream& output, const std::vector<std::string>& values) {
  write_u32(output, static_cast<uint32_t>(values.size()));
  for (const auto& value : values) {
    write_string(output, value);
  }
}

void Codec::write_info(std::ostream& output, const ContentInfo& info) {
  write_string(output, info.content_id);
  write_string(output, info.content_type);
  write_string(output, info.name);
  write_u32(output, info.total_chunks);
  write_u64(output, info.total_size);
  write_blob(output, info.iv);
  write_u64(output, static_cast<uint64_t>(info.created_at));
  write_bool(output, info.pinned);
}

//==============================================
// FIELD DECODING
//==============================================

uint8_t Codec::read_u8(std::istream& input) {
  uint8_t value = 0;
  read_bytes(input, &value, sizeof(value));
  return value;
}

uint32_t Codec::read_u32(std::istream& input) {
  uint32_t value = 0;
  read_bytes(input, &value, sizeof(value));
  return boost::endian::big_to_native(value);
}

uint64_t Codec::read_u64(std::istream& input) {
  uint64_t value = 0;
  read_bytes(input, &value, sizeof(value));
  return boost::endian::big_to_native(value);
}

bool Codec::read_bool(std::istream& input) {
  const uint8_t value = read_u8(input);
  if (value > 1) {
    throw CodecError("invalid boolean " + std::to_string(value));
  }
  return value == 1;
}

std::string Codec::read_string(std::istream& input) {
  const uint32_t size = read_u32(input);
  if (size > MAX_FRAME_SIZE) {
    throw CodecError("field of " + std::to_string(size) + " bytes");
  }
  std::string value(size, '\0');
  read_bytes(input, value.data(), size);
  return value;
}

std::vector<uint8_t> Codec::read_blob(std::istream& input) {
  const uint32_t size = read_u32(input);
  if (size > MAX_FRAME_SIZE) {
    throw CodecError("field of " + std::to_string(size) + " bytes");
  }
  std::vector<uint8_t> value(size);
  read_bytes(input, value.data(), size);
  return value;
}

std::vector<std::string> Codec::read_strings(std::istream& input) {
  const uint32_t count = read_u32(input);
  if (count > MAX_LIST_SIZE) {
    throw CodecError("list of " + std::to_string(count) + " entries");
  }
  std::vector<std::string> values;
  values.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    values.push_back(read_string(input));
  }
  return values;
}

ContentInfo Codec::read_info(std::istream& input) {
  ContentInfo info;
  info.content_id = read_string(input);
  info.content_type = read_string(input);
  info.name = read_string(input);
  info.total_chunks = read_u32(input);
  info.total_size = read_u64(input);
  info.iv = read_blob(input);
  info.created_at = static_cast<int64_t>(read_u64(input));
  info.pinned = read_bool(input);
  return info;
}

ErrorCode Codec::read_error_code(std::istream& input) {
  const uint8_t value = read_u8(input);
  if (value > static_cast<uint8_t>(ErrorCode::PROTOCOL)) {
    throw CodecError("unknown error code " + std::to_string(value));
  }
  return static_cast<ErrorCode>(value);
}

//==============================================
// BODY ENCODING
//==============================================

void Codec::write_body(std::ostream& output, const JoinRequest& body) {
  write_string(output, body.session_id);
  write_blob(output, body.fingerprint);
  write_u32(output, body.chunk_size);
  write_string(output, body.client_name);
  write_strings(output, body.cached_ids);
}

void Codec::write_body(std::ostream& output, const JoinResult& body) {
  write_bool(output, body.accepted);
  write_u8(output, static_cast<uint8_t>(body.error));
  write_string(output, body.reason);
  write_string(output, body.client_id);
  write_strings(output, body.members);
}

void Codec::write_body(std::ostream& output, const ClientJoined& body) {
  write_string(output, body.client_id);
  write_string(output, body.client_name);
}

void Codec::write_body(std::ostream& output, const ClientLeft& body) {
  write_string(output, body.client_id);
  write_string(output, body.client_name);
}

void Codec::write_body(std::ostream& output, const ChunkMessage& body) {
  write_string(output, body.content_id);
  write_u32(output, body.index);
  write_u32(output, body.total_chunks);
  write_u64(output, body.total_size);
  write_blob(output, body.iv);
  write_string(output, body.content_type);
  write_string(output, body.name);
  write_blob(output, body.data);
  write_blob(output, body.checksum);
}

void Codec::write_body(std::ostream& output, const ChunkAck& body) {
  write_string(output, body.content_id);
  write_u32(output, body.index);
  write_bool(output, body.duplicate);
}

void Codec::write_body(std::ostream& output, const ChunkErrorMessage& body) {
  write_string(output, body.content_id);
  write_u32(output, body.index);
  write_u8(output, static_cast<uint8_t>(body.code));
  write_string(output, body.reason);
}

void Codec::write_body(std::ostream& output, const RequestChunk& body) {
  write_string(output, body.content_id);
  write_u32(output, body.index);
}

void Codec::write_body(std::ostream& output, const ContentAvailable& body) {
  write_info(output, body.info);
}

void Codec::write_body(std::ostream& output, const ContentRemoved& body) {
  write_string(output, body.content_id);
}

void Codec::write_body(std::ostream& output, const ContentUpdated& body) {
  write_info(output, body.info);
}

void Codec::write_body(std::ostream& output, const ListContent& body) {
  write_u32(output, body.offset);
  write_u32(output, body.limit);
}

void Codec::write_body(std::ostream& output, const ContentPage& body) {
  write_u64(output, body.total);
  write_u32(output, body.offset);
  write_u32(output, static_cast<uint32_t>(body.items.size()));
  for (const auto& info : body.items) {
    write_info(output, info);
  }
}

void Codec::write_body(std::ostream& output, const RemoveContent& body) {
  write_string(output, body.content_id);
}

void Codec::write_body(std::ostream& output, const RenameContent& body) {
  write_string(output, body.content_id);
  write_string(output, body.name);
}

void Codec::write_body(std::ostream& output, const PinContent& body) {
  write_string(output, body.content_id);
  write_bool(output, body.pinned);
}

void Codec::write_body(std::ostream& output, const ClearAll& body) {
  write_string(output, body.session_id);
}

void Codec::write_body(std::ostream& output, const SessionCleared& body) {
  write_string(output, body.session_id);
}

void Codec::write_body(std::ostream& output, const SessionExpired& body) {
  write_string(output, body.session_id);
}

void Codec::write_body(std::ostream& output, const Ping& body) {
  write_u64(output, body.nonce);
}

void Codec::write_body(std::ostream& output, const Pong& body) {
  write_u64(output, body.nonce);
}

void Codec::write_body(std::ostream&, const HealthCheck&) {}

void Codec::write_body(std::ostream& output, const HealthStatus& body) {
  write_bool(output, body.healthy);
  write_string(output, body.detail);
}

void Codec::write_body(std::ostream& output, const ErrorMessage& body) {
  write_u8(output, static_cast<uint8_t>(body.code));
  write_string(output, body.reason);
}

} // namespace network
} // namespace tessera
