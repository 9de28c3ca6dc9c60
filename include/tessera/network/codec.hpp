#ifndef TESSERA_NETWORK_CODEC_HPP
#define TESSERA_NETWORK_CODEC_HPP

#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "tessera/network/message.hpp"
#include "tessera/network/network_error.hpp"

namespace tessera {
namespace network {

/**
 * Binary wire format.
 *
 * Frame: u32 body length (big endian) | body. Body: u8 message type | fields.
 * Integers are big endian, strings and byte fields carry a u32 length prefix,
 * lists a u32 element count. Anything malformed throws CodecError.
 */
class Codec {
public:
  static constexpr uint32_t HEADER_SIZE = sizeof(uint32_t);
  static constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;
  static constexpr uint32_t MAX_LIST_SIZE = 4096;
  // Largest chunk payload that still fits a frame beside the other chunk fields
  static constexpr uint32_t MAX_CHUNK_SIZE = MAX_FRAME_SIZE - 64 * 1024;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes the body of a message (type and fields), returns bytes written
  static std::size_t serialize(const Message& message, std::ostream& output);
  // Reads one body, the stream must hold exactly one body
  static Message deserialize(std::istream& input);

  // ---- FRAMING ----
  // Length prefixed frame ready for the socket
  static std::string encode_frame(const Message& message);
  // Parses the length prefix, throws CodecError when it exceeds MAX_FRAME_SIZE
  static uint32_t decode_header(const uint8_t (&header)[HEADER_SIZE]);
  static Message decode_body(const std::string& body);

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  // ---- FIELD ENCODING ----
  static void write_u8(std::ostream& output, uint8_t value);
  static void write_u32(std::ostream& output, uint32_t value);
  static void write_u64(std::ostream& output, uint64_t value);
  static void write_bool(std::ostream& output, bool value) { write_u8(output, value ? 1 : 0); }
  static void write_string(std::ostream& output, const std::string& value);
  static void write_blob(std::ostream& output, const std::vector<uint8_t>& value);
  static void write_strings(std::ostream& output, const std::vector<std::string>& values);
  static void write_info(std::ostream& output, const ContentInfo& info);

  // ---- FIELD DECODING ----
  static uint8_t read_u8(std::istream& input);
  static uint32_t read_u32(std::istream& input);
  static uint64_t read_u64(std::istream& input);
  static bool read_bool(std::istream& input);
  static std::string read_string(std::istream& input);
  static std::vector<uint8_t> read_blob(std::istream& input);
  static std::vector<std::string> read_strings(std::istream& input);
  static ContentInfo read_info(std::istream& input);
  static ErrorCode read_error_code(std::istream& input);

  // ---- BODY ENCODING ----
  static void write_body(std::ostream& output, const JoinRequest& body);
  static void write_body(std::ostream& output, const JoinResult& body);
  static void write_body(std::ostream& output, const ClientJoined& body);
  static void write_body(std::ostream& output, const ClientLeft& body);
  static void write_body(std::ostream& output, const ChunkMessage& body);
  static void write_body(std::ostream& output, const ChunkAck& body);
  static void write_body(std::ostream& output, const ChunkErrorMessage& body);
  static void write_body(std::ostream& output, const RequestChunk& body);
  static void write_body(std::ostream& output, const ContentAvailable& body);
  static void write_body(std::ostream& output, const ContentRemoved& body);
  static void write_body(std::ostream& output, const ContentUpdated& body);
  static void write_body(std::ostream& output, const ListContent& body);
  static void write_body(std::ostream& output, const ContentPage& body);
  static void write_body(std::ostream& output, const RemoveContent& body);
  static void write_body(std::ostream& output, const RenameContent& body);
  static void write_body(std::ostream& output, const PinContent& body);
  static void write_body(std::ostream& output, const ClearAll& body);
  static void write_body(std::ostream& output, const SessionCleared& body);
  static void write_body(std::ostream& output, const SessionExpired& body);
  static void write_body(std::ostream& output, const Ping& body);
  static void write_body(std::ostream& output, const Pong& body);
  static void write_body(std::ostream& output, const HealthCheck& body);
  static void write_body(std::ostream& output, const HealthStatus& body);
  static void write_body(std::ostream& output, const ErrorMessage& body);
};

} // namespace network
} // namespace tessera

#endif // TESSERA_NETWORK_CODEC_HPP
