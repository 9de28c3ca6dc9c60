#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "tessera/network/codec.hpp"
#include "test_utils.hpp"

using namespace tessera::network;

class CodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        tessera::test::quiet_logging(boost::log::trivial::fatal);
    }

    static Message through_frame(const Message& message) {
        const std::string frame = Codec::encode_frame(message);
        uint8_t header[Codec::HEADER_SIZE];
        std::copy(frame.begin(), frame.begin() + Codec::HEADER_SIZE, header);
        const uint32_t length = Codec::decode_header(header);
        EXPECT_EQ(length, frame.size() - Codec::HEADER_SIZE);
        return Codec::decode_body(frame.substr(Codec::HEADER_SIZE));
    }

    static ContentInfo sample_info() {
        ContentInfo info;
        info.content_id = "7f0c";
        info.content_type = "text/plain";
        info.name = "notes.txt";
        info.total_chunks = 3;
        info.total_size = 150000;
        info.iv = std::vector<uint8_t>(16, 0x3C);
        info.created_at = 1700000000123;
        info.pinned = true;
        return info;
    }
};

TEST_F(CodecTest, FrameLayoutIsBigEndian) {
    const std::string frame = Codec::encode_frame(Message::make(Ping{0x0102030405060708ULL}));
    const std::string expected("\x00\x00\x00\x09\x50\x01\x02\x03\x04\x05\x06\x07\x08", 13);
    EXPECT_EQ(frame, expected);
}

TEST_F(CodecTest, StringsCarryLengthPrefix) {
    const std::string frame = Codec::encode_frame(Message::make(RequestChunk{"ab", 7}));
    const std::string expected("\x00\x00\x00\x0b\x13\x00\x00\x00\x02" "ab" "\x00\x00\x00\x07", 15);
    EXPECT_EQ(frame, expected);
}

TEST_F(CodecTest, JoinRequestSurvivesFraming) {
    JoinRequest join;
    join.session_id = "room-1";
    join.fingerprint = std::vector<uint8_t>(32, 0xAB);
    join.chunk_size = 65536;
    join.client_name = "laptop";
    join.cached_ids = {"a", "b", "c"};

    const auto decoded = through_frame(Message::make(join));
    ASSERT_EQ(decoded.type, MessageType::JOIN);
    const auto& body = decoded.as<JoinRequest>();
    EXPECT_EQ(body.session_id, join.session_id);
    EXPECT_EQ(body.fingerprint, join.fingerprint);
    EXPECT_EQ(body.chunk_size, 65536u);
    EXPECT_EQ(body.client_name, "laptop");
    EXPECT_EQ(body.cached_ids, join.cached_ids);
}

TEST_F(CodecTest, ChunkMessageKeepsBinaryPayload) {
    ChunkMessage chunk;
    chunk.content_id = "c1";
    chunk.index = 2;
    chunk.total_chunks = 3;
    chunk.total_size = 150000;
    chunk.iv = std::vector<uint8_t>(16, 0x01);
    chunk.content_type = "application/octet-stream";
    chunk.name = "photo.jpg";
    chunk.data = {0x00, 0xFF, 0x00, 0x10, 0x0A, 0x0D};
    chunk.checksum = std::vector<uint8_t>(32, 0x77);

    const auto decoded = through_frame(Message::make(chunk)).as<ChunkMessage>();
    EXPECT_EQ(decoded.content_id, "c1");
    EXPECT_EQ(decoded.index, 2u);
    EXPECT_EQ(decoded.total_size, 150000u);
    EXPECT_EQ(decoded.iv, chunk.iv);
    EXPECT_EQ(decoded.data, chunk.data);
    EXPECT_EQ(decoded.checksum, chunk.checksum);
    EXPECT_EQ(decoded.name, "photo.jpg");
}

TEST_F(CodecTest, ContentPageCarriesInfos) {
    ContentPage page;
    page.total = 12;
    page.offset = 5;
    page.items = {sample_info(), sample_info()};
    page.items[1].content_id = "8e1d";
    page.items[1].pinned = false;

    const auto decoded = through_frame(Message::make(page)).as<ContentPage>();
    EXPECT_EQ(decoded.total, 12u);
    EXPECT_EQ(decoded.offset, 5u);
    ASSERT_EQ(decoded.items.size(), 2u);
    EXPECT_EQ(decoded.items[0].created_at, 1700000000123);
    EXPECT_TRUE(decoded.items[0].pinned);
    EXPECT_EQ(decoded.items[1].content_id, "8e1d");
    EXPECT_FALSE(decoded.items[1].pinned);
}

TEST_F(CodecTest, ErrorCodesAndEmptyBodies) {
    const auto result = through_frame(Message::make(JoinResult{false, ErrorCode::AUTHENTICATION,
                                                               "fingerprint mismatch", "", {}}));
    EXPECT_EQ(result.as<JoinResult>().error, ErrorCode::AUTHENTICATION);
    EXPECT_FALSE(result.as<JoinResult>().accepted);

    const auto rejected = through_frame(Message::make(ChunkErrorMessage{"c1", 4, ErrorCode::CHUNK_CONFLICT, "differs"}));
    EXPECT_EQ(rejected.as<ChunkErrorMessage>().code, ErrorCode::CHUNK_CONFLICT);

    EXPECT_EQ(through_frame(Message::make(HealthCheck{})).type, MessageType::HEALTH);
    EXPECT_EQ(through_frame(Message::make(SessionCleared{"room"})).as<SessionCleared>().session_id, "room");
}

TEST_F(CodecTest, RejectsUnknownType) {
    EXPECT_THROW(Codec::decode_body(std::string("\x7E", 1)), CodecError);
}

TEST_F(CodecTest, RejectsTruncatedBody) {
    const std::string frame = Codec::encode_frame(Message::make(RequestChunk{"content", 1}));
    const std::string body = frame.substr(Codec::HEADER_SIZE);
    EXPECT_THROW(Codec::decode_body(body.substr(0, body.size() - 2)), CodecError);
    EXPECT_THROW(Codec::decode_body(""), CodecError);
}

TEST_F(CodecTest, RejectsTrailingBytes) {
    const std::string frame = Codec::encode_frame(Message::make(Pong{1}));
    EXPECT_THROW(Codec::decode_body(frame.substr(Codec::HEADER_SIZE) + "x"), CodecError);
}

TEST_F(CodecTest, RejectsBadFieldValues) {
    // Boolean byte other than 0 or 1
    std::string pin("\x27\x00\x00\x00\x01" "a" "\x02", 7);
    EXPECT_THROW(Codec::decode_body(pin), CodecError);

    // Error code out of range
    std::string error("\xFF\x40\x00\x00\x00\x00", 6);
    EXPECT_THROW(Codec::decode_body(error), CodecError);

    // List count over the limit
    std::string members("\x02\x01\x00\x00\x00\x00\x00\x00\x00\x00\x00\xFF\xFF\xFF\xFF", 15);
    EXPECT_THROW(Codec::decode_body(members), CodecError);
}

TEST_F(CodecTest, RejectsInvalidFrameLengths) {
    const uint8_t zero[Codec::HEADER_SIZE] = {0, 0, 0, 0};
    EXPECT_THROW(Codec::decode_header(zero), CodecError);

    const uint8_t huge[Codec::HEADER_SIZE] = {0x01, 0x00, 0x00, 0x01};
    EXPECT_THROW(Codec::decode_header(huge), CodecError);

    const uint8_t ok[Codec::HEADER_SIZE] = {0x00, 0x00, 0x01, 0x00};
    EXPECT_EQ(Codec::decode_header(ok), 256u);
}

TEST_F(CodecTest, OversizedMessageIsRejectedOnEncode) {
    ChunkMessage chunk;
    chunk.content_id = "big";
    chunk.data.resize(Codec::MAX_FRAME_SIZE + 1);
    EXPECT_THROW(Codec::encode_frame(Message::make(chunk)), CodecError);
}

TEST_F(CodecTest, LargestChunkFitsInOneFrame) {
    ChunkMessage chunk;
    chunk.content_id = std::string(128, 'c');
    chunk.index = 7;
    chunk.total_chunks = 8;
    chunk.total_size = 8ULL * Codec::MAX_CHUNK_SIZE;
    chunk.iv = std::vector<uint8_t>(16, 0x11);
    chunk.content_type = "application/octet-stream";
    chunk.name = std::string(255, 'n');
    chunk.data.assign(Codec::MAX_CHUNK_SIZE, 0x42);
    chunk.checksum = std::vector<uint8_t>(32, 0x99);

    std::string frame;
    ASSERT_NO_THROW(frame = Codec::encode_frame(Message::make(chunk)));
    EXPECT_LE(frame.size() - Codec::HEADER_SIZE, Codec::MAX_FRAME_SIZE);
}

TEST_F(CodecTest, TypeNames) {
    EXPECT_EQ(to_string(MessageType::CONTENT_AVAILABLE), "content-available");
    EXPECT_EQ(to_string(MessageType::JOIN_RESULT), "join-result");
    EXPECT_EQ(to_string(ErrorCode::CHUNK_CONFLICT), "chunk-conflict");
}
