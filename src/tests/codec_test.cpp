#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "network/codec.hpp"
#include "network/message.hpp"

using namespace fts::network;

class CodecTest : public ::testing::Test {
protected:
  Codec codec;

  std::string encode(const Message& message) {
    std::ostringstream output;
    codec.serialize(message, output);
    return output.str();
  }

  Message decode(const std::string& frame) {
    std::istringstream input(frame);
    return codec.deserialize(input);
  }

  // Builds a frame by hand so malformed input can be fed to the decoder
  static std::string make_frame(uint8_t type, const std::string& body) {
    std::string frame;
    frame.push_back(static_cast<char>(type));
    uint32_t length = static_cast<uint32_t>(body.size());
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    return frame + body;
  }
};

TEST_F(CodecTest, StorageRequestWireLayout) {
  std::string frame = encode(StorageRequest{"ab", 0x0102030405060708ULL});

  std::string expected_body("\x00\x00\x00\x02" "ab" "\x01\x02\x03\x04\x05\x06\x07\x08", 14);
  EXPECT_EQ(frame, make_frame(1, expected_body));
}

TEST_F(CodecTest, EmptyMessageHasEmptyBody) {
  std::string frame = encode(Message{});
  ASSERT_EQ(frame.size(), Codec::HEADER_SIZE);
  EXPECT_EQ(frame, make_frame(0, ""));

  Message decoded = decode(frame);
  EXPECT_EQ(message_type(decoded), MessageType::EMPTY);
}

TEST_F(CodecTest, StorageRequestRoundTrip) {
  Message decoded = decode(encode(StorageRequest{"report.pdf", 123456789ULL}));

  ASSERT_TRUE(std::holds_alternative<StorageRequest>(decoded));
  const auto& request = std::get<StorageRequest>(decoded);
  EXPECT_EQ(request.file_name, "report.pdf");
  EXPECT_EQ(request.size, 123456789ULL);
}

TEST_F(CodecTest, RetrievalResponseRoundTrip) {
  Message decoded = decode(encode(RetrievalResponse{true, "Ready to send file", 42}));

  ASSERT_TRUE(std::holds_alternative<RetrievalResponse>(decoded));
  const auto& response = std::get<RetrievalResponse>(decoded);
  EXPECT_TRUE(response.ok);
  EXPECT_EQ(response.message, "Ready to send file");
  EXPECT_EQ(response.size, 42u);
}

TEST_F(CodecTest, ChecksumKeepsArbitraryBytes) {
  std::vector<uint8_t> checksum = {0x00, 0xFF, 0x10, 0x00, 0x7F};
  Message decoded = decode(encode(ChecksumVerification{checksum}));

  ASSERT_TRUE(std::holds_alternative<ChecksumVerification>(decoded));
  EXPECT_EQ(std::get<ChecksumVerification>(decoded).checksum, checksum);
}

TEST_F(CodecTest, ConsecutiveFramesDecodeInOrder) {
  std::stringstream stream;
  codec.serialize(RetrievalRequest{"first"}, stream);
  codec.serialize(Response{false, "File not found"}, stream);

  Message first = codec.deserialize(stream);
  Message second = codec.deserialize(stream);

  ASSERT_TRUE(std::holds_alternative<RetrievalRequest>(first));
  EXPECT_EQ(std::get<RetrievalRequest>(first).file_name, "first");
  ASSERT_TRUE(std::holds_alternative<Response>(second));
  EXPECT_FALSE(std::get<Response>(second).ok);
  EXPECT_EQ(std::get<Response>(second).message, "File not found");
}

TEST_F(CodecTest, TruncatedFrameThrows) {
  std::string frame = encode(StorageRequest{"truncated", 10});

  EXPECT_THROW(decode(frame.substr(0, 3)), CodecError);
  EXPECT_THROW(decode(frame.substr(0, frame.size() - 1)), CodecError);
}

TEST_F(CodecTest, UnknownTypeThrows) {
  EXPECT_THROW(decode(make_frame(9, "")), CodecError);
}

TEST_F(CodecTest, TrailingBodyBytesThrow) {
  std::string body("\x00\x00\x00\x01" "x" "extra", 10);
  EXPECT_THROW(decode(make_frame(2, body)), CodecError);
}

TEST_F(CodecTest, InvalidBooleanThrows) {
  std::string body("\x02\x00\x00\x00\x00", 5);
  EXPECT_THROW(decode(make_frame(3, body)), CodecError);
}

TEST_F(CodecTest, OversizedBodyLengthIsRejected) {
  uint8_t header[Codec::HEADER_SIZE] = {1, 0x00, 0x10, 0x00, 0x01};
  EXPECT_THROW(Codec::parse_body_length(header), CodecError);

  uint8_t valid[Codec::HEADER_SIZE] = {1, 0x00, 0x00, 0x01, 0x00};
  EXPECT_EQ(Codec::parse_body_length(valid), 256u);
}

TEST_F(CodecTest, OversizedMessageCannotBeSerialized) {
  std::ostringstream output;
  std::string huge_name(Codec::MAX_BODY_SIZE, 'n');
  EXPECT_THROW(codec.serialize(RetrievalRequest{huge_name}, output), CodecError);
}

TEST(MessageTest, TypeNames) {
  EXPECT_EQ(message_type(Message{StorageRequest{}}), MessageType::STORAGE_REQUEST);
  EXPECT_EQ(message_type(Message{ChecksumVerification{}}), MessageType::CHECKSUM_VERIFICATION);
  EXPECT_STREQ(message_type_to_string(MessageType::RETRIEVAL_RESPONSE), "RetrievalResponse");
}
