// tests/codec_test.cpp
// Unit tests for message and handshake encoding.

#include <gtest/gtest.h>
#include "codec.hpp"

#include <string>
#include <vector>

using namespace easyquery;
using namespace easyquery::codec;

namespace {

std::vector<uint8_t> server_message(ContentTypeToClient type, const std::string& text,
                                    uint32_t sequence = 7) {
    std::vector<uint8_t> buf;
    encode_message_into(buf, static_cast<uint8_t>(type), sequence, 1706000000000, text);
    return buf;
}

} // namespace

// ==================== Message layout ====================

TEST(CodecTest, MessageHeaderLayout) {
    std::vector<uint8_t> buf;
    encode_message_into(buf, ContentTypeToServer::Command, 0x01020304, 0x1122334455667788, "/hi");

    ASSERT_EQ(buf.size(), MESSAGE_HEADER_SIZE + 3);
    EXPECT_EQ(buf[0], 0);  // Command
    // Sequence, little-endian
    EXPECT_EQ(buf[1], 0x04);
    EXPECT_EQ(buf[2], 0x03);
    EXPECT_EQ(buf[3], 0x02);
    EXPECT_EQ(buf[4], 0x01);
    // Timestamp, little-endian
    EXPECT_EQ(buf[5], 0x88);
    EXPECT_EQ(buf[12], 0x11);
    EXPECT_EQ(std::string(buf.begin() + 13, buf.end()), "/hi");
}

TEST(CodecTest, CommandRoundTrip) {
    std::vector<uint8_t> buf;
    encode_message_into(buf, ContentTypeToServer::Command, 42, 1706000000000, "/ban 2 60 griefing");

    auto raw = decode_frame(buf.data(), buf.size());
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->content_type, static_cast<uint8_t>(ContentTypeToServer::Command));
    EXPECT_EQ(raw->sequence, 42u);
    EXPECT_EQ(raw->timestamp, 1706000000000);
    EXPECT_EQ(raw->payload, "/ban 2 60 griefing");
}

TEST(CodecTest, RawContentRoundTrip) {
    std::string content = "multi\nline \xC3\xA9 utf-8";
    std::vector<uint8_t> buf;
    encode_message_into(buf, ContentTypeToServer::RawContent, 1, 0, content);

    auto raw = decode_frame(buf.data(), buf.size());
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->content_type, static_cast<uint8_t>(ContentTypeToServer::RawContent));
    EXPECT_EQ(raw->payload, content);
}

TEST(CodecTest, EmptyPayload) {
    std::vector<uint8_t> buf;
    encode_message_into(buf, ContentTypeToServer::Command, 1, 0, "");
    EXPECT_EQ(buf.size(), MESSAGE_HEADER_SIZE);

    auto raw = decode_frame(buf.data(), buf.size());
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(raw->payload.empty());
}

TEST(CodecTest, NegativeTimestampSurvives) {
    std::vector<uint8_t> buf;
    encode_message_into(buf, ContentTypeToServer::Command, 1, -5, "x");
    auto raw = decode_frame(buf.data(), buf.size());
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->timestamp, -5);
}

// ==================== Classification ====================

TEST(CodecTest, DecodeConsoleLine) {
    auto buf = server_message(ContentTypeToClient::ConsoleString, "Round started");
    auto msg = decode_message(buf.data(), buf.size());
    EXPECT_EQ(msg.kind, MessageKind::ConsoleLine);
    EXPECT_EQ(msg.text, "Round started");
    EXPECT_EQ(msg.sequence, 7u);
}

TEST(CodecTest, DecodeRemoteAdminSuccess) {
    auto buf = server_message(ContentTypeToClient::RemoteAdminPlaintextResponse, "List of players (2)");
    auto msg = decode_message(buf.data(), buf.size());
    EXPECT_EQ(msg.kind, MessageKind::RemoteAdminSuccess);
    EXPECT_EQ(msg.text, "List of players (2)");
}

TEST(CodecTest, DecodeRemoteAdminFailure) {
    auto buf = server_message(ContentTypeToClient::RemoteAdminUnsuccessfulPlaintextResponse, "Unknown command!");
    auto msg = decode_message(buf.data(), buf.size());
    EXPECT_EQ(msg.kind, MessageKind::RemoteAdminFailure);
    EXPECT_EQ(msg.text, "Unknown command!");
}

TEST(CodecTest, DecodeCommandException) {
    auto buf = server_message(ContentTypeToClient::CommandException, "NullReferenceException");
    auto msg = decode_message(buf.data(), buf.size());
    EXPECT_EQ(msg.kind, MessageKind::CommandException);
    EXPECT_EQ(msg.text, "NullReferenceException");
}

TEST(CodecTest, SerializedResponseIsUnrecognized) {
    auto buf = server_message(ContentTypeToClient::RemoteAdminSerializedResponse, "\x01\x02");
    auto msg = decode_message(buf.data(), buf.size());
    EXPECT_EQ(msg.kind, MessageKind::Unrecognized);
    EXPECT_EQ(msg.content_type, 2);
}

TEST(CodecTest, UnknownTypeIsUnrecognized) {
    std::vector<uint8_t> buf;
    encode_message_into(buf, static_cast<uint8_t>(200), 1, 0, "future message");
    auto msg = decode_message(buf.data(), buf.size());
    EXPECT_EQ(msg.kind, MessageKind::Unrecognized);
    EXPECT_EQ(msg.content_type, 200);
}

TEST(CodecTest, TruncatedFrameIsUnrecognized) {
    auto buf = server_message(ContentTypeToClient::RemoteAdminPlaintextResponse, "x");
    for (size_t len = 0; len < MESSAGE_HEADER_SIZE; len++) {
        EXPECT_FALSE(decode_frame(buf.data(), len).has_value()) << "len=" << len;
        EXPECT_EQ(decode_message(buf.data(), len).kind, MessageKind::Unrecognized);
    }
}

TEST(CodecTest, DecodeNullWithZeroLength) {
    auto msg = decode_message(nullptr, 0);
    EXPECT_EQ(msg.kind, MessageKind::Unrecognized);
}

// ==================== Handshake ====================

TEST(CodecTest, HandshakeRequestLayout) {
    HandshakeRequest req;
    req.flags = ClientFlags::SubscribeServerConsole | ClientFlags::SpecifyLogUsername;
    req.permissions = 0x0102030405060708ULL;
    req.kick_power = 9;
    req.password = "pw";
    req.username = "bot";

    std::vector<uint8_t> buf;
    encode_handshake_request_into(buf, req);

    // version + flags + permissions + kick power + (2 + 2) + (2 + 3)
    ASSERT_EQ(buf.size(), 1u + 1 + 8 + 1 + 4 + 5);
    EXPECT_EQ(buf[0], PROTOCOL_VERSION);
    EXPECT_EQ(buf[1], 0x12);
    EXPECT_EQ(buf[2], 0x08);  // permissions LSB first
    EXPECT_EQ(buf[9], 0x01);
    EXPECT_EQ(buf[10], 9);
    EXPECT_EQ(buf[11], 2);    // password length
    EXPECT_EQ(buf[12], 0);
    EXPECT_EQ(buf[13], 'p');
    EXPECT_EQ(buf[15], 3);    // username length
}

TEST(CodecTest, HandshakeRequestRoundTrip) {
    HandshakeRequest req;
    req.flags = ClientFlags::SuppressCommandResponses;
    req.permissions = UINT64_MAX;
    req.kick_power = 255;
    req.password = "correct horse battery staple";

    std::vector<uint8_t> buf;
    encode_handshake_request_into(buf, req);
    auto decoded = decode_handshake_request(buf.data(), buf.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->flags, ClientFlags::SuppressCommandResponses);
    EXPECT_EQ(decoded->permissions, UINT64_MAX);
    EXPECT_EQ(decoded->kick_power, 255);
    EXPECT_EQ(decoded->password, req.password);
    EXPECT_TRUE(decoded->username.empty());
}

TEST(CodecTest, HandshakeReplyRoundTrip) {
    HandshakeReply reply;
    reply.status = HandshakeStatus::InvalidPassword;
    reply.max_packet_size = 4096;
    reply.reason = "wrong password";

    std::vector<uint8_t> buf;
    encode_handshake_reply_into(buf, reply);
    auto decoded = decode_handshake_reply(buf.data(), buf.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->version, PROTOCOL_VERSION);
    EXPECT_EQ(decoded->status, HandshakeStatus::InvalidPassword);
    EXPECT_EQ(decoded->max_packet_size, 4096);
    EXPECT_EQ(decoded->reason, "wrong password");
}

TEST(CodecTest, HandshakeReplyRejectsGarbage) {
    std::vector<uint8_t> short_buf = {0xde, 0xad};
    EXPECT_FALSE(decode_handshake_reply(short_buf.data(), short_buf.size()).has_value());

    HandshakeReply reply;
    std::vector<uint8_t> buf;
    encode_handshake_reply_into(buf, reply);

    // Unknown status byte
    auto bad_status = buf;
    bad_status[1] = 99;
    EXPECT_FALSE(decode_handshake_reply(bad_status.data(), bad_status.size()).has_value());

    // Trailing bytes
    auto trailing = buf;
    trailing.push_back(0);
    EXPECT_FALSE(decode_handshake_reply(trailing.data(), trailing.size()).has_value());

    // Reason length past the end
    auto overlong = buf;
    overlong[4] = 10;
    EXPECT_FALSE(decode_handshake_reply(overlong.data(), overlong.size()).has_value());
}

// ==================== Reader ====================

TEST(CodecTest, ReaderStopsAtEnd) {
    uint8_t data[3] = {1, 2, 3};
    Reader reader(data, sizeof(data));
    uint16_t v16 = 0;
    uint32_t v32 = 0xffffffff;
    EXPECT_TRUE(reader.read_u16(v16));
    EXPECT_EQ(v16, 0x0201);
    EXPECT_FALSE(reader.read_u32(v32));
    EXPECT_EQ(v32, 0xffffffffu);
    EXPECT_EQ(reader.remaining(), 1u);
}
