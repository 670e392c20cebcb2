// src/codec.hpp
// Query protocol message and handshake encoding: zero external dependencies.

#pragma once

#include "easyquery/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace easyquery {
namespace codec {

static constexpr uint8_t PROTOCOL_VERSION = 1;

// [u8 content type][u32 sequential number][i64 timestamp]
static constexpr size_t MESSAGE_HEADER_SIZE = 13;

// --- Helper functions (little-endian) ---

inline void write_u8(std::vector<uint8_t>& buf, uint8_t value) {
    buf.push_back(value);
}

inline void write_u16(std::vector<uint8_t>& buf, uint16_t value) {
    buf.push_back(static_cast<uint8_t>(value));
    buf.push_back(static_cast<uint8_t>(value >> 8));
}

inline void write_u32(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>(value));
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value >> 16));
    buf.push_back(static_cast<uint8_t>(value >> 24));
}

inline void write_u64(std::vector<uint8_t>& buf, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        buf.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void write_i64(std::vector<uint8_t>& buf, int64_t value) {
    write_u64(buf, static_cast<uint64_t>(value));
}

// Write [u16 length][bytes]. Callers validate the length beforehand.
inline void write_short_string(std::vector<uint8_t>& buf, const std::string& s) {
    uint16_t len = s.size() > UINT16_MAX ? UINT16_MAX : static_cast<uint16_t>(s.size());
    write_u16(buf, len);
    buf.insert(buf.end(), reinterpret_cast<const uint8_t*>(s.data()),
               reinterpret_cast<const uint8_t*>(s.data()) + len);
}

// Bounds-checked little-endian reader. Every read returns false once the
// input is exhausted and leaves the output untouched.
class Reader {
public:
    Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    bool read_u8(uint8_t& out) {
        if (remaining() < 1) return false;
        out = data_[pos_++];
        return true;
    }

    bool read_u16(uint16_t& out) {
        if (remaining() < 2) return false;
        out = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return true;
    }

    bool read_u32(uint32_t& out) {
        if (remaining() < 4) return false;
        uint32_t v = 0;
        for (int i = 3; i >= 0; i--) {
            v = (v << 8) | data_[pos_ + static_cast<size_t>(i)];
        }
        out = v;
        pos_ += 4;
        return true;
    }

    bool read_u64(uint64_t& out) {
        if (remaining() < 8) return false;
        uint64_t v = 0;
        for (int i = 7; i >= 0; i--) {
            v = (v << 8) | data_[pos_ + static_cast<size_t>(i)];
        }
        out = v;
        pos_ += 8;
        return true;
    }

    bool read_short_string(std::string& out) {
        uint16_t len = 0;
        size_t start = pos_;
        if (!read_u16(len)) return false;
        if (remaining() < len) {
            pos_ = start;
            return false;
        }
        out.assign(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return true;
    }

    // Consume everything that is left.
    std::string read_rest() {
        std::string out(reinterpret_cast<const char*>(data_ + pos_), remaining());
        pos_ = len_;
        return out;
    }

    size_t remaining() const noexcept { return len_ - pos_; }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

// --- Messages ---

// A frame body split into header fields and payload, before interpretation.
struct RawMessage {
    uint8_t content_type = 0;
    uint32_t sequence = 0;
    int64_t timestamp = 0;
    std::string payload;
};

enum class MessageKind : uint8_t {
    ConsoleLine,
    RemoteAdminSuccess,
    RemoteAdminFailure,
    CommandException,
    Unrecognized,
};

struct DecodedMessage {
    MessageKind kind = MessageKind::Unrecognized;
    uint8_t content_type = 0;
    uint32_t sequence = 0;
    std::string text;
};

// Encode one message body into buf.
inline void encode_message_into(std::vector<uint8_t>& buf, uint8_t content_type,
                                uint32_t sequence, int64_t timestamp,
                                const std::string& payload) {
    buf.reserve(buf.size() + MESSAGE_HEADER_SIZE + payload.size());
    write_u8(buf, content_type);
    write_u32(buf, sequence);
    write_i64(buf, timestamp);
    buf.insert(buf.end(), reinterpret_cast<const uint8_t*>(payload.data()),
               reinterpret_cast<const uint8_t*>(payload.data()) + payload.size());
}

inline void encode_message_into(std::vector<uint8_t>& buf, ContentTypeToServer content_type,
                                uint32_t sequence, int64_t timestamp,
                                const std::string& payload) {
    encode_message_into(buf, static_cast<uint8_t>(content_type), sequence, timestamp, payload);
}

// Split a frame body into header and payload. Empty if the header is truncated.
inline std::optional<RawMessage> decode_frame(const uint8_t* data, size_t len) {
    Reader reader(data, len);
    RawMessage msg;
    uint64_t ts = 0;
    if (!reader.read_u8(msg.content_type)) return std::nullopt;
    if (!reader.read_u32(msg.sequence)) return std::nullopt;
    if (!reader.read_u64(ts)) return std::nullopt;
    msg.timestamp = static_cast<int64_t>(ts);
    msg.payload = reader.read_rest();
    return msg;
}

// Interpret a server message. Reserved content types map to Unrecognized.
inline DecodedMessage classify(RawMessage raw) {
    DecodedMessage out;
    out.content_type = raw.content_type;
    out.sequence = raw.sequence;
    out.text = std::move(raw.payload);

    switch (static_cast<ContentTypeToClient>(raw.content_type)) {
        case ContentTypeToClient::ConsoleString:
            out.kind = MessageKind::ConsoleLine;
            break;
        case ContentTypeToClient::RemoteAdminPlaintextResponse:
            out.kind = MessageKind::RemoteAdminSuccess;
            break;
        case ContentTypeToClient::RemoteAdminUnsuccessfulPlaintextResponse:
            out.kind = MessageKind::RemoteAdminFailure;
            break;
        case ContentTypeToClient::CommandException:
            out.kind = MessageKind::CommandException;
            break;
        default:
            out.kind = MessageKind::Unrecognized;
            break;
    }
    return out;
}

// Never throws. Truncated frames come back as Unrecognized with empty text.
inline DecodedMessage decode_message(const uint8_t* data, size_t len) {
    auto raw = decode_frame(data, len);
    if (!raw) return DecodedMessage{};
    return classify(std::move(*raw));
}

// --- Handshake ---

struct HandshakeRequest {
    uint8_t version = PROTOCOL_VERSION;
    ClientFlags flags = ClientFlags::None;
    uint64_t permissions = UINT64_MAX;
    uint8_t kick_power = UINT8_MAX;
    std::string password;
    std::string username;  // empty = not specified
};

struct HandshakeReply {
    uint8_t version = PROTOCOL_VERSION;
    HandshakeStatus status = HandshakeStatus::Accepted;
    uint16_t max_packet_size = 0;
    std::string reason;
};

// [u8 version][u8 flags][u64 permissions][u8 kick power]
// [u16 len][password][u16 len][username]
inline void encode_handshake_request_into(std::vector<uint8_t>& buf, const HandshakeRequest& req) {
    write_u8(buf, req.version);
    write_u8(buf, static_cast<uint8_t>(req.flags));
    write_u64(buf, req.permissions);
    write_u8(buf, req.kick_power);
    write_short_string(buf, req.password);
    write_short_string(buf, req.username);
}

inline std::optional<HandshakeRequest> decode_handshake_request(const uint8_t* data, size_t len) {
    Reader reader(data, len);
    HandshakeRequest req;
    uint8_t flags = 0;
    if (!reader.read_u8(req.version)) return std::nullopt;
    if (!reader.read_u8(flags)) return std::nullopt;
    if (!reader.read_u64(req.permissions)) return std::nullopt;
    if (!reader.read_u8(req.kick_power)) return std::nullopt;
    if (!reader.read_short_string(req.password)) return std::nullopt;
    if (!reader.read_short_string(req.username)) return std::nullopt;
    if (reader.remaining() != 0) return std::nullopt;
    req.flags = static_cast<ClientFlags>(flags);
    return req;
}

// [u8 version][u8 status][u16 max packet size][u16 len][reason]
inline void encode_handshake_reply_into(std::vector<uint8_t>& buf, const HandshakeReply& reply) {
    write_u8(buf, reply.version);
    write_u8(buf, static_cast<uint8_t>(reply.status));
    write_u16(buf, reply.max_packet_size);
    write_short_string(buf, reply.reason);
}

// Empty on truncation, trailing bytes or an unknown status byte.
inline std::optional<HandshakeReply> decode_handshake_reply(const uint8_t* data, size_t len) {
    Reader reader(data, len);
    HandshakeReply reply;
    uint8_t status = 0;
    if (!reader.read_u8(reply.version)) return std::nullopt;
    if (!reader.read_u8(status)) return std::nullopt;
    if (status > static_cast<uint8_t>(HandshakeStatus::Rejected)) return std::nullopt;
    if (!reader.read_u16(reply.max_packet_size)) return std::nullopt;
    if (!reader.read_short_string(reply.reason)) return std::nullopt;
    if (reader.remaining() != 0) return std::nullopt;
    reply.status = static_cast<HandshakeStatus>(status);
    return reply;
}

} // namespace codec
} // namespace easyquery
