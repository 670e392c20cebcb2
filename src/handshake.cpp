// src/handshake.cpp
// Handshake request/reply exchange.

#include "handshake.hpp"

#include <vector>

namespace easyquery {

codec::HandshakeRequest make_handshake_request(const QueryConfig& config) {
    codec::HandshakeRequest req;
    req.flags = config.flags();
    req.permissions = config.permissions();
    req.kick_power = config.kick_power();
    req.password = config.password();
    if (config.username()) {
        req.username = *config.username();
    }
    return req;
}

NegotiatedSession negotiate(TcpTransport& transport, const QueryConfig& config) {
    std::vector<uint8_t> buf;
    codec::encode_handshake_request_into(buf, make_handshake_request(config));
    if (!transport.send_frame(buf.data(), buf.size())) {
        throw QueryError::network("failed to send handshake");
    }

    buf.clear();
    switch (transport.receive_frame(buf, config.handshake_timeout())) {
        case ReceiveStatus::Frame:
            break;
        case ReceiveStatus::Timeout:
            throw QueryError::handshake_protocol("no reply within " +
                std::to_string(config.handshake_timeout().count()) + "ms");
        case ReceiveStatus::Closed:
            throw QueryError::handshake_protocol("server closed the connection during handshake");
        case ReceiveStatus::NetworkError:
            throw QueryError::handshake_protocol("connection failed during handshake");
        case ReceiveStatus::ProtocolError:
            throw QueryError::handshake_protocol("oversized handshake reply");
    }

    auto reply = codec::decode_handshake_reply(buf.data(), buf.size());
    if (!reply) {
        throw QueryError::handshake_protocol("malformed handshake reply");
    }
    if (reply->version != codec::PROTOCOL_VERSION) {
        throw QueryError::handshake_protocol("unsupported protocol version " +
            std::to_string(reply->version));
    }

    switch (reply->status) {
        case HandshakeStatus::Accepted:
            break;
        case HandshakeStatus::InvalidPassword:
            throw QueryError::authentication(reply->reason.empty() ? "invalid password" : reply->reason);
        case HandshakeStatus::UnsupportedVersion:
            throw QueryError::handshake_protocol("server does not support protocol version " +
                std::to_string(codec::PROTOCOL_VERSION));
        case HandshakeStatus::Rejected:
            throw QueryError::handshake_protocol("rejected by server" +
                (reply->reason.empty() ? std::string() : ": " + reply->reason));
    }

    NegotiatedSession session;
    session.max_packet_size = reply->max_packet_size;
    return session;
}

} // namespace easyquery
