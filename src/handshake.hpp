// src/handshake.hpp
// Authentication and capability exchange performed right after connect.

#pragma once

#include "codec.hpp"
#include "transport.hpp"
#include "easyquery/config.hpp"

#include <cstdint>

namespace easyquery {

// What the server granted for this connection.
struct NegotiatedSession {
    uint16_t max_packet_size = 0;
};

// Build the handshake request for a config.
codec::HandshakeRequest make_handshake_request(const QueryConfig& config);

// Send the handshake on a connected transport and wait for the reply.
//
// Throws QueryError:
//   Authentication    : server rejected the password
//   HandshakeProtocol : malformed, unexpected or missing reply
//   Network           : the handshake frame could not be sent
NegotiatedSession negotiate(TcpTransport& transport, const QueryConfig& config);

} // namespace easyquery
