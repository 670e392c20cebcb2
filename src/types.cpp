// src/types.cpp
// String names for protocol enums, used in logs and error messages.

#include "easyquery/types.hpp"

namespace easyquery {

const char* to_string(DisconnectReason reason) noexcept {
    switch (reason) {
        case DisconnectReason::DisconnectedByClient: return "disconnected by client";
        case DisconnectReason::ServerClosed:         return "server closed the connection";
        case DisconnectReason::NetworkError:         return "network error";
        case DisconnectReason::ProtocolError:        return "protocol error";
    }
    return "unknown";
}

const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Handshaking:  return "handshaking";
        case ConnectionState::Ready:        return "ready";
        case ConnectionState::Disposed:     return "disposed";
    }
    return "unknown";
}

} // namespace easyquery
