// include/easyquery/types.hpp
// Protocol enums and the command response value type.

#pragma once

#include <cstdint>
#include <string>

namespace easyquery {

// Capability flags sent in the handshake.
enum class ClientFlags : uint8_t {
    None                     = 0,
    SuppressCommandResponses = 1 << 0,
    SubscribeServerConsole   = 1 << 1,
    SubscribeServerLogs      = 1 << 2,
    RemoteAdminMetadata      = 1 << 3,
    SpecifyLogUsername       = 1 << 4,
};

constexpr ClientFlags operator|(ClientFlags a, ClientFlags b) noexcept {
    return static_cast<ClientFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr ClientFlags& operator|=(ClientFlags& a, ClientFlags b) noexcept {
    a = a | b;
    return a;
}

constexpr bool has_flag(ClientFlags value, ClientFlags flag) noexcept {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

// Content types sent by the client.
enum class ContentTypeToServer : uint8_t {
    Command    = 0,
    RawContent = 1,
};

// Content types sent by the server. Values not listed are reserved.
enum class ContentTypeToClient : uint8_t {
    ConsoleString                            = 0,
    CommandException                         = 1,
    RemoteAdminSerializedResponse            = 2,
    RemoteAdminPlaintextResponse             = 3,
    RemoteAdminUnsuccessfulPlaintextResponse = 4,
};

// Handshake reply status.
enum class HandshakeStatus : uint8_t {
    Accepted           = 0,
    InvalidPassword    = 1,
    UnsupportedVersion = 2,
    Rejected           = 3,
};

enum class DisconnectReason : uint8_t {
    DisconnectedByClient,
    ServerClosed,
    NetworkError,
    ProtocolError,
};

enum class ConnectionState : uint8_t {
    Disconnected,
    Handshaking,
    Ready,
    Disposed,
};

const char* to_string(DisconnectReason reason) noexcept;
const char* to_string(ConnectionState state) noexcept;

// Result of a remote admin command.
class CommandResponse {
public:
    CommandResponse() = default;
    CommandResponse(std::string content, bool is_success)
        : content_(std::move(content)), is_success_(is_success) {}

    const std::string& content() const noexcept { return content_; }
    bool is_success() const noexcept { return is_success_; }

    // "Success: <content>" or "Failed: <content>".
    std::string to_string() const {
        return (is_success_ ? "Success: " : "Failed: ") + content_;
    }

private:
    std::string content_;
    bool is_success_ = false;
};

} // namespace easyquery
