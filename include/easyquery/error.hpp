// include/easyquery/error.hpp
// Error handling: single class with kind enum.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace easyquery {

enum class ErrorKind {
    Configuration,          // Invalid config at construction
    Validation,             // Empty command or oversized payload (no I/O done)
    ProtocolUsage,          // Remote admin command without '/' prefix
    Authentication,         // Server rejected the password
    HandshakeProtocol,      // Malformed or unexpected handshake reply
    Timeout,                // No response within the command timeout
    CommandExecution,       // Server signaled a command exception
    ConnectionLost,         // Transport dropped while a command was pending
    ReconnectionExhausted,  // Reconnect budget spent, client disposed itself
    Cancelled,              // Pending command superseded or cancelled
    Disposed,               // Client already disposed
    Network                 // Socket level failure (connect, send)
};

class QueryError : public std::exception {
public:
    QueryError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    static QueryError configuration(std::string msg) {
        return QueryError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static QueryError validation(std::string msg) {
        return QueryError(ErrorKind::Validation, "validation error: " + msg);
    }

    static QueryError protocol_usage(std::string msg) {
        return QueryError(ErrorKind::ProtocolUsage, "protocol usage error: " + msg);
    }

    static QueryError authentication(std::string msg) {
        return QueryError(ErrorKind::Authentication, "authentication failed: " + msg);
    }

    static QueryError handshake_protocol(std::string msg) {
        return QueryError(ErrorKind::HandshakeProtocol, "handshake error: " + msg);
    }

    static QueryError timeout() {
        return QueryError(ErrorKind::Timeout, "command timed out waiting for a response");
    }

    // The message is the exception text sent by the server, unprefixed.
    static QueryError command_execution(std::string server_text) {
        return QueryError(ErrorKind::CommandExecution, std::move(server_text));
    }

    static QueryError connection_lost(std::string msg) {
        return QueryError(ErrorKind::ConnectionLost, "connection lost: " + msg);
    }

    static QueryError reconnection_exhausted(unsigned attempts) {
        return QueryError(ErrorKind::ReconnectionExhausted,
            "reconnection failed after " + std::to_string(attempts) + " attempts");
    }

    static QueryError cancelled() {
        return QueryError(ErrorKind::Cancelled, "command was cancelled");
    }

    static QueryError disposed() {
        return QueryError(ErrorKind::Disposed, "client is disposed");
    }

    static QueryError network(std::string msg) {
        return QueryError(ErrorKind::Network, "network error: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace easyquery
