// include/easyquery/client.hpp
// Query client: remote admin commands and console streaming.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace easyquery {

class Session;

// Client for the server query protocol.
//
// Created via QueryClient::create(config), which connects and completes the
// handshake before returning. A background thread receives server messages
// and reconnects after unexpected disconnects.
//
// Example:
//   auto client = QueryClient::create(
//       QueryConfig::builder("127.0.0.1", 7777, "password").build());
//   auto response = client->send_command("/players");
//   std::cout << response.to_string() << std::endl;
class QueryClient {
public:
    using ConsoleCallback = std::function<void(const std::string&)>;

    // Connect and handshake. Throws QueryError (Network, Authentication or
    // HandshakeProtocol) if the first connection cannot be established.
    static std::unique_ptr<QueryClient> create(QueryConfig config);

    ~QueryClient();

    QueryClient(const QueryClient&) = delete;
    QueryClient& operator=(const QueryClient&) = delete;
    QueryClient(QueryClient&&) = delete;
    QueryClient& operator=(QueryClient&&) = delete;

    // --- Commands ---

    // Send a command and block until the server answers, using the
    // configured command timeout. Remote admin commands must start with '/'.
    //
    // Returns a default CommandResponse immediately when command responses
    // are suppressed. The command is dropped if the client is not Ready.
    //
    // Throws QueryError: Validation (blank command), ProtocolUsage (missing
    // '/'), Timeout, CommandExecution (server exception), Cancelled,
    // ConnectionLost, Disposed.
    CommandResponse send_command(const std::string& command);
    CommandResponse send_command(const std::string& command, std::chrono::milliseconds timeout);

    // Send raw content without waiting for anything.
    void send_raw(const std::string& content);

    // --- Push ---

    // Register a callback for console and server log lines. Only called when
    // the config subscribes to them. Invoked on the client's receive thread;
    // a callback may dispose or destroy the client.
    void on_console_message(ConsoleCallback callback);

    // --- Lifecycle ---

    // Cancel the pending command, close the connection and stop the
    // background thread. Idempotent.
    void dispose();

    bool is_disposed() const noexcept;
    ConnectionState state() const noexcept;
    uint32_t reconnect_attempts() const noexcept;

    // Largest payload the server accepts, 0 when unlimited.
    uint16_t max_packet_size() const noexcept;

private:
    explicit QueryClient(QueryConfig config);
    std::shared_ptr<Session> session_;
};

} // namespace easyquery
