// src/session.hpp
// Connection state machine: command correlation, push routing, reconnects.

#pragma once

#include "codec.hpp"
#include "transport.hpp"
#include "easyquery/config.hpp"
#include "easyquery/error.hpp"
#include "easyquery/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace spdlog {
class logger;
}

namespace easyquery {

// Events produced by the receive path. Each one belongs to the connection
// that was current when it was read; nothing outlives that connection.
struct MessageReceived {
    codec::DecodedMessage message;
};
struct ConnectionClosed {
    DisconnectReason reason;
};

using SessionEvent = std::variant<MessageReceived, ConnectionClosed>;

// Single-slot cell holding the command that awaits a response.
//
// install() cancels the previous occupant and installs a new promise in one
// step under the slot's mutex, so it cannot interleave with a response
// resolving the old one.
class PendingSlot {
public:
    // Cancel the current slot and install a fresh one. The generation
    // identifies the new slot for fail_if().
    std::future<CommandResponse> install(uint64_t& generation);

    // Resolve the current slot. False when no slot is installed.
    bool resolve(CommandResponse response);
    bool fail(const QueryError& error);

    // Fail the slot only if it is still the given generation.
    bool fail_if(uint64_t generation, const QueryError& error);

    // Fail the current slot and make every later install() fail with error.
    void close(const QueryError& error);

private:
    std::mutex mutex_;
    std::optional<std::promise<CommandResponse>> promise_;
    uint64_t generation_ = 0;
    std::optional<QueryError> closed_;
};

class Session : public std::enable_shared_from_this<Session> {
public:
    using ConsoleCallback = std::function<void(const std::string&)>;

    explicit Session(QueryConfig config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Connect, handshake and spawn the session thread. Throws on failure.
    void start();

    CommandResponse send_command(const std::string& command, std::chrono::milliseconds timeout);
    void send_raw(const std::string& content);
    void add_console_listener(ConsoleCallback callback);

    void dispose();

    bool is_disposed() const noexcept { return disposed_.load(); }
    ConnectionState state() const noexcept;
    uint32_t reconnect_attempts() const noexcept { return reconnect_attempts_.load(); }
    uint16_t max_packet_size() const noexcept { return max_packet_size_.load(); }
    const QueryConfig& config() const noexcept { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    // Session thread
    void run();
    SessionEvent next_event(TcpTransport& transport);
    void dispatch(codec::DecodedMessage message);
    void notify_console(const std::string& line);
    bool handle_disconnect(DisconnectReason reason);

    // Connection management
    void establish();
    void teardown_transport();
    std::shared_ptr<TcpTransport> current_transport();
    void set_state(ConnectionState state);
    bool wait_until_ready(Clock::time_point deadline);

    // Wait for Ready until deadline, then send. Throws Timeout or ConnectionLost.
    void transmit(ContentTypeToServer type, const std::string& content, Clock::time_point deadline);
    // Send only if Ready right now. False when nothing was sent.
    bool try_transmit(ContentTypeToServer type, const std::string& content);
    void check_payload(const std::string& content) const;
    void report_error(const QueryError& error) const;

    QueryConfig config_;
    std::shared_ptr<spdlog::logger> log_;

    // Transport (replaced wholesale on reconnect)
    std::mutex transport_mutex_;
    std::shared_ptr<TcpTransport> transport_;
    std::vector<uint8_t> receive_buf_;
    std::atomic<uint16_t> max_packet_size_{0};
    std::atomic<uint32_t> sequence_{0};

    // Correlation
    std::mutex send_permit_;
    PendingSlot pending_;

    // Push subscribers
    std::mutex listeners_mutex_;
    std::vector<ConsoleCallback> listeners_;

    // State machine
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::atomic<uint32_t> reconnect_attempts_{0};
    std::atomic<bool> disposed_{false};

    std::thread thread_;
    std::atomic<std::thread::id> session_thread_id_{};
};

} // namespace easyquery
