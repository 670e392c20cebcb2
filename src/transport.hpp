// src/transport.hpp
// TCP transport: one socket, length-prefixed frames in both directions.

#pragma once

#include "easyquery/error.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace easyquery {

enum class ReceiveStatus : uint8_t {
    Frame,          // out holds one complete frame body
    Timeout,        // nothing arrived within the timeout (handshake only)
    Closed,         // orderly shutdown by the peer, or interrupt()
    NetworkError,   // socket error
    ProtocolError,  // declared frame length over MAX_FRAME_SIZE
};

class TcpTransport {
public:
    static constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

    TcpTransport(std::string host, uint16_t port, std::chrono::milliseconds connect_timeout);
    ~TcpTransport();

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Resolve and connect. Throws QueryError::network on failure.
    void connect();

    // Send length-prefixed frame: [4 bytes BE length][payload].
    // Thread-safe. Returns false and closes the socket on failure.
    bool send_frame(const uint8_t* data, size_t len);

    // Read one frame body into out. A negative timeout blocks until data
    // arrives or the socket is interrupted.
    ReceiveStatus receive_frame(std::vector<uint8_t>& out,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(-1));

    // Wake a blocked receive_frame from another thread. Safe to call any
    // number of times, before or after close_connection().
    void interrupt() noexcept;

    // Release the socket. Idempotent.
    void close_connection() noexcept;

    bool is_open() const noexcept { return socket_fd_.load() >= 0; }
    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }

private:
    void configure_socket(int fd);
    bool write_all(const uint8_t* data, size_t len);
    ReceiveStatus read_exact(uint8_t* data, size_t len, std::chrono::milliseconds timeout);

    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds connect_timeout_;
    std::atomic<int> socket_fd_{-1};
    std::mutex write_mutex_;
    std::mutex close_mutex_;
};

} // namespace easyquery
