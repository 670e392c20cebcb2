// src/transport.cpp
// TCP transport for the query protocol.

#include "transport.hpp"

#include <cstring>

// POSIX sockets
#include <sys/time.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>

namespace easyquery {

TcpTransport::TcpTransport(std::string host, uint16_t port, std::chrono::milliseconds connect_timeout)
    : host_(std::move(host)), port_(port), connect_timeout_(connect_timeout) {}

TcpTransport::~TcpTransport() {
    close_connection();
}

void TcpTransport::interrupt() noexcept {
    std::lock_guard<std::mutex> lock(close_mutex_);
    int fd = socket_fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void TcpTransport::close_connection() noexcept {
    // Wait for an in-flight send so its descriptor cannot be reused under it.
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::lock_guard<std::mutex> lock(close_mutex_);
    int fd = socket_fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

void TcpTransport::connect() {
    close_connection();

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(port_);
    int err = ::getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw QueryError::network("DNS resolution failed for " + host_);
    }

    // Try each resolved address (IPv6/IPv4) until one connects.
    int fd = -1;
    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0) {
            ::close(fd);
            fd = -1;
            continue;
        }
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);

        if (ret == 0) {
            // Connected immediately
            ::fcntl(fd, F_SETFL, flags);
            ::freeaddrinfo(res);
            configure_socket(fd);
            socket_fd_.store(fd);
            return;
        }

        if (errno != EINPROGRESS) {
            ::close(fd);
            fd = -1;
            continue;
        }

        // Wait for connection with timeout
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int poll_ret = ::poll(&pfd, 1, static_cast<int>(connect_timeout_.count()));
        if (poll_ret <= 0) {
            ::close(fd);
            fd = -1;
            continue;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            ::close(fd);
            fd = -1;
            continue;
        }

        // Connected: restore blocking mode
        ::fcntl(fd, F_SETFL, flags);
        ::freeaddrinfo(res);
        configure_socket(fd);
        socket_fd_.store(fd);
        return;
    }

    ::freeaddrinfo(res);
    throw QueryError::network("connect failed to " + host_ + ":" + port_str);
}

void TcpTransport::configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));

    // Bound blocking sends; receives are bounded by poll().
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(connect_timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((connect_timeout_.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool TcpTransport::write_all(const uint8_t* data, size_t len) {
    int fd = socket_fd_.load();
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            interrupt();
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool TcpTransport::send_frame(const uint8_t* data, size_t len) {
    if (len > MAX_FRAME_SIZE) return false;

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (socket_fd_.load() < 0) return false;

    // Length prefix (4 bytes, big-endian)
    uint32_t frame_len = static_cast<uint32_t>(len);
    uint8_t header[4] = {
        static_cast<uint8_t>(frame_len >> 24),
        static_cast<uint8_t>(frame_len >> 16),
        static_cast<uint8_t>(frame_len >> 8),
        static_cast<uint8_t>(frame_len),
    };

    if (!write_all(header, 4)) return false;
    if (len > 0 && !write_all(data, len)) return false;
    return true;
}

ReceiveStatus TcpTransport::read_exact(uint8_t* data, size_t len, std::chrono::milliseconds timeout) {
    int fd = socket_fd_.load();
    if (fd < 0) return ReceiveStatus::Closed;

    size_t received = 0;
    while (received < len) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int poll_ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (poll_ret < 0) {
            if (errno == EINTR) continue;
            return ReceiveStatus::NetworkError;
        }
        if (poll_ret == 0) {
            return ReceiveStatus::Timeout;
        }

        ssize_t n = ::recv(fd, data + received, len - received, 0);
        if (n == 0) {
            return ReceiveStatus::Closed;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return ReceiveStatus::NetworkError;
        }
        received += static_cast<size_t>(n);
    }
    return ReceiveStatus::Frame;
}

ReceiveStatus TcpTransport::receive_frame(std::vector<uint8_t>& out, std::chrono::milliseconds timeout) {
    uint8_t header[4];
    ReceiveStatus status = read_exact(header, 4, timeout);
    if (status != ReceiveStatus::Frame) return status;

    uint32_t frame_len = (static_cast<uint32_t>(header[0]) << 24) |
                         (static_cast<uint32_t>(header[1]) << 16) |
                         (static_cast<uint32_t>(header[2]) << 8) |
                         static_cast<uint32_t>(header[3]);
    if (frame_len > MAX_FRAME_SIZE) {
        return ReceiveStatus::ProtocolError;
    }

    out.resize(frame_len);
    if (frame_len == 0) return ReceiveStatus::Frame;

    status = read_exact(out.data(), frame_len, timeout);
    // A header without its body is a broken stream, not an idle one.
    if (status == ReceiveStatus::Timeout) return ReceiveStatus::ProtocolError;
    return status;
}

} // namespace easyquery
