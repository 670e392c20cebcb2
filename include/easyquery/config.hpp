// include/easyquery/config.hpp
// Flat configuration struct with builder pattern.

#pragma once

#include "error.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace spdlog {
class logger;
}

namespace easyquery {

class QueryConfigBuilder;

// Connection, credential and behavior settings for one QueryClient.
// Immutable once built.
class QueryConfig {
public:
    using ErrorCallback = std::function<void(const QueryError&)>;

    static QueryConfigBuilder builder(std::string host, int port, std::string password);

    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }
    const std::string& password() const noexcept { return password_; }
    uint64_t permissions() const noexcept { return permissions_; }
    uint8_t kick_power() const noexcept { return kick_power_; }
    const std::optional<std::string>& username() const noexcept { return username_; }
    bool suppress_command_responses() const noexcept { return suppress_command_responses_; }
    bool subscribe_console() const noexcept { return subscribe_console_; }
    bool subscribe_logs() const noexcept { return subscribe_logs_; }
    std::chrono::milliseconds command_timeout() const noexcept { return command_timeout_; }
    std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }
    std::chrono::milliseconds handshake_timeout() const noexcept { return handshake_timeout_; }
    uint32_t max_reconnect_attempts() const noexcept { return max_reconnect_attempts_; }
    std::chrono::milliseconds reconnect_delay() const noexcept { return reconnect_delay_; }
    const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }

    // Flags derived from the boolean options and the username.
    ClientFlags flags() const noexcept;

    // "host:port"
    std::string endpoint() const;

private:
    friend class QueryConfigBuilder;

    std::string host_;
    uint16_t port_ = 0;
    std::string password_;
    uint64_t permissions_ = UINT64_MAX;
    uint8_t kick_power_ = UINT8_MAX;
    std::optional<std::string> username_;
    bool suppress_command_responses_ = false;
    bool subscribe_console_ = false;
    bool subscribe_logs_ = false;
    std::chrono::milliseconds command_timeout_{10000};
    std::chrono::milliseconds connect_timeout_{5000};
    std::chrono::milliseconds handshake_timeout_{5000};
    uint32_t max_reconnect_attempts_ = 10;
    std::chrono::milliseconds reconnect_delay_{0};
    std::shared_ptr<spdlog::logger> logger_;
    ErrorCallback on_error_;
};

// Fluent builder for QueryConfig.
class QueryConfigBuilder {
public:
    QueryConfigBuilder(std::string host, int port, std::string password);

    QueryConfigBuilder& permissions(uint64_t permissions);
    QueryConfigBuilder& kick_power(uint8_t kick_power);
    QueryConfigBuilder& username(std::string username);
    QueryConfigBuilder& suppress_command_responses(bool enabled);
    QueryConfigBuilder& subscribe_console(bool enabled);
    QueryConfigBuilder& subscribe_logs(bool enabled);
    QueryConfigBuilder& command_timeout(std::chrono::milliseconds timeout);
    QueryConfigBuilder& connect_timeout(std::chrono::milliseconds timeout);
    QueryConfigBuilder& handshake_timeout(std::chrono::milliseconds timeout);
    QueryConfigBuilder& max_reconnect_attempts(uint32_t attempts);
    QueryConfigBuilder& reconnect_delay(std::chrono::milliseconds delay);
    QueryConfigBuilder& logger(std::shared_ptr<spdlog::logger> logger);
    QueryConfigBuilder& on_error(QueryConfig::ErrorCallback callback);

    // Build the config. Throws QueryError on invalid settings.
    QueryConfig build() const;

private:
    int port_;
    QueryConfig config_;
};

} // namespace easyquery
