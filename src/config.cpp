// src/config.cpp
// Configuration builder and validation.

#include "easyquery/config.hpp"
#include "logging.hpp"
#include "validation.hpp"

namespace easyquery {

// --- QueryConfig ---

QueryConfigBuilder QueryConfig::builder(std::string host, int port, std::string password) {
    return QueryConfigBuilder(std::move(host), port, std::move(password));
}

ClientFlags QueryConfig::flags() const noexcept {
    ClientFlags flags = ClientFlags::None;
    if (suppress_command_responses_) flags |= ClientFlags::SuppressCommandResponses;
    if (subscribe_console_) flags |= ClientFlags::SubscribeServerConsole;
    if (subscribe_logs_) flags |= ClientFlags::SubscribeServerLogs;
    if (username_) flags |= ClientFlags::SpecifyLogUsername;
    return flags;
}

std::string QueryConfig::endpoint() const {
    // Bracket IPv6 literals so the port stays unambiguous.
    if (host_.find(':') != std::string::npos) {
        return "[" + host_ + "]:" + std::to_string(port_);
    }
    return host_ + ":" + std::to_string(port_);
}

// --- QueryConfigBuilder ---

QueryConfigBuilder::QueryConfigBuilder(std::string host, int port, std::string password)
    : port_(port) {
    config_.host_ = std::move(host);
    config_.password_ = std::move(password);
}

QueryConfigBuilder& QueryConfigBuilder::permissions(uint64_t permissions) {
    config_.permissions_ = permissions;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::kick_power(uint8_t kick_power) {
    config_.kick_power_ = kick_power;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::username(std::string username) {
    config_.username_ = std::move(username);
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::suppress_command_responses(bool enabled) {
    config_.suppress_command_responses_ = enabled;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::subscribe_console(bool enabled) {
    config_.subscribe_console_ = enabled;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::subscribe_logs(bool enabled) {
    config_.subscribe_logs_ = enabled;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::command_timeout(std::chrono::milliseconds timeout) {
    config_.command_timeout_ = timeout;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::connect_timeout(std::chrono::milliseconds timeout) {
    config_.connect_timeout_ = timeout;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::handshake_timeout(std::chrono::milliseconds timeout) {
    config_.handshake_timeout_ = timeout;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::max_reconnect_attempts(uint32_t attempts) {
    config_.max_reconnect_attempts_ = attempts;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::reconnect_delay(std::chrono::milliseconds delay) {
    config_.reconnect_delay_ = delay;
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::logger(std::shared_ptr<spdlog::logger> logger) {
    config_.logger_ = std::move(logger);
    return *this;
}

QueryConfigBuilder& QueryConfigBuilder::on_error(QueryConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

QueryConfig QueryConfigBuilder::build() const {
    if (config_.host_.empty()) {
        throw QueryError::configuration("host is required");
    }
    if (!validation::check_port(port_)) {
        throw QueryError::configuration("port must be 1-65535, got: " + std::to_string(port_));
    }
    if (!validation::check_handshake_string(config_.password_)) {
        throw QueryError::configuration("password must be at most 65535 bytes");
    }
    if (config_.username_ && !validation::check_handshake_string(*config_.username_)) {
        throw QueryError::configuration("username must be at most 65535 bytes");
    }
    if (config_.command_timeout_.count() <= 0) {
        throw QueryError::configuration("command_timeout must be positive");
    }
    if (config_.connect_timeout_.count() <= 0) {
        throw QueryError::configuration("connect_timeout must be positive");
    }
    if (config_.handshake_timeout_.count() <= 0) {
        throw QueryError::configuration("handshake_timeout must be positive");
    }
    if (config_.reconnect_delay_.count() < 0) {
        throw QueryError::configuration("reconnect_delay must not be negative");
    }

    QueryConfig result = config_;
    result.port_ = static_cast<uint16_t>(port_);
    if (!result.logger_) {
        result.logger_ = logging::null_logger();
    }
    return result;
}

} // namespace easyquery
