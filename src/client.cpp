// src/client.cpp
// QueryClient facade over the session.

#include "easyquery/client.hpp"
#include "session.hpp"

namespace easyquery {

QueryClient::QueryClient(QueryConfig config)
    : session_(std::make_shared<Session>(std::move(config))) {}

// The session thread may outlive this object when a callback destroys the
// client; it holds its own reference to the session.
QueryClient::~QueryClient() {
    session_->dispose();
}

std::unique_ptr<QueryClient> QueryClient::create(QueryConfig config) {
    std::unique_ptr<QueryClient> client(new QueryClient(std::move(config)));
    client->session_->start();
    return client;
}

// --- Commands ---

CommandResponse QueryClient::send_command(const std::string& command) {
    return session_->send_command(command, session_->config().command_timeout());
}

CommandResponse QueryClient::send_command(const std::string& command, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        throw QueryError::validation("timeout must be positive");
    }
    return session_->send_command(command, timeout);
}

void QueryClient::send_raw(const std::string& content) {
    session_->send_raw(content);
}

// --- Push ---

void QueryClient::on_console_message(ConsoleCallback callback) {
    session_->add_console_listener(std::move(callback));
}

// --- Lifecycle ---

void QueryClient::dispose() {
    session_->dispose();
}

bool QueryClient::is_disposed() const noexcept {
    return session_->is_disposed();
}

ConnectionState QueryClient::state() const noexcept {
    return session_->state();
}

uint32_t QueryClient::reconnect_attempts() const noexcept {
    return session_->reconnect_attempts();
}

uint16_t QueryClient::max_packet_size() const noexcept {
    return session_->max_packet_size();
}

} // namespace easyquery
