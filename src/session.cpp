// src/session.cpp
// Session thread, command correlation and reconnection.

#include "session.hpp"
#include "handshake.hpp"
#include "validation.hpp"

#include <spdlog/logger.h>

#include <exception>

namespace easyquery {

static int64_t now_ms() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// --- PendingSlot ---

std::future<CommandResponse> PendingSlot::install(uint64_t& generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (promise_) {
        promise_->set_exception(std::make_exception_ptr(QueryError::cancelled()));
        promise_.reset();
    }

    std::promise<CommandResponse> promise;
    auto future = promise.get_future();
    generation = ++generation_;
    if (closed_) {
        promise.set_exception(std::make_exception_ptr(*closed_));
    } else {
        promise_ = std::move(promise);
    }
    return future;
}

bool PendingSlot::resolve(CommandResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!promise_) return false;
    promise_->set_value(std::move(response));
    promise_.reset();
    return true;
}

bool PendingSlot::fail(const QueryError& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!promise_) return false;
    promise_->set_exception(std::make_exception_ptr(error));
    promise_.reset();
    return true;
}

bool PendingSlot::fail_if(uint64_t generation, const QueryError& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!promise_ || generation_ != generation) return false;
    promise_->set_exception(std::make_exception_ptr(error));
    promise_.reset();
    return true;
}

void PendingSlot::close(const QueryError& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = error;
    if (promise_) {
        promise_->set_exception(std::make_exception_ptr(error));
        promise_.reset();
    }
}

// --- Session ---

Session::Session(QueryConfig config)
    : config_(std::move(config)), log_(config_.logger()) {
    receive_buf_.reserve(4096);
}

Session::~Session() {
    dispose();
    if (thread_.joinable()) {
        if (session_thread_id_.load() == std::this_thread::get_id()) {
            // Last reference dropped by the session thread as run() returned.
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void Session::start() {
    establish();
    // The thread owns a reference, so a callback may drop the client's.
    thread_ = std::thread([self = shared_from_this()] { self->run(); });
}

ConnectionState Session::state() const noexcept {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void Session::set_state(ConnectionState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        // Disposed is terminal.
        if (state_ == ConnectionState::Disposed) return;
        state_ = state;
    }
    state_cv_.notify_all();
}

bool Session::wait_until_ready(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_until(lock, deadline, [this] {
        return state_ == ConnectionState::Ready || state_ == ConnectionState::Disposed;
    });
    if (state_ == ConnectionState::Disposed) {
        throw QueryError::disposed();
    }
    return state_ == ConnectionState::Ready;
}

std::shared_ptr<TcpTransport> Session::current_transport() {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    return transport_;
}

void Session::report_error(const QueryError& error) const {
    if (config_.on_error()) {
        config_.on_error()(error);
    }
}

// --- Connection management ---

void Session::teardown_transport() {
    std::shared_ptr<TcpTransport> old;
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        old = std::move(transport_);
        transport_.reset();
    }
    if (old) {
        old->close_connection();
    }
    set_state(ConnectionState::Disconnected);
}

void Session::establish() {
    // The previous transport is gone before the next one exists.
    teardown_transport();
    set_state(ConnectionState::Handshaking);

    auto transport = std::make_shared<TcpTransport>(
        config_.host(), config_.port(), config_.connect_timeout());
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        if (disposed_.load()) throw QueryError::disposed();
        transport_ = transport;
    }

    try {
        log_->debug("connecting to {}", config_.endpoint());
        transport->connect();
        if (disposed_.load()) throw QueryError::disposed();
        auto negotiated = negotiate(*transport, config_);
        max_packet_size_.store(negotiated.max_packet_size);
    } catch (const QueryError&) {
        teardown_transport();
        throw;
    }

    reconnect_attempts_.store(0);
    set_state(ConnectionState::Ready);
    log_->info("connected to {} (max packet size {})", config_.endpoint(), max_packet_size_.load());
}

// --- Session thread ---

void Session::run() {
    session_thread_id_.store(std::this_thread::get_id());

    while (!disposed_.load()) {
        auto transport = current_transport();
        if (!transport) break;

        SessionEvent event = next_event(*transport);
        if (auto* msg = std::get_if<MessageReceived>(&event)) {
            dispatch(std::move(msg->message));
        } else if (auto* closed = std::get_if<ConnectionClosed>(&event)) {
            if (!handle_disconnect(closed->reason)) break;
        }
    }
}

SessionEvent Session::next_event(TcpTransport& transport) {
    ReceiveStatus status = transport.receive_frame(receive_buf_);
    if (status == ReceiveStatus::Frame) {
        return MessageReceived{codec::decode_message(receive_buf_.data(), receive_buf_.size())};
    }

    // interrupt() from dispose() shows up as an ordinary close.
    if (disposed_.load()) {
        return ConnectionClosed{DisconnectReason::DisconnectedByClient};
    }
    switch (status) {
        case ReceiveStatus::Closed:
            return ConnectionClosed{DisconnectReason::ServerClosed};
        case ReceiveStatus::ProtocolError:
            return ConnectionClosed{DisconnectReason::ProtocolError};
        default:
            return ConnectionClosed{DisconnectReason::NetworkError};
    }
}

void Session::dispatch(codec::DecodedMessage message) {
    switch (message.kind) {
        case codec::MessageKind::ConsoleLine:
            notify_console(message.text);
            break;
        case codec::MessageKind::RemoteAdminSuccess:
            if (!pending_.resolve(CommandResponse(std::move(message.text), true))) {
                log_->debug("dropping response #{}: no command pending", message.sequence);
            }
            break;
        case codec::MessageKind::RemoteAdminFailure:
            if (!pending_.resolve(CommandResponse(std::move(message.text), false))) {
                log_->debug("dropping response #{}: no command pending", message.sequence);
            }
            break;
        case codec::MessageKind::CommandException:
            if (!pending_.fail(QueryError::command_execution(std::move(message.text)))) {
                log_->debug("dropping command exception #{}: no command pending", message.sequence);
            }
            break;
        case codec::MessageKind::Unrecognized:
            log_->debug("dropping message with unrecognized content type {}",
                        static_cast<int>(message.content_type));
            break;
    }
}

void Session::notify_console(const std::string& line) {
    std::vector<ConsoleCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (auto& listener : listeners) {
        try {
            listener(line);
        } catch (const std::exception& e) {
            log_->warn("console listener threw: {}", e.what());
        }
    }
}

// Returns true once a new connection is Ready, false when the session ends.
bool Session::handle_disconnect(DisconnectReason reason) {
    teardown_transport();
    pending_.fail(QueryError::connection_lost(to_string(reason)));

    if (reason == DisconnectReason::DisconnectedByClient || disposed_.load()) {
        dispose();
        return false;
    }

    log_->warn("disconnected from {}: {}", config_.endpoint(), to_string(reason));

    for (;;) {
        uint32_t attempt = reconnect_attempts_.load();
        if (attempt > config_.max_reconnect_attempts()) {
            log_->error("giving up on {} after {} reconnect attempts", config_.endpoint(), attempt);
            dispose();
            report_error(QueryError::reconnection_exhausted(attempt));
            return false;
        }
        reconnect_attempts_.store(attempt + 1);

        if (config_.reconnect_delay().count() > 0) {
            std::unique_lock<std::mutex> lock(state_mutex_);
            state_cv_.wait_for(lock, config_.reconnect_delay(), [this] {
                return state_ == ConnectionState::Disposed;
            });
        }
        if (disposed_.load()) return false;

        log_->info("reconnecting to {} (attempt {})", config_.endpoint(), attempt + 1);
        try {
            establish();
            return true;
        } catch (const QueryError& e) {
            if (disposed_.load()) return false;
            log_->warn("reconnect attempt {} failed: {}", attempt + 1, e.what());
            report_error(e);
        }
    }
}

// --- Commands ---

void Session::check_payload(const std::string& content) const {
    if (!validation::check_payload_size(content.size(), max_packet_size_.load())) {
        throw QueryError::validation("payload of " + std::to_string(content.size()) +
            " bytes exceeds the server's max packet size of " +
            std::to_string(max_packet_size_.load()));
    }
}

void Session::transmit(ContentTypeToServer type, const std::string& content, Clock::time_point deadline) {
    if (!wait_until_ready(deadline)) {
        throw QueryError::timeout();
    }
    if (!try_transmit(type, content)) {
        throw QueryError::connection_lost("failed to send to " + config_.endpoint());
    }
}

bool Session::try_transmit(ContentTypeToServer type, const std::string& content) {
    if (state() != ConnectionState::Ready) {
        return false;
    }

    std::vector<uint8_t> buf;
    codec::encode_message_into(buf, type, sequence_.fetch_add(1), now_ms(), content);

    auto transport = current_transport();
    return transport && transport->send_frame(buf.data(), buf.size());
}

CommandResponse Session::send_command(const std::string& command, std::chrono::milliseconds timeout) {
    if (disposed_.load()) {
        throw QueryError::disposed();
    }
    if (validation::is_blank(command)) {
        throw QueryError::validation("command must not be empty");
    }
    check_payload(command);

    if (config_.suppress_command_responses()) {
        if (!try_transmit(ContentTypeToServer::Command, command)) {
            log_->warn("dropping suppressed command: not connected to {}", config_.endpoint());
        }
        return CommandResponse();
    }

    if (!validation::check_remote_admin_prefix(command)) {
        throw QueryError::protocol_usage("remote admin commands must be prefixed with '/'");
    }

    std::lock_guard<std::mutex> permit(send_permit_);
    if (disposed_.load()) {
        throw QueryError::disposed();
    }

    // The window starts once this caller owns the permit.
    auto deadline = Clock::now() + timeout;

    uint64_t generation = 0;
    auto future = pending_.install(generation);

    try {
        transmit(ContentTypeToServer::Command, command, deadline);
    } catch (const QueryError& e) {
        pending_.fail_if(generation, e);
    }

    if (future.wait_until(deadline) != std::future_status::ready) {
        pending_.fail_if(generation, QueryError::timeout());
    }

    // Ready by now: resolved by the server, by the timeout above, or by a
    // cancel that raced with it.
    return future.get();
}

void Session::send_raw(const std::string& content) {
    if (disposed_.load()) {
        throw QueryError::disposed();
    }
    if (validation::is_blank(content)) {
        throw QueryError::validation("content must not be empty");
    }
    check_payload(content);
    transmit(ContentTypeToServer::RawContent, content, Clock::now() + config_.command_timeout());
}

void Session::add_console_listener(ConsoleCallback callback) {
    if (!callback) return;
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(callback));
}

// --- Lifecycle ---

void Session::dispose() {
    if (disposed_.exchange(true)) return;

    log_->info("disposing client for {}", config_.endpoint());
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::Disposed;
    }
    state_cv_.notify_all();

    pending_.close(QueryError::cancelled());

    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        if (transport_) transport_->interrupt();
    }

    if (thread_.joinable() && session_thread_id_.load() != std::this_thread::get_id()) {
        thread_.join();
    }

    // The session thread has exited (or is this thread); release the socket.
    if (session_thread_id_.load() != std::this_thread::get_id()) {
        teardown_transport();
    }
}

} // namespace easyquery
