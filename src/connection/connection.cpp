#include <tunstack/connection.h>
#include <tunstack/stack/stack_lock.h>
#include <tunstack/stack/tcp_callbacks.h>
#include <algorithm>

namespace tunstack {
namespace core {

namespace {

constexpr size_t MAX_RECVED_CHUNK = 0xFFFF;

int64_t to_ns(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

} // namespace

TcpConnection::TcpConnection(stack::NativeStack& stack,
                             stack::PcbHandle pcb,
                             std::shared_ptr<ConnectionHandler> handler,
                             const ConnectionConfig& config,
                             std::shared_ptr<ErrorReporter> reporter)
    : stack_(stack)
    , pcb_(pcb)
    , handler_(std::move(handler))
    , reporter_(reporter ? std::move(reporter) : ErrorReporter::default_reporter())
    , config_(config)
    , connection_start_(std::chrono::steady_clock::now()) {
    // The engine terminates the flow on the client's behalf: its local
    // endpoint is where the client was heading.
    remote_address_ = stack_.local_endpoint(pcb_);
    local_address_ = stack_.remote_endpoint(pcb_);
    last_activity_ns_.store(to_ns(connection_start_));
}

TcpConnection::~TcpConnection() = default;

Result<std::shared_ptr<TcpConnection>> TcpConnection::create(
    stack::NativeStack& stack,
    stack::PcbHandle pcb,
    std::shared_ptr<ConnectionHandler> handler,
    const ConnectionConfig& config,
    std::shared_ptr<ErrorReporter> reporter) {

    if (pcb == nullptr) {
        return make_error<std::shared_ptr<TcpConnection>>(TunError::INVALID_PARAMETER,
                                                          "null native handle");
    }
    if (!handler) {
        return make_error<std::shared_ptr<TcpConnection>>(
            TunError::NO_HANDLER_REGISTERED, "no " + config.network + " handler registered");
    }

    std::shared_ptr<TcpConnection> conn(
        new TcpConnection(stack, pcb, std::move(handler), config, std::move(reporter)));

    auto& registry = ConnectionRegistry::instance();
    auto slot_result = registry.register_connection(conn, config.key_allocation_attempts);
    if (!slot_result) {
        conn->log_event(ErrorReporter::LogLevel::ERROR, slot_result.error(),
                        "connection key allocation failed: " + slot_result.error_message());
        return slot_result.error_info();
    }
    ConnKeyArg* slot = *slot_result;
    conn->key_ = slot->key;
    conn->attach_callbacks(slot);

    Result<void> connect_result;
    {
        stack::ScopedStackUnlock unlock;
        connect_result = conn->handler_->connect(conn, conn->remote_address_);
    }

    if (connect_result && conn->get_state() == ConnectionState::ABORTED) {
        // The handler accepted, but the engine reset the flow meanwhile
        conn->log_event(ErrorReporter::LogLevel::WARNING, TunError::CONNECTION_RESET,
                        "connection dropped during connect");
        return make_error<std::shared_ptr<TcpConnection>>(
            TunError::CONNECTION_RESET,
            "connection " + conn->describe() + " was released during connect");
    }

    if (connect_result) {
        conn->log_event(ErrorReporter::LogLevel::DEBUG, TunError::SUCCESS, "connection accepted");
        return make_result(std::move(conn));
    }

    if (!conn->try_transition(ConnectionState::ABORTED)) {
        // Released by the engine while the handler was connecting
        conn->log_event(ErrorReporter::LogLevel::WARNING, TunError::CONNECTION_RESET,
                        "connection dropped during connect");
        return make_error<std::shared_ptr<TcpConnection>>(
            TunError::CONNECTION_RESET,
            "connection " + conn->describe() + " was released during connect");
    }

    conn->detach_callbacks();
    registry.release(conn->key_);
    conn->close_signal_.trigger();
    conn->log_event(ErrorReporter::LogLevel::WARNING, connect_result.error(),
                    "handler rejected connection: " + connect_result.error_message());
    return connect_result.error_info();
}

// ========== Handler-facing operations ==========

Result<size_t> TcpConnection::write(const uint8_t* data, size_t len, size_t* bytes_accepted) {
    size_t total = 0;
    auto report_accepted = [&]() {
        if (bytes_accepted) {
            *bytes_accepted = total;
        }
    };

    if (len == 0) {
        report_accepted();
        return make_result(total);
    }
    if (data == nullptr) {
        report_accepted();
        return make_error<size_t>(TunError::INVALID_PARAMETER);
    }

    std::lock_guard<std::mutex> writer(writer_mutex_);
    while (total < len) {
        uint64_t seen_generation = 0;
        {
            stack::StackGuard engine(stack::StackLock::instance());

            auto writable = check_writable();
            if (!writable) {
                report_accepted();
                return writable.error_info();
            }

            size_t chunk = std::min<size_t>(len - total, stack_.sndbuf(pcb_));
            if (chunk > 0) {
                auto err = stack_.write(pcb_, data + total, static_cast<uint16_t>(chunk),
                                        stack::WRITE_FLAG_COPY);
                if (err == stack::StackErr::OK) {
                    auto out = stack_.output(pcb_);
                    if (out != stack::StackErr::OK) {
                        // Segments stay queued, the engine's timers push them later
                        log_event(ErrorReporter::LogLevel::DEBUG, TunError::STACK_OUTPUT_FAILED,
                                  "tcp_output returned " + stack::to_string(out));
                    }
                    total += chunk;
                    bytes_sent_.fetch_add(chunk);
                } else if (err != stack::StackErr::MEM) {
                    int code = static_cast<int>(err);
                    log_event(ErrorReporter::LogLevel::ERROR, TunError::STACK_WRITE_FAILED,
                              "tcp_write failed", code);
                    report_accepted();
                    return make_error<size_t>(TunError::STACK_WRITE_FAILED,
                                              "tcp_write failed with error code: " +
                                              std::to_string(code), code);
                }
            }

            if (total == len) {
                break;
            }

            std::lock_guard<std::mutex> gate(gate_mutex_);
            seen_generation = gate_generation_;
        }

        write_waits_.fetch_add(1);
        std::unique_lock<std::mutex> gate(gate_mutex_);
        write_gate_.wait(gate, [&] { return gate_generation_ != seen_generation; });
    }

    update_last_activity();
    report_accepted();
    return make_result(total);
}

Result<void> TcpConnection::close() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_terminal(state_)) {
            return make_result();
        }
        close_requested_ = true;
        if (state_ == ConnectionState::OPEN) {
            transition_state(ConnectionState::LOCAL_CLOSING);
        }
    }
    log_event(ErrorReporter::LogLevel::DEBUG, TunError::SUCCESS, "close requested");
    return make_result();
}

void TcpConnection::abort() {
    bool requested = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::OPEN || state_ == ConnectionState::LOCAL_CLOSING) {
            requested = transition_state(ConnectionState::ABORTING);
        }
    }
    if (requested) {
        log_event(ErrorReporter::LogLevel::DEBUG, TunError::SUCCESS, "abort requested");
    }
    broadcast_write_gate();
}

// ========== Engine callback entry points ==========

Result<void> TcpConnection::receive(const uint8_t* data, size_t len) {
    bool drop = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::ABORTING || state_ == ConnectionState::ABORTED) {
            return make_error<void>(TunError::CONNECTION_ABORTED,
                                    "connection " + describe() + " is aborting");
        }
        if (state_ == ConnectionState::CLOSED) {
            return make_error<void>(TunError::CONNECTION_CLOSED,
                                    "connection " + describe() + " was closed by remote");
        }
        drop = close_requested_;
    }

    if (drop) {
        // The engine frees the dropped bytes, the window must not shrink
        if (data != nullptr) {
            open_receive_window(len);
        }
        return make_error<void>(TunError::CONNECTION_CLOSED,
                                "connection " + describe() + " was closed by remote");
    }

    if (data == nullptr || len == 0) {
        return make_result();
    }

    auto self = shared_from_this();
    Result<void> forwarded;
    {
        stack::ScopedStackUnlock unlock;
        forwarded = handler_->did_receive(self, data, len);
    }

    if (!forwarded) {
        receive_failures_.fetch_add(1);
        log_event(ErrorReporter::LogLevel::WARNING, TunError::HANDLER_FORWARD_FAILED,
                  "handler did not take received data: " + forwarded.error_message());
        return make_error<void>(TunError::HANDLER_FORWARD_FAILED,
                                "write proxy failed: " + forwarded.error_message());
    }

    bytes_received_.fetch_add(len);
    update_last_activity();

    if (is_terminal(get_state())) {
        return make_result();
    }

    open_receive_window(len);
    return make_result();
}

stack::StackErr TcpConnection::sent(uint16_t len) {
    auto self = shared_from_this();
    bytes_acknowledged_.fetch_add(len);
    update_last_activity();
    {
        stack::ScopedStackUnlock unlock;
        handler_->did_send(self, len);
    }
    return check_state();
}

stack::StackErr TcpConnection::local_did_close() {
    auto self = shared_from_this();
    {
        stack::ScopedStackUnlock unlock;
        handler_->local_did_close(self);
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        local_closed_ = true;
        if (state_ == ConnectionState::OPEN) {
            transition_state(ConnectionState::LOCAL_CLOSING);
        }
    }
    broadcast_write_gate();
    return check_state();
}

stack::StackErr TcpConnection::check_state() {
    auto self = shared_from_this();

    ConnectionState state;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state = state_;
    }

    switch (state) {
        case ConnectionState::ABORTING:
            release_forced();
            return stack::StackErr::ABRT;

        case ConnectionState::OPEN:
            broadcast_write_gate();
            return stack::StackErr::OK;

        case ConnectionState::LOCAL_CLOSING:
            if (stack_.unacked(pcb_) > 0) {
                broadcast_write_gate();
                return stack::StackErr::OK;
            }
            if (!release_graceful()) {
                // The close failed and the handle was aborted instead
                return stack::StackErr::ABRT;
            }
            return stack::StackErr::OK;

        case ConnectionState::CLOSED:
            return stack::StackErr::OK;

        case ConnectionState::ABORTED:
            return stack::StackErr::ABRT;
    }
    return stack::StackErr::OK;
}

stack::StackErr TcpConnection::poll() {
    return check_state();
}

void TcpConnection::err(stack::StackErr error) {
    auto self = shared_from_this();
    if (!try_transition(ConnectionState::ABORTED)) {
        return;
    }

    ConnectionRegistry::instance().release(key_);
    close_signal_.trigger();
    broadcast_write_gate();
    log_event(ErrorReporter::LogLevel::INFO, TunError::CONNECTION_RESET,
              "connection reset by engine: " + stack::to_string(error),
              static_cast<int>(error));

    stack::ScopedStackUnlock unlock;
    handler_->did_close(self);
}

// ========== Introspection ==========

ConnectionState TcpConnection::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool TcpConnection::is_local_closed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return local_closed_;
}

bool TcpConnection::is_close_requested() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return close_requested_;
}

ConnectionStats TcpConnection::get_stats() const {
    ConnectionStats stats;
    stats.bytes_received = bytes_received_.load();
    stats.bytes_sent = bytes_sent_.load();
    stats.bytes_acknowledged = bytes_acknowledged_.load();
    stats.write_waits = write_waits_.load();
    stats.receive_failures = receive_failures_.load();
    stats.connection_start = connection_start_;
    stats.last_activity = std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::nanoseconds(last_activity_ns_.load())));
    return stats;
}

// ========== Private helpers ==========

bool TcpConnection::is_valid_state_transition(ConnectionState from, ConnectionState to) const {
    switch (from) {
        case ConnectionState::OPEN:
            return to == ConnectionState::LOCAL_CLOSING ||
                   to == ConnectionState::ABORTING ||
                   to == ConnectionState::ABORTED;

        case ConnectionState::LOCAL_CLOSING:
            return to == ConnectionState::CLOSED ||
                   to == ConnectionState::ABORTING ||
                   to == ConnectionState::ABORTED;

        case ConnectionState::ABORTING:
            return to == ConnectionState::ABORTED;

        case ConnectionState::CLOSED:
        case ConnectionState::ABORTED:
            return false;
    }
    return false;
}

bool TcpConnection::transition_state(ConnectionState new_state) {
    if (!is_valid_state_transition(state_, new_state)) {
        return false;
    }
    state_ = new_state;
    return true;
}

bool TcpConnection::try_transition(ConnectionState new_state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transition_state(new_state);
}

void TcpConnection::attach_callbacks(ConnKeyArg* slot) {
    stack_.set_arg(pcb_, slot);
    stack_.set_recv(pcb_, stack::tcp_recv_cb);
    stack_.set_sent(pcb_, stack::tcp_sent_cb);
    stack_.set_err(pcb_, stack::tcp_err_cb);
    stack_.set_poll(pcb_, stack::tcp_poll_cb, config_.poll_interval);
}

void TcpConnection::detach_callbacks() {
    stack_.set_arg(pcb_, nullptr);
    stack_.set_recv(pcb_, nullptr);
    stack_.set_sent(pcb_, nullptr);
    stack_.set_err(pcb_, nullptr);
    stack_.set_poll(pcb_, nullptr, 0);
}

Result<void> TcpConnection::release_graceful() {
    if (!try_transition(ConnectionState::CLOSED)) {
        return make_result();
    }

    detach_callbacks();
    ConnectionRegistry::instance().release(key_);
    close_signal_.trigger();
    broadcast_write_gate();

    auto err = stack_.close(pcb_);
    if (err != stack::StackErr::OK) {
        int code = static_cast<int>(err);
        log_event(ErrorReporter::LogLevel::ERROR, TunError::STACK_CLOSE_FAILED,
                  "tcp_close failed, aborting instead", code);
        // Nothing will retry the close once the callbacks are gone
        stack_.abort(pcb_);
        return make_error<void>(TunError::STACK_CLOSE_FAILED,
                                "tcp_close failed with error code: " + std::to_string(code), code);
    }

    log_event(ErrorReporter::LogLevel::DEBUG, TunError::SUCCESS, "connection closed");
    return make_result();
}

void TcpConnection::release_forced() {
    if (!try_transition(ConnectionState::ABORTED)) {
        return;
    }

    // Detached first: the engine reports the abort through the err callback
    detach_callbacks();
    ConnectionRegistry::instance().release(key_);
    close_signal_.trigger();
    broadcast_write_gate();
    stack_.abort(pcb_);

    log_event(ErrorReporter::LogLevel::DEBUG, TunError::SUCCESS, "connection aborted");
}

void TcpConnection::open_receive_window(size_t len) {
    while (len > 0) {
        size_t chunk = std::min(len, MAX_RECVED_CHUNK);
        stack_.recved(pcb_, static_cast<uint16_t>(chunk));
        len -= chunk;
    }
}

void TcpConnection::broadcast_write_gate() {
    {
        std::lock_guard<std::mutex> gate(gate_mutex_);
        ++gate_generation_;
    }
    write_gate_.notify_all();
}

Result<void> TcpConnection::check_writable() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ConnectionState::ABORTING || state_ == ConnectionState::ABORTED) {
        return make_error<void>(TunError::CONNECTION_ABORTED,
                                "connection " + describe() + " is aborting");
    }
    if (local_closed_) {
        return make_error<void>(TunError::CONNECTION_LOCAL_CLOSED,
                                "connection " + describe() + " was closed by local");
    }
    if (state_ == ConnectionState::CLOSED) {
        return make_error<void>(TunError::CONNECTION_CLOSED,
                                "connection " + describe() + " is closed");
    }
    return make_result();
}

std::string TcpConnection::describe() const {
    return to_string(local_address_) + "->" + to_string(remote_address_);
}

void TcpConnection::update_last_activity() {
    last_activity_ns_.store(to_ns(std::chrono::steady_clock::now()));
}

void TcpConnection::log_event(ErrorReporter::LogLevel level, TunError error,
                              const std::string& message, int native_code) const {
    if (!reporter_->is_enabled(level)) {
        return;
    }
    (void)reporter_->create_report(level, error)
        .category("tcp_conn")
        .component("TcpConnection")
        .message(message)
        .native_code(native_code)
        .connection(local_address_, remote_address_)
        .metadata("key", std::to_string(key_))
        .submit();
}

} // namespace core
} // namespace tunstack
