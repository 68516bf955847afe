#include <tunstack/stack/tcp_callbacks.h>
#include <tunstack/connection/handler_registry.h>
#include <tunstack/connection/connection_registry.h>
#include <tunstack/error_reporter.h>
#include <mutex>

namespace tunstack {
namespace core {
namespace stack {

namespace {

std::mutex g_config_mutex;
ConnectionConfig g_config;
std::shared_ptr<ErrorReporter> g_reporter;

std::shared_ptr<ErrorReporter> reporter() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return g_reporter ? g_reporter : ErrorReporter::default_reporter();
}

// Unknown flow: nothing on this side can serve it
StackErr abort_unknown(NativeStack& stack, PcbHandle pcb, const char* callback) {
    auto log = reporter();
    TUNSTACK_REPORT_DEBUG(log, std::string(callback) + " for unknown connection, aborting");
    if (pcb != nullptr) {
        stack.abort(pcb);
    }
    return StackErr::ABRT;
}

} // namespace

StackErr to_stack_err(const Result<void>& result) {
    switch (result.error()) {
        case TunError::SUCCESS:
            return StackErr::OK;
        case TunError::CONNECTION_ABORTED:
        case TunError::CONNECTION_RESET:
            return StackErr::ABRT;
        case TunError::CONNECTION_CLOSED:
        case TunError::CONNECTION_LOCAL_CLOSED:
            return StackErr::CLSD;
        case TunError::HANDLER_CONNECT_FAILED:
        case TunError::HANDLER_FORWARD_FAILED:
            return StackErr::CONN;
        case TunError::OUT_OF_MEMORY:
            return StackErr::MEM;
        default:
            break;
    }
    if (is_stack_error(result.error()) && result.native_code() != 0) {
        return static_cast<StackErr>(result.native_code());
    }
    return StackErr::VAL;
}

void set_connection_config(const ConnectionConfig& config) {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    g_config = config;
}

ConnectionConfig connection_config() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return g_config;
}

void set_connection_reporter(std::shared_ptr<ErrorReporter> reporter) {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    g_reporter = std::move(reporter);
}

void install_tcp_acceptor(NativeStack& stack) {
    stack.set_accept(tcp_accept_cb, nullptr);
}

void uninstall_tcp_acceptor(NativeStack& stack) {
    stack.set_accept(nullptr, nullptr);
}

StackErr tcp_accept_cb(NativeStack& stack, void* /*arg*/, PcbHandle new_pcb, StackErr err) {
    if (err != StackErr::OK) {
        return err;
    }
    if (new_pcb == nullptr) {
        return StackErr::VAL;
    }

    ConnectionConfig config = connection_config();
    auto log = reporter();

    auto handler = HandlerRegistry::instance().get(config.network);
    if (!handler) {
        TUNSTACK_REPORT_WARNING(log, handler.error(), handler.error_message());
        stack.abort(new_pcb);
        return StackErr::ABRT;
    }

    auto conn = TcpConnection::create(stack, new_pcb, *handler, config, log);
    if (!conn) {
        // A reset during connect already freed the handle
        if (conn.error() != TunError::CONNECTION_RESET) {
            stack.abort(new_pcb);
        }
        return StackErr::ABRT;
    }
    return StackErr::OK;
}

StackErr tcp_recv_cb(NativeStack& stack, void* arg, PcbHandle pcb,
                     const uint8_t* data, size_t len, StackErr /*err*/) {
    auto conn = ConnectionRegistry::instance().find_by_arg(arg);
    if (!conn) {
        return abort_unknown(stack, pcb, "recv");
    }

    if (data == nullptr) {
        return conn->local_did_close();
    }

    auto result = conn->receive(data, len);
    if (result) {
        return StackErr::OK;
    }

    switch (result.error()) {
        case TunError::CONNECTION_ABORTED:
            return conn->check_state();
        case TunError::CONNECTION_CLOSED:
            // Dropped after close(), its window already reopened
            return StackErr::OK;
        default:
            // Handler refused; the engine keeps the data and redelivers it
            return StackErr::CONN;
    }
}

StackErr tcp_sent_cb(NativeStack& stack, void* arg, PcbHandle pcb, uint16_t len) {
    auto conn = ConnectionRegistry::instance().find_by_arg(arg);
    if (!conn) {
        return abort_unknown(stack, pcb, "sent");
    }
    return conn->sent(len);
}

void tcp_err_cb(NativeStack& /*stack*/, void* arg, StackErr err) {
    auto conn = ConnectionRegistry::instance().find_by_arg(arg);
    if (!conn) {
        return;
    }
    conn->err(err);
}

StackErr tcp_poll_cb(NativeStack& stack, void* arg, PcbHandle pcb) {
    auto conn = ConnectionRegistry::instance().find_by_arg(arg);
    if (!conn) {
        return abort_unknown(stack, pcb, "poll");
    }
    return conn->poll();
}

} // namespace stack
} // namespace core
} // namespace tunstack
