#ifndef TUNSTACK_CONNECTION_H
#define TUNSTACK_CONNECTION_H

#include <tunstack/config.h>
#include <tunstack/error.h>
#include <tunstack/result.h>
#include <tunstack/types.h>
#include <tunstack/error_reporter.h>
#include <tunstack/stack/native_stack.h>
#include <tunstack/connection/close_signal.h>
#include <tunstack/connection/connection_registry.h>

#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace tunstack {
namespace core {

class Connection;

/**
 * Proxy-side consumer of TCP flows.
 *
 * All methods are invoked with the stack lock released, so implementations
 * may block and may call back into the Connection (write, close, abort).
 */
class TUNSTACK_API ConnectionHandler {
public:
    virtual ~ConnectionHandler() = default;

    /**
     * A new flow was accepted.
     * @param target the destination the client was trying to reach
     * @return an error rejects the flow and aborts it
     */
    virtual Result<void> connect(const std::shared_ptr<Connection>& connection,
                                 const NetworkAddress& target) = 0;

    /**
     * Client bytes to forward upstream. An error leaves the bytes with the
     * engine for later redelivery.
     */
    virtual Result<void> did_receive(const std::shared_ptr<Connection>& connection,
                                     const uint8_t* data, size_t len) = 0;

    // Peer acknowledged len bytes
    virtual void did_send(const std::shared_ptr<Connection>& connection, uint16_t len) = 0;

    // Client sent end-of-stream
    virtual void local_did_close(const std::shared_ptr<Connection>& connection) = 0;

    // The engine tore the flow down (reset or fatal error)
    virtual void did_close(const std::shared_ptr<Connection>& connection) = 0;
};

/**
 * Handler-facing view of a TCP flow. Every method is safe to call from any
 * thread that does not hold the stack lock.
 */
class TUNSTACK_API Connection {
public:
    virtual ~Connection() = default;

    // Client endpoint
    virtual const NetworkAddress& local_address() const = 0;
    // Destination endpoint
    virtual const NetworkAddress& remote_address() const = 0;

    /**
     * Blocking write toward the client. Blocks while the engine's send buffer
     * is full.
     *
     * @param bytes_accepted when not null, receives the number of bytes the
     *        engine took, also on failure
     * @return bytes accepted, or the first error
     */
    virtual Result<size_t> write(const uint8_t* data, size_t len,
                                 size_t* bytes_accepted = nullptr) = 0;

    Result<size_t> write(const std::vector<uint8_t>& data, size_t* bytes_accepted = nullptr) {
        return write(data.data(), data.size(), bytes_accepted);
    }

    /** Request a graceful close once pending data is acknowledged. */
    virtual Result<void> close() = 0;

    /** Request a hard reset. Idempotent. */
    virtual void abort() = 0;

    /** Fires once the flow's native resources are gone. */
    virtual const CloseSignal& closed() const = 0;
};

/**
 * Connection configuration parameters
 */
struct ConnectionConfig {
    // Engine coarse-timer ticks between poll callbacks
    uint8_t poll_interval = TCP_POLL_INTERVAL;

    // Retries on identity key collision
    uint32_t key_allocation_attempts = DEFAULT_KEY_ALLOCATION_ATTEMPTS;

    // Handler registry key
    std::string network = NETWORK_TCP;

    ConnectionConfig() = default;
};

/**
 * Connection statistics and metrics
 */
struct ConnectionStats {
    // Data transfer metrics
    uint64_t bytes_received = 0;      // forwarded to the handler
    uint64_t bytes_sent = 0;          // accepted by the engine
    uint64_t bytes_acknowledged = 0;

    // Flow control
    uint32_t write_waits = 0;
    uint32_t receive_failures = 0;

    // Connection timing
    std::chrono::steady_clock::time_point connection_start;
    std::chrono::steady_clock::time_point last_activity;

    ConnectionStats() {
        connection_start = std::chrono::steady_clock::now();
        last_activity = connection_start;
    }
};

/**
 * TCP flow bound to one native handle.
 *
 * Created from the engine's accept callback with the stack lock held and
 * driven by the engine callbacks afterwards. The registry holds the owning
 * reference until one release path (graceful, forced or engine error) runs.
 *
 * Lock order is writer mutex, then stack lock, then state mutex. The state
 * mutex is never held while acquiring another lock.
 */
class TUNSTACK_API TcpConnection : public Connection,
                                   public std::enable_shared_from_this<TcpConnection> {
public:
    /**
     * Bind a new native handle. Must be called with the stack lock held; the
     * lock is released while handler->connect() runs.
     *
     * On failure the registry entry is gone and the callbacks are detached;
     * the caller still owns the handle and must abort it, unless the error is
     * CONNECTION_RESET, which means the engine already freed it.
     */
    static Result<std::shared_ptr<TcpConnection>> create(
        stack::NativeStack& stack,
        stack::PcbHandle pcb,
        std::shared_ptr<ConnectionHandler> handler,
        const ConnectionConfig& config = ConnectionConfig(),
        std::shared_ptr<ErrorReporter> reporter = nullptr
    );

    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    // Connection
    const NetworkAddress& local_address() const override { return local_address_; }
    const NetworkAddress& remote_address() const override { return remote_address_; }
    using Connection::write;
    Result<size_t> write(const uint8_t* data, size_t len, size_t* bytes_accepted = nullptr) override;
    Result<void> close() override;
    void abort() override;
    const CloseSignal& closed() const override { return close_signal_; }

    // ========== Engine callback entry points (stack lock held) ==========

    /**
     * Forward client bytes to the handler and reopen the receive window.
     * Bytes dropped after close() still reopen the window.
     * @return CONNECTION_CLOSED or CONNECTION_ABORTED when the flow no longer
     *         takes data, HANDLER_FORWARD_FAILED when the handler refused it
     */
    Result<void> receive(const uint8_t* data, size_t len);

    stack::StackErr sent(uint16_t len);

    stack::StackErr local_did_close();

    /**
     * Reconcile the lifecycle state with the engine. Releases the handle once
     * an abort is pending or a close is pending and the send buffer drained.
     * @return ABRT once the handle is gone, including a failed close that
     *         fell back to an abort; OK otherwise
     */
    stack::StackErr check_state();

    stack::StackErr poll();

    // The engine already freed the handle
    void err(stack::StackErr error);

    // ========== Introspection ==========

    ConnKey key() const { return key_; }
    stack::PcbHandle native_handle() const { return pcb_; }
    ConnectionState get_state() const;
    bool is_local_closed() const;
    bool is_close_requested() const;
    ConnectionStats get_stats() const;
    const ConnectionConfig& get_config() const { return config_; }

private:
    TcpConnection(stack::NativeStack& stack,
                  stack::PcbHandle pcb,
                  std::shared_ptr<ConnectionHandler> handler,
                  const ConnectionConfig& config,
                  std::shared_ptr<ErrorReporter> reporter);

    // State machine, state_mutex_ held
    bool is_valid_state_transition(ConnectionState from, ConnectionState to) const;
    bool transition_state(ConnectionState new_state);

    // Attempt a transition; true only for the caller that performed it
    bool try_transition(ConnectionState new_state);

    void attach_callbacks(ConnKeyArg* slot);
    void detach_callbacks();
    Result<void> release_graceful();
    void release_forced();
    void open_receive_window(size_t len);

    void broadcast_write_gate();
    Result<void> check_writable() const;
    std::string describe() const;
    void update_last_activity();
    void log_event(ErrorReporter::LogLevel level, TunError error,
                   const std::string& message, int native_code = 0) const;

    stack::NativeStack& stack_;
    stack::PcbHandle pcb_;
    std::shared_ptr<ConnectionHandler> handler_;
    std::shared_ptr<ErrorReporter> reporter_;
    ConnectionConfig config_;

    NetworkAddress local_address_;
    NetworkAddress remote_address_;
    ConnKey key_ = 0;

    // Lifecycle
    mutable std::mutex state_mutex_;
    ConnectionState state_ = ConnectionState::OPEN;
    bool local_closed_ = false;
    bool close_requested_ = false;

    CloseSignal close_signal_;

    // Writers are serialized; the gate has its own mutex so the engine side
    // can broadcast without taking the writer mutex
    std::mutex writer_mutex_;
    std::mutex gate_mutex_;
    std::condition_variable write_gate_;
    uint64_t gate_generation_ = 0;

    // Statistics
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> bytes_acknowledged_{0};
    std::atomic<uint32_t> write_waits_{0};
    std::atomic<uint32_t> receive_failures_{0};
    const std::chrono::steady_clock::time_point connection_start_;
    std::atomic<int64_t> last_activity_ns_{0};
};

} // namespace core
} // namespace tunstack

#endif // TUNSTACK_CONNECTION_H
