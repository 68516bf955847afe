#ifndef TUNSTACK_STACK_TCP_CALLBACKS_H
#define TUNSTACK_STACK_TCP_CALLBACKS_H

#include <tunstack/config.h>
#include <tunstack/result.h>
#include <tunstack/stack/native_stack.h>
#include <tunstack/connection.h>

namespace tunstack {
namespace core {
namespace stack {

/**
 * Engine-facing trampolines. The argument slot is resolved to a connection
 * through ConnectionRegistry; a slot that no longer resolves means the flow is
 * unknown and the handle is aborted.
 */
TUNSTACK_API StackErr tcp_accept_cb(NativeStack& stack, void* arg, PcbHandle new_pcb, StackErr err);
TUNSTACK_API StackErr tcp_recv_cb(NativeStack& stack, void* arg, PcbHandle pcb,
                                  const uint8_t* data, size_t len, StackErr err);
TUNSTACK_API StackErr tcp_sent_cb(NativeStack& stack, void* arg, PcbHandle pcb, uint16_t len);
TUNSTACK_API void tcp_err_cb(NativeStack& stack, void* arg, StackErr err);
TUNSTACK_API StackErr tcp_poll_cb(NativeStack& stack, void* arg, PcbHandle pcb);

/** Configuration applied to connections created by tcp_accept_cb. */
TUNSTACK_API void set_connection_config(const ConnectionConfig& config);
TUNSTACK_API ConnectionConfig connection_config();

/** Reporter handed to accepted connections, nullptr selects the default. */
TUNSTACK_API void set_connection_reporter(std::shared_ptr<ErrorReporter> reporter);

/** Route the engine's accept events to tcp_accept_cb. Stack lock must be held. */
TUNSTACK_API void install_tcp_acceptor(NativeStack& stack);
TUNSTACK_API void uninstall_tcp_acceptor(NativeStack& stack);

/** Engine code for a connection-level result. */
TUNSTACK_API StackErr to_stack_err(const Result<void>& result);

} // namespace stack
} // namespace core
} // namespace tunstack

#endif // TUNSTACK_STACK_TCP_CALLBACKS_H
