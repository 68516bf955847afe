#ifndef TUNSTACK_STACK_NATIVE_STACK_H
#define TUNSTACK_STACK_NATIVE_STACK_H

#include <tunstack/config.h>
#include <tunstack/types.h>
#include <cstdint>
#include <cstddef>
#include <string>

namespace tunstack {
namespace core {
namespace stack {

/**
 * Engine-owned record of one TCP flow. Never defined on this side of the
 * boundary; only handled through PcbHandle.
 */
struct Pcb;
using PcbHandle = Pcb*;

/**
 * Engine status codes. Values match lwIP's err_t so adapters can cast.
 */
enum class StackErr : int8_t {
    OK = 0,            // No error
    MEM = -1,          // Out of memory, try later
    BUF = -2,          // Buffer error
    TIMEOUT = -3,      // Timeout
    RTE = -4,          // Routing problem
    INPROGRESS = -5,   // Operation in progress
    VAL = -6,          // Illegal value
    WOULDBLOCK = -7,   // Operation would block
    USE = -8,          // Address in use
    ALREADY = -9,      // Already connecting
    ISCONN = -10,      // Already connected
    CONN = -11,        // Not connected
    IF = -12,          // Low-level netif error
    ABRT = -13,        // Connection aborted
    RST = -14,         // Connection reset
    CLSD = -15,        // Connection closed
    ARG = -16          // Illegal argument
};

TUNSTACK_API std::string to_string(StackErr err);

// write() flags
constexpr uint8_t WRITE_FLAG_COPY = 0x01;
constexpr uint8_t WRITE_FLAG_MORE = 0x02;

class NativeStack;

// Callback signatures. The engine passes itself, the per-flow argument slot
// installed with set_arg() and the flow handle.
using AcceptFn = StackErr (*)(NativeStack& stack, void* arg, PcbHandle new_pcb, StackErr err);
using RecvFn = StackErr (*)(NativeStack& stack, void* arg, PcbHandle pcb,
                            const uint8_t* data, size_t len, StackErr err);
using SentFn = StackErr (*)(NativeStack& stack, void* arg, PcbHandle pcb, uint16_t len);
using ErrFn = void (*)(NativeStack& stack, void* arg, StackErr err);
using PollFn = StackErr (*)(NativeStack& stack, void* arg, PcbHandle pcb);

/**
 * Contract of the single-threaded packet engine.
 *
 * Every method must be called with StackLock held, and every callback is
 * invoked by the engine with StackLock held. A handle stays valid until the
 * engine reports an error for it, or until close() succeeds or abort() is
 * called on it.
 *
 * A RecvFn invoked with data == nullptr signals end-of-stream from the peer.
 * A RecvFn returning anything other than OK or ABRT leaves the data with the
 * engine, which redelivers it later.
 */
class TUNSTACK_API NativeStack {
public:
    virtual ~NativeStack() = default;

    // Listener
    virtual void set_accept(AcceptFn fn, void* arg) = 0;

    // Per-flow callback installation
    virtual void set_arg(PcbHandle pcb, void* arg) = 0;
    virtual void set_recv(PcbHandle pcb, RecvFn fn) = 0;
    virtual void set_sent(PcbHandle pcb, SentFn fn) = 0;
    virtual void set_err(PcbHandle pcb, ErrFn fn) = 0;
    virtual void set_poll(PcbHandle pcb, PollFn fn, uint8_t interval) = 0;

    // Data path
    virtual StackErr write(PcbHandle pcb, const uint8_t* data, uint16_t len, uint8_t flags) = 0;
    virtual StackErr output(PcbHandle pcb) = 0;
    virtual void recved(PcbHandle pcb, uint16_t len) = 0;

    // Free space in the send buffer
    virtual uint16_t sndbuf(PcbHandle pcb) const = 0;

    // Bytes written but not yet acknowledged by the peer
    virtual uint32_t unacked(PcbHandle pcb) const = 0;

    virtual NetworkAddress local_endpoint(PcbHandle pcb) const = 0;
    virtual NetworkAddress remote_endpoint(PcbHandle pcb) const = 0;

    // Teardown
    virtual StackErr close(PcbHandle pcb) = 0;
    virtual void abort(PcbHandle pcb) = 0;
};

} // namespace stack
} // namespace core
} // namespace tunstack

#endif // TUNSTACK_STACK_NATIVE_STACK_H
