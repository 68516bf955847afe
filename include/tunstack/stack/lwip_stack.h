#ifndef TUNSTACK_STACK_LWIP_STACK_H
#define TUNSTACK_STACK_LWIP_STACK_H

#include <tunstack/config.h>
#include <tunstack/result.h>
#include <tunstack/stack/native_stack.h>

struct tcp_pcb;

namespace tunstack {
namespace core {
namespace stack {

/**
 * NativeStack over the lwIP raw TCP API.
 *
 * lwIP keeps its state in globals, so there is one instance per process.
 * The callback set is shared by every flow: set_recv() and friends record the
 * function once and point the pcb at a fixed lwIP-side trampoline.
 *
 * Like every NativeStack, only usable with StackLock held.
 */
class TUNSTACK_API LwipStack : public NativeStack {
public:
    static LwipStack& instance();

    LwipStack(const LwipStack&) = delete;
    LwipStack& operator=(const LwipStack&) = delete;

    /**
     * Open the catch-all listener that receives every inbound flow.
     * @return ALREADY_INITIALIZED when already listening
     */
    Result<void> listen();

    /** Close the listener. Established flows are not affected. */
    void stop_listening();

    bool is_listening() const { return listener_ != nullptr; }

    // NativeStack
    void set_accept(AcceptFn fn, void* arg) override;
    void set_arg(PcbHandle pcb, void* arg) override;
    void set_recv(PcbHandle pcb, RecvFn fn) override;
    void set_sent(PcbHandle pcb, SentFn fn) override;
    void set_err(PcbHandle pcb, ErrFn fn) override;
    void set_poll(PcbHandle pcb, PollFn fn, uint8_t interval) override;
    StackErr write(PcbHandle pcb, const uint8_t* data, uint16_t len, uint8_t flags) override;
    StackErr output(PcbHandle pcb) override;
    void recved(PcbHandle pcb, uint16_t len) override;
    uint16_t sndbuf(PcbHandle pcb) const override;
    uint32_t unacked(PcbHandle pcb) const override;
    NetworkAddress local_endpoint(PcbHandle pcb) const override;
    NetworkAddress remote_endpoint(PcbHandle pcb) const override;
    StackErr close(PcbHandle pcb) override;
    void abort(PcbHandle pcb) override;

private:
    LwipStack() = default;

    struct Trampolines;
    friend struct Trampolines;

    struct tcp_pcb* listener_ = nullptr;

    AcceptFn accept_fn_ = nullptr;
    void* accept_arg_ = nullptr;
    RecvFn recv_fn_ = nullptr;
    SentFn sent_fn_ = nullptr;
    ErrFn err_fn_ = nullptr;
    PollFn poll_fn_ = nullptr;
};

} // namespace stack
} // namespace core
} // namespace tunstack

#endif // TUNSTACK_STACK_LWIP_STACK_H
