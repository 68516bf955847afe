#include <tunstack/stack/lwip_stack.h>

#include <lwip/tcp.h>
#include <lwip/pbuf.h>
#include <lwip/ip_addr.h>
#include <lwip/def.h>

#include <array>
#include <vector>

namespace tunstack {
namespace core {
namespace stack {

namespace {

// StackErr values are lwIP's err_t values
StackErr from_lwip(err_t err) {
    return static_cast<StackErr>(err);
}

err_t to_lwip(StackErr err) {
    return static_cast<err_t>(err);
}

struct tcp_pcb* to_pcb(PcbHandle handle) {
    return reinterpret_cast<struct tcp_pcb*>(handle);
}

PcbHandle to_handle(struct tcp_pcb* pcb) {
    return reinterpret_cast<PcbHandle>(pcb);
}

NetworkAddress to_address(const ip_addr_t& ip, u16_t port) {
#if LWIP_IPV6
    if (IP_IS_V6_VAL(ip)) {
        const ip6_addr_t* addr6 = ip_2_ip6(&ip);
        std::array<uint8_t, 16> bytes{};
        for (size_t word = 0; word < 4; ++word) {
            uint32_t value = lwip_ntohl(addr6->addr[word]);
            bytes[word * 4] = static_cast<uint8_t>(value >> 24);
            bytes[word * 4 + 1] = static_cast<uint8_t>(value >> 16);
            bytes[word * 4 + 2] = static_cast<uint8_t>(value >> 8);
            bytes[word * 4 + 3] = static_cast<uint8_t>(value);
        }
        return NetworkAddress::from_ipv6(bytes, port);
    }
#endif
#if LWIP_IPV4
    return NetworkAddress::from_ipv4(lwip_ntohl(ip4_addr_get_u32(ip_2_ip4(&ip))), port);
#else
    return NetworkAddress();
#endif
}

const uint8_t EMPTY_PAYLOAD = 0;

} // namespace

struct LwipStack::Trampolines {
    static err_t accept(void* arg, struct tcp_pcb* newpcb, err_t err) {
        LwipStack& self = LwipStack::instance();
        if (self.accept_fn_ == nullptr) {
            if (newpcb != nullptr) {
                tcp_abort(newpcb);
            }
            return ERR_ABRT;
        }
        (void)arg;
        return to_lwip(self.accept_fn_(self, self.accept_arg_, to_handle(newpcb), from_lwip(err)));
    }

    static err_t recv(void* arg, struct tcp_pcb* tpcb, struct pbuf* p, err_t err) {
        LwipStack& self = LwipStack::instance();
        if (self.recv_fn_ == nullptr) {
            if (p != nullptr) {
                tcp_recved(tpcb, p->tot_len);
                pbuf_free(p);
            }
            return ERR_OK;
        }

        if (p == nullptr) {
            return to_lwip(self.recv_fn_(self, arg, to_handle(tpcb), nullptr, 0, from_lwip(err)));
        }

        std::vector<uint8_t> buffer(p->tot_len);
        if (!buffer.empty()) {
            pbuf_copy_partial(p, buffer.data(), p->tot_len, 0);
        }
        const uint8_t* data = buffer.empty() ? &EMPTY_PAYLOAD : buffer.data();

        StackErr result = self.recv_fn_(self, arg, to_handle(tpcb), data, buffer.size(), from_lwip(err));
        // On any other code lwIP keeps the pbuf as refused data
        if (result == StackErr::OK || result == StackErr::ABRT) {
            pbuf_free(p);
        }
        return to_lwip(result);
    }

    static err_t sent(void* arg, struct tcp_pcb* tpcb, u16_t len) {
        LwipStack& self = LwipStack::instance();
        if (self.sent_fn_ == nullptr) {
            return ERR_OK;
        }
        return to_lwip(self.sent_fn_(self, arg, to_handle(tpcb), len));
    }

    static void error(void* arg, err_t err) {
        LwipStack& self = LwipStack::instance();
        if (self.err_fn_ != nullptr) {
            self.err_fn_(self, arg, from_lwip(err));
        }
    }

    static err_t poll(void* arg, struct tcp_pcb* tpcb) {
        LwipStack& self = LwipStack::instance();
        if (self.poll_fn_ == nullptr) {
            return ERR_OK;
        }
        return to_lwip(self.poll_fn_(self, arg, to_handle(tpcb)));
    }
};

LwipStack& LwipStack::instance() {
    static LwipStack instance;
    return instance;
}

Result<void> LwipStack::listen() {
    if (listener_ != nullptr) {
        return make_error<void>(TunError::ALREADY_INITIALIZED);
    }

    struct tcp_pcb* pcb = tcp_new_ip_type(IPADDR_TYPE_ANY);
    if (pcb == nullptr) {
        return make_error<void>(TunError::OUT_OF_MEMORY, "tcp_new failed");
    }

    err_t err = tcp_bind(pcb, IP_ANY_TYPE, 0);
    if (err != ERR_OK) {
        tcp_abort(pcb);
        return make_error<void>(TunError::STACK_ERROR,
                                "tcp_bind failed with error code: " + std::to_string(err), err);
    }

    struct tcp_pcb* listener = tcp_listen(pcb);
    if (listener == nullptr) {
        tcp_abort(pcb);
        return make_error<void>(TunError::OUT_OF_MEMORY, "tcp_listen failed");
    }

    tcp_arg(listener, this);
    tcp_accept(listener, &Trampolines::accept);
    listener_ = listener;
    return make_result();
}

void LwipStack::stop_listening() {
    if (listener_ == nullptr) {
        return;
    }
    tcp_accept(listener_, nullptr);
    if (tcp_close(listener_) != ERR_OK) {
        tcp_abort(listener_);
    }
    listener_ = nullptr;
}

void LwipStack::set_accept(AcceptFn fn, void* arg) {
    accept_fn_ = fn;
    accept_arg_ = arg;
}

void LwipStack::set_arg(PcbHandle pcb, void* arg) {
    tcp_arg(to_pcb(pcb), arg);
}

void LwipStack::set_recv(PcbHandle pcb, RecvFn fn) {
    if (fn != nullptr) {
        recv_fn_ = fn;
    }
    tcp_recv(to_pcb(pcb), fn != nullptr ? &Trampolines::recv : nullptr);
}

void LwipStack::set_sent(PcbHandle pcb, SentFn fn) {
    if (fn != nullptr) {
        sent_fn_ = fn;
    }
    tcp_sent(to_pcb(pcb), fn != nullptr ? &Trampolines::sent : nullptr);
}

void LwipStack::set_err(PcbHandle pcb, ErrFn fn) {
    if (fn != nullptr) {
        err_fn_ = fn;
    }
    tcp_err(to_pcb(pcb), fn != nullptr ? &Trampolines::error : nullptr);
}

void LwipStack::set_poll(PcbHandle pcb, PollFn fn, uint8_t interval) {
    if (fn != nullptr) {
        poll_fn_ = fn;
    }
    tcp_poll(to_pcb(pcb), fn != nullptr ? &Trampolines::poll : nullptr, interval);
}

StackErr LwipStack::write(PcbHandle pcb, const uint8_t* data, uint16_t len, uint8_t flags) {
    u8_t apiflags = 0;
    if (flags & WRITE_FLAG_COPY) {
        apiflags |= TCP_WRITE_FLAG_COPY;
    }
    if (flags & WRITE_FLAG_MORE) {
        apiflags |= TCP_WRITE_FLAG_MORE;
    }
    return from_lwip(tcp_write(to_pcb(pcb), data, len, apiflags));
}

StackErr LwipStack::output(PcbHandle pcb) {
    return from_lwip(tcp_output(to_pcb(pcb)));
}

void LwipStack::recved(PcbHandle pcb, uint16_t len) {
    tcp_recved(to_pcb(pcb), len);
}

uint16_t LwipStack::sndbuf(PcbHandle pcb) const {
    return static_cast<uint16_t>(tcp_sndbuf(to_pcb(pcb)));
}

uint32_t LwipStack::unacked(PcbHandle pcb) const {
    const struct tcp_pcb* tpcb = to_pcb(pcb);
    return tpcb->snd_lbb - tpcb->lastack;
}

NetworkAddress LwipStack::local_endpoint(PcbHandle pcb) const {
    const struct tcp_pcb* tpcb = to_pcb(pcb);
    return to_address(tpcb->local_ip, tpcb->local_port);
}

NetworkAddress LwipStack::remote_endpoint(PcbHandle pcb) const {
    const struct tcp_pcb* tpcb = to_pcb(pcb);
    return to_address(tpcb->remote_ip, tpcb->remote_port);
}

StackErr LwipStack::close(PcbHandle pcb) {
    return from_lwip(tcp_close(to_pcb(pcb)));
}

void LwipStack::abort(PcbHandle pcb) {
    tcp_abort(to_pcb(pcb));
}

} // namespace stack
} // namespace core
} // namespace tunstack
