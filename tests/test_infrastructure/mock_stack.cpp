#include "mock_stack.h"
#include <tunstack/stack/stack_lock.h>
#include <algorithm>

namespace tunstack {
namespace test {

using core::stack::PcbHandle;
using core::stack::StackErr;
using core::stack::StackGuard;
using core::stack::StackLock;

namespace {

const uint8_t EMPTY_PAYLOAD = 0;

} // namespace

core::NetworkAddress ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint16_t port) {
    uint32_t addr = (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
                    (static_cast<uint32_t>(c) << 8) | static_cast<uint32_t>(d);
    return core::NetworkAddress::from_ipv4(addr, port);
}

MockStack::MockStack() = default;

MockStack::~MockStack() = default;

PcbHandle MockStack::add_pcb(const core::NetworkAddress& client,
                             const core::NetworkAddress& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = std::make_unique<PcbRecord>();
    record->local = destination;
    record->remote = client;
    PcbHandle handle = reinterpret_cast<PcbHandle>(record.get());
    pcbs_.push_back(std::move(record));
    return handle;
}

StackErr MockStack::open_flow(const core::NetworkAddress& client,
                              const core::NetworkAddress& destination,
                              PcbHandle* out_pcb) {
    PcbHandle pcb = add_pcb(client, destination);
    if (out_pcb) {
        *out_pcb = pcb;
    }

    StackGuard guard(StackLock::instance());
    core::stack::AcceptFn fn;
    void* arg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn = accept_fn_;
        arg = accept_arg_;
    }
    if (fn == nullptr) {
        return StackErr::CONN;
    }
    return finish_callback(pcb, fn(*this, arg, pcb, StackErr::OK));
}

StackErr MockStack::deliver(PcbHandle pcb, const std::vector<uint8_t>& data) {
    StackGuard guard(StackLock::instance());
    core::stack::RecvFn fn;
    void* arg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PcbRecord& rec = lookup(pcb);
        if (rec.freed) {
            return StackErr::CLSD;
        }
        fn = rec.recv;
        arg = rec.arg;
    }
    if (fn == nullptr) {
        return StackErr::OK;
    }
    const uint8_t* payload = data.empty() ? &EMPTY_PAYLOAD : data.data();
    return finish_callback(pcb, fn(*this, arg, pcb, payload, data.size(), StackErr::OK));
}

StackErr MockStack::deliver_eof(PcbHandle pcb) {
    StackGuard guard(StackLock::instance());
    core::stack::RecvFn fn;
    void* arg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PcbRecord& rec = lookup(pcb);
        if (rec.freed) {
            return StackErr::CLSD;
        }
        fn = rec.recv;
        arg = rec.arg;
    }
    if (fn == nullptr) {
        return StackErr::OK;
    }
    return finish_callback(pcb, fn(*this, arg, pcb, nullptr, 0, StackErr::OK));
}

StackErr MockStack::acknowledge(PcbHandle pcb, uint16_t len) {
    StackGuard guard(StackLock::instance());
    core::stack::SentFn fn;
    void* arg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PcbRecord& rec = lookup(pcb);
        if (rec.freed) {
            return StackErr::CLSD;
        }
        rec.unacked -= std::min<uint32_t>(len, rec.unacked);
        fn = rec.sent;
        arg = rec.arg;
    }
    if (fn == nullptr) {
        return StackErr::OK;
    }
    return finish_callback(pcb, fn(*this, arg, pcb, len));
}

StackErr MockStack::poll(PcbHandle pcb) {
    StackGuard guard(StackLock::instance());
    core::stack::PollFn fn;
    void* arg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PcbRecord& rec = lookup(pcb);
        if (rec.freed) {
            return StackErr::CLSD;
        }
        fn = rec.poll;
        arg = rec.arg;
    }
    if (fn == nullptr) {
        return StackErr::OK;
    }
    return finish_callback(pcb, fn(*this, arg, pcb));
}

void MockStack::fail(PcbHandle pcb, StackErr err) {
    StackGuard guard(StackLock::instance());
    core::stack::ErrFn fn;
    void* arg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PcbRecord& rec = lookup(pcb);
        if (rec.freed) {
            return;
        }
        // The engine frees the pcb before reporting
        rec.freed = true;
        rec.aborted = true;
        fn = rec.err;
        arg = rec.arg;
    }
    if (fn != nullptr) {
        fn(*this, arg, err);
    }
}

void MockStack::set_send_limit(PcbHandle pcb, uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    lookup(pcb).send_limit = limit;
}

void MockStack::inject_write_error(PcbHandle pcb, StackErr err) {
    std::lock_guard<std::mutex> lock(mutex_);
    lookup(pcb).write_errors.push_back(err);
}

void MockStack::set_close_result(PcbHandle pcb, StackErr err) {
    std::lock_guard<std::mutex> lock(mutex_);
    lookup(pcb).close_result = err;
}

MockStack::PcbRecord MockStack::record(PcbHandle pcb) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(pcb);
}

bool MockStack::has_callbacks(PcbHandle pcb) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PcbRecord& rec = lookup(pcb);
    return rec.arg != nullptr || rec.recv != nullptr || rec.sent != nullptr ||
           rec.err != nullptr || rec.poll != nullptr;
}

bool MockStack::has_acceptor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accept_fn_ != nullptr;
}

// NativeStack

void MockStack::set_accept(core::stack::AcceptFn fn, void* arg) {
    if (!StackLock::instance().held_by_current_thread()) {
        lock_violations_++;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    accept_fn_ = fn;
    accept_arg_ = arg;
}

void MockStack::set_arg(PcbHandle pcb, void* arg) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    rec.arg = arg;
}

void MockStack::set_recv(PcbHandle pcb, core::stack::RecvFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    rec.recv = fn;
}

void MockStack::set_sent(PcbHandle pcb, core::stack::SentFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    rec.sent = fn;
}

void MockStack::set_err(PcbHandle pcb, core::stack::ErrFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    rec.err = fn;
}

void MockStack::set_poll(PcbHandle pcb, core::stack::PollFn fn, uint8_t interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    rec.poll = fn;
    rec.poll_interval = interval;
}

StackErr MockStack::write(PcbHandle pcb, const uint8_t* data, uint16_t len, uint8_t /*flags*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    if (rec.freed) {
        return StackErr::CLSD;
    }
    if (!rec.write_errors.empty()) {
        StackErr err = rec.write_errors.front();
        rec.write_errors.pop_front();
        return err;
    }
    uint32_t space = rec.send_limit > rec.unacked ? rec.send_limit - rec.unacked : 0;
    if (len > space) {
        return StackErr::MEM;
    }
    rec.written.insert(rec.written.end(), data, data + len);
    rec.write_sizes.push_back(len);
    rec.unacked += len;
    return StackErr::OK;
}

StackErr MockStack::output(PcbHandle pcb) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    rec.output_calls++;
    return StackErr::OK;
}

void MockStack::recved(PcbHandle pcb, uint16_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    rec.recved.push_back(len);
}

uint16_t MockStack::sndbuf(PcbHandle pcb) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PcbRecord& rec = lookup(pcb);
    check_access(rec);
    uint32_t space = rec.send_limit > rec.unacked ? rec.send_limit - rec.unacked : 0;
    return static_cast<uint16_t>(std::min<uint32_t>(space, UNLIMITED));
}

uint32_t MockStack::unacked(PcbHandle pcb) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PcbRecord& rec = lookup(pcb);
    check_access(rec);
    return rec.unacked;
}

core::NetworkAddress MockStack::local_endpoint(PcbHandle pcb) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PcbRecord& rec = lookup(pcb);
    check_access(rec);
    return rec.local;
}

core::NetworkAddress MockStack::remote_endpoint(PcbHandle pcb) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PcbRecord& rec = lookup(pcb);
    check_access(rec);
    return rec.remote;
}

StackErr MockStack::close(PcbHandle pcb) {
    std::lock_guard<std::mutex> lock(mutex_);
    PcbRecord& rec = lookup(pcb);
    check_access(rec);
    rec.close_calls++;
    if (rec.close_result == StackErr::OK) {
        rec.freed = true;
    }
    return rec.close_result;
}

void MockStack::abort(PcbHandle pcb) {
    core::stack::ErrFn fn;
    void* arg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PcbRecord& rec = lookup(pcb);
        check_access(rec);
        rec.abort_calls++;
        rec.freed = true;
        rec.aborted = true;
        fn = rec.err;
        arg = rec.arg;
    }
    // Like lwIP, an abort is reported through the err callback if one is set
    if (fn != nullptr) {
        fn(*this, arg, StackErr::ABRT);
    }
}

// lwIP keeps using a pcb after any callback return other than ERR_ABRT
StackErr MockStack::finish_callback(PcbHandle pcb, StackErr result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lookup(pcb).aborted && result != StackErr::ABRT) {
        missed_abort_returns_++;
    }
    return result;
}

MockStack::PcbRecord& MockStack::lookup(PcbHandle pcb) const {
    return *reinterpret_cast<PcbRecord*>(pcb);
}

void MockStack::check_access(const PcbRecord& record) const {
    if (!StackLock::instance().held_by_current_thread()) {
        lock_violations_++;
    }
    if (record.freed) {
        use_after_free_++;
    }
}

} // namespace test
} // namespace tunstack
