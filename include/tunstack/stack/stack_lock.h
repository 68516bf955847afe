#ifndef TUNSTACK_STACK_STACK_LOCK_H
#define TUNSTACK_STACK_STACK_LOCK_H

#include <tunstack/config.h>
#include <mutex>
#include <atomic>
#include <thread>

namespace tunstack {
namespace core {
namespace stack {

/**
 * Process-wide serialization lock around the packet engine.
 *
 * The capture loop and every thread that touches a native handle must go
 * through the same instance. Satisfies Lockable, so std::lock_guard and
 * std::unique_lock work with it. Not recursive.
 */
class TUNSTACK_API StackLock {
public:
    static StackLock& instance();

    void lock();
    void unlock();
    bool try_lock();

    /** True when the calling thread is the current owner. */
    bool held_by_current_thread() const noexcept;

    StackLock(const StackLock&) = delete;
    StackLock& operator=(const StackLock&) = delete;

private:
    StackLock() = default;

    std::mutex mutex_;
    std::atomic<std::thread::id> owner_{};
};

/**
 * Releases the stack lock for the lifetime of the object and takes it back
 * on destruction. Used around calls into the connection handler so that a
 * slow handler does not stall every other flow. The calling thread must hold
 * the lock on construction.
 */
class TUNSTACK_API ScopedStackUnlock {
public:
    ScopedStackUnlock();
    ~ScopedStackUnlock();

    ScopedStackUnlock(const ScopedStackUnlock&) = delete;
    ScopedStackUnlock& operator=(const ScopedStackUnlock&) = delete;

private:
    StackLock& lock_;
};

using StackGuard = std::lock_guard<StackLock>;

} // namespace stack
} // namespace core
} // namespace tunstack

#endif // TUNSTACK_STACK_STACK_LOCK_H
