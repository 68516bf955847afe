#ifndef TUNSTACK_CONNECTION_CLOSE_SIGNAL_H
#define TUNSTACK_CONNECTION_CLOSE_SIGNAL_H

#include <tunstack/config.h>
#include <mutex>
#include <condition_variable>
#include <chrono>

namespace tunstack {
namespace core {

/**
 * One-shot cancellation token.
 *
 * Triggered exactly once, when the owning connection releases its native
 * resources. Handler-side code waits on it to stop relaying for a flow.
 */
class TUNSTACK_API CloseSignal {
public:
    CloseSignal() = default;

    CloseSignal(const CloseSignal&) = delete;
    CloseSignal& operator=(const CloseSignal&) = delete;

    /**
     * Fire the signal and wake every waiter.
     * @return true for the call that actually fired it
     */
    bool trigger();

    bool is_triggered() const;

    void wait() const;

    /** @return true if triggered before the timeout expired */
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool triggered_ = false;
};

} // namespace core
} // namespace tunstack

#endif // TUNSTACK_CONNECTION_CLOSE_SIGNAL_H
