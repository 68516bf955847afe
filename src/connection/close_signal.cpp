#include <tunstack/connection/close_signal.h>

namespace tunstack {
namespace core {

bool CloseSignal::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (triggered_) {
            return false;
        }
        triggered_ = true;
    }
    cv_.notify_all();
    return true;
}

bool CloseSignal::is_triggered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return triggered_;
}

void CloseSignal::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return triggered_; });
}

bool CloseSignal::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return triggered_; });
}

} // namespace core
} // namespace tunstack
