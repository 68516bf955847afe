#include <tunstack/stack/stack_lock.h>

namespace tunstack {
namespace core {
namespace stack {

StackLock& StackLock::instance() {
    static StackLock instance;
    return instance;
}

void StackLock::lock() {
    mutex_.lock();
    owner_.store(std::this_thread::get_id());
}

void StackLock::unlock() {
    owner_.store(std::thread::id());
    mutex_.unlock();
}

bool StackLock::try_lock() {
    if (!mutex_.try_lock()) {
        return false;
    }
    owner_.store(std::this_thread::get_id());
    return true;
}

bool StackLock::held_by_current_thread() const noexcept {
    return owner_.load() == std::this_thread::get_id();
}

ScopedStackUnlock::ScopedStackUnlock() : lock_(StackLock::instance()) {
    lock_.unlock();
}

ScopedStackUnlock::~ScopedStackUnlock() {
    lock_.lock();
}

} // namespace stack
} // namespace core
} // namespace tunstack
