#include "fieldsync/waiter.hpp"

namespace fieldsync {

bool SteadyWaiter::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_) return false;
    cond_.wait_for(lock, delay, [this]() { return cancelled_; });
    return !cancelled_;
}

void SteadyWaiter::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cond_.notify_all();
}

void SteadyWaiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}

bool SteadyWaiter::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

} // namespace fieldsync
