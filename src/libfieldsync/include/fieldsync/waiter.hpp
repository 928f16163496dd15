#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace fieldsync {

// Cancellable suspension used between retry attempts.
class Waiter {
public:
    virtual ~Waiter() = default;

    // Suspends the caller for `delay`. Returns false if the waiter was
    // cancelled before or during the wait.
    virtual bool wait_for(std::chrono::milliseconds delay) = 0;

    // Wakes every current waiter; later waits fail until reset().
    virtual void cancel() = 0;
    virtual void reset() = 0;
    virtual bool cancelled() const = 0;
};

class SteadyWaiter : public Waiter {
public:
    bool wait_for(std::chrono::milliseconds delay) override;
    void cancel() override;
    void reset() override;
    bool cancelled() const override;

private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool cancelled_ = false;
};

} // namespace fieldsync
