#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace fieldsync {

using TimerId = uint64_t;

// Scheduled tasks owned by a component. Once cancel(id) returns, the task
// is not running and is never started again. A task may cancel itself; it
// then runs to completion. Callers must not hold a lock the task takes.
class TimerQueue {
public:
    using Task = std::function<void()>;

    virtual ~TimerQueue() = default;

    virtual TimerId schedule_after(std::chrono::milliseconds delay, Task task) = 0;
    virtual TimerId schedule_every(std::chrono::milliseconds interval, Task task) = 0;
    virtual void cancel(TimerId id) = 0;
    virtual void cancel_all() = 0;
    virtual size_t pending() const = 0;
};

// Runs tasks on a single worker thread. Destruction cancels everything and
// joins the worker, so nothing fires after the queue is gone.
class ThreadTimerQueue : public TimerQueue {
public:
    explicit ThreadTimerQueue(const std::string& name = "TimerQueue");
    ~ThreadTimerQueue() override;

    ThreadTimerQueue(const ThreadTimerQueue&) = delete;
    ThreadTimerQueue& operator=(const ThreadTimerQueue&) = delete;

    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override;
    TimerId schedule_every(std::chrono::milliseconds interval, Task task) override;
    void cancel(TimerId id) override;
    void cancel_all() override;
    size_t pending() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fieldsync
