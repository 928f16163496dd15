#pragma once

#include "fieldsync/timer_queue.hpp"
#include <algorithm>
#include <map>
#include <mutex>

namespace fieldsync {
namespace testing {

// Virtual-clock TimerQueue. Nothing runs until advance() is called, and then
// every task that falls due runs on the calling thread, in due order.
class ManualTimerQueue : public TimerQueue {
public:
    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        TimerId id = next_id_++;
        entries_[id] = Entry{now_ + std::max(delay, std::chrono::milliseconds(0)),
                             std::chrono::milliseconds(0), std::move(task)};
        return id;
    }

    TimerId schedule_every(std::chrono::milliseconds interval, Task task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        TimerId id = next_id_++;
        auto step = std::max(interval, std::chrono::milliseconds(1));
        entries_[id] = Entry{now_ + step, step, std::move(task)};
        return id;
    }

    void cancel(TimerId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(id);
    }

    void cancel_all() override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t pending() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    // Moves the clock forward, running every task that falls due on the way.
    // Tasks run without the queue's lock held so they may schedule or cancel.
    void advance(std::chrono::milliseconds by) {
        std::chrono::milliseconds target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            target = now_ + by;
        }
        for (;;) {
            Task task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto next = entries_.end();
                for (auto it = entries_.begin(); it != entries_.end(); ++it) {
                    if (it->second.due <= target &&
                        (next == entries_.end() || it->second.due < next->second.due)) {
                        next = it;
                    }
                }
                if (next == entries_.end()) {
                    now_ = target;
                    return;
                }
                now_ = std::max(now_, next->second.due);
                task = next->second.task;
                if (next->second.interval.count() > 0) {
                    next->second.due += next->second.interval;
                } else {
                    entries_.erase(next);
                }
                ++fired_;
            }
            task();
        }
    }

    // Runs whatever is already due without moving the clock.
    void run_due() { advance(std::chrono::milliseconds(0)); }

    std::chrono::milliseconds now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    size_t fired() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fired_;
    }

private:
    struct Entry {
        std::chrono::milliseconds due;
        std::chrono::milliseconds interval;
        Task task;
    };

    mutable std::mutex mutex_;
    std::map<TimerId, Entry> entries_;
    std::chrono::milliseconds now_{0};
    TimerId next_id_ = 1;
    size_t fired_ = 0;
};

} // namespace testing
} // namespace fieldsync
