#include "fieldsync/timer_queue.hpp"
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace fieldsync {

struct ThreadTimerQueue::Impl {
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Clock::time_point due;
        std::chrono::milliseconds interval{0};  // zero for one-shot
        Task task;
    };

    std::string name;
    mutable std::mutex mutex;
    std::condition_variable cond;
    std::condition_variable idle;
    std::map<TimerId, Entry> entries;
    TimerId active = 0;  // task currently running, 0 when none
    TimerId next_id = 1;
    bool running = true;
    std::thread worker;

    TimerId add(std::chrono::milliseconds delay, std::chrono::milliseconds interval, Task task) {
        TimerId id;
        {
            std::lock_guard<std::mutex> lock(mutex);
            id = next_id++;
            entries[id] = Entry{Clock::now() + delay, interval, std::move(task)};
        }
        cond.notify_one();
        return id;
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (running) {
            if (entries.empty()) {
                cond.wait(lock, [this] { return !entries.empty() || !running; });
                continue;
            }

            auto next = entries.begin();
            for (auto it = entries.begin(); it != entries.end(); ++it) {
                if (it->second.due < next->second.due) next = it;
            }

            auto now = Clock::now();
            if (next->second.due > now) {
                cond.wait_until(lock, next->second.due);
                continue;
            }

            TimerId id = next->first;
            Task task = next->second.task;
            if (next->second.interval.count() > 0) {
                next->second.due = now + next->second.interval;
            } else {
                entries.erase(next);
            }

            active = id;
            lock.unlock();
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "[" << name << "] Task failed: " << e.what() << std::endl;
            }
            lock.lock();
            active = 0;
            idle.notify_all();
        }
    }

    // Blocks while the given task (or any task, for 0) runs, unless the
    // caller is that task.
    void wait_idle(std::unique_lock<std::mutex>& lock, TimerId id) {
        if (std::this_thread::get_id() == worker.get_id()) return;
        idle.wait(lock, [this, id] { return active == 0 || (id != 0 && active != id); });
    }
};

ThreadTimerQueue::ThreadTimerQueue(const std::string& name)
    : impl_(std::make_unique<Impl>()) {
    impl_->name = name;
    impl_->worker = std::thread([this]() { impl_->run(); });
}

ThreadTimerQueue::~ThreadTimerQueue() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->running = false;
        impl_->entries.clear();
    }
    impl_->cond.notify_all();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

TimerId ThreadTimerQueue::schedule_after(std::chrono::milliseconds delay, Task task) {
    return impl_->add(delay, std::chrono::milliseconds(0), std::move(task));
}

TimerId ThreadTimerQueue::schedule_every(std::chrono::milliseconds interval, Task task) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("schedule_every: interval must be positive");
    }
    return impl_->add(interval, interval, std::move(task));
}

void ThreadTimerQueue::cancel(TimerId id) {
    {
        std::unique_lock<std::mutex> lock(impl_->mutex);
        impl_->entries.erase(id);
        impl_->wait_idle(lock, id);
    }
    impl_->cond.notify_one();
}

void ThreadTimerQueue::cancel_all() {
    {
        std::unique_lock<std::mutex> lock(impl_->mutex);
        impl_->entries.clear();
        impl_->wait_idle(lock, 0);
    }
    impl_->cond.notify_one();
}

size_t ThreadTimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entries.size();
}

} // namespace fieldsync
