#pragma once
#include <burn/scheduler.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace burn { // Begin of namespace burn

// Runs tasks on one worker thread, one at a time. Pending tasks are dropped
// on destruction; a task that is already running is finished first.
class ThreadScheduler : public Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    ThreadScheduler();

    ~ThreadScheduler();

    ThreadScheduler(const ThreadScheduler&) = delete;

    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskId scheduleAfter(std::chrono::milliseconds delay, Task task) override;

    bool cancel(TaskId id) override;

    std::size_t pending() const;

private:
    void run();

    using Key = std::pair<Clock::time_point, TaskId>;

    std::map<Key, Task> m_tasks;

    TaskId m_nextId = kInvalidTask + 1;

    std::atomic<bool> m_running{true};

    mutable std::mutex m_mutex;

    std::condition_variable m_wakeup;

    std::thread m_thread;
};

} // End of namespace burn
