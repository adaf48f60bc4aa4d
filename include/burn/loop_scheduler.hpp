#pragma once
#include <burn/scheduler.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <utility>

namespace burn { // Begin of namespace burn

// Cooperative timer queue for a single-threaded event loop. Tasks only run
// from runDue(), on the calling thread.
class LoopScheduler : public Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    LoopScheduler() = default;

    LoopScheduler(const LoopScheduler&) = delete;

    LoopScheduler& operator=(const LoopScheduler&) = delete;

    TaskId scheduleAfter(std::chrono::milliseconds delay, Task task) override;

    // Same as scheduleAfter, with an absolute deadline.
    TaskId scheduleAt(Clock::time_point deadline, Task task);

    bool cancel(TaskId id) override;

    // Runs every task whose deadline is not after `now`, oldest deadline
    // first. Tasks scheduled from within those tasks are left for the next
    // call. Returns the number of tasks run.
    int runDue(Clock::time_point now = Clock::now());

    std::optional<Clock::time_point> nextDeadline() const;

    std::size_t pending() const;

private:
    // Ordered by deadline, then by id, which keeps FIFO order for equal
    // deadlines.
    using Key = std::pair<Clock::time_point, TaskId>;

    std::map<Key, Task> m_tasks;

    TaskId m_nextId = kInvalidTask + 1;
};

} // End of namespace burn
