#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace burn { // Begin of namespace burn

// Source of cancellable, one-shot delayed tasks. Implementations never run
// two tasks at the same time.
class Scheduler {
public:
    using TaskId = uint64_t;

    using Task = std::function<void()>;

    // Never returned by scheduleAfter.
    static constexpr TaskId kInvalidTask = 0;

    virtual ~Scheduler() = default;

    virtual TaskId scheduleAfter(std::chrono::milliseconds delay, Task task) = 0;

    // Returns false if the task already ran, was cancelled or is unknown.
    virtual bool cancel(TaskId id) = 0;
};

} // End of namespace burn
