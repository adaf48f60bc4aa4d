#include <burn/loop_scheduler.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace burn {

Scheduler::TaskId LoopScheduler::scheduleAfter(std::chrono::milliseconds delay,
                                               Task task)
{
    return scheduleAt(Clock::now() + std::max(delay, std::chrono::milliseconds{0}),
                      std::move(task));
}

Scheduler::TaskId LoopScheduler::scheduleAt(Clock::time_point deadline,
                                            Task task)
{
    const TaskId id = m_nextId++;
    m_tasks.emplace(Key{deadline, id}, std::move(task));
    return id;
}

bool LoopScheduler::cancel(TaskId id)
{
    auto found = std::find_if(
        m_tasks.begin(), m_tasks.end(),
        [id](const auto& entry) { return entry.first.second == id; });
    if (found == m_tasks.end()) {
        return false;
    }
    m_tasks.erase(found);
    return true;
}

int LoopScheduler::runDue(Clock::time_point now)
{
    // Tasks scheduled by the tasks run here wait for the next call.
    const TaskId last = m_nextId;
    int counter = 0;
    auto iter = m_tasks.begin();
    while (iter != m_tasks.end() && iter->first.first <= now) {
        if (iter->first.second >= last) {
            ++iter;
            continue;
        }
        auto task = std::move(iter->second);
        m_tasks.erase(iter);
        task();
        ++counter;
        iter = m_tasks.begin();
    }
    if (counter > 0) {
        spdlog::trace("LoopScheduler ran {} task(s), {} pending", counter,
                      m_tasks.size());
    }
    return counter;
}

std::optional<LoopScheduler::Clock::time_point>
LoopScheduler::nextDeadline() const
{
    if (m_tasks.empty()) {
        return std::nullopt;
    }
    return m_tasks.begin()->first.first;
}

std::size_t LoopScheduler::pending() const
{
    return m_tasks.size();
}

} // namespace burn
