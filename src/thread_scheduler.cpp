#include <burn/thread_scheduler.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace burn {

ThreadScheduler::ThreadScheduler() : m_thread(&ThreadScheduler::run, this)
{
}

ThreadScheduler::~ThreadScheduler()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_wakeup.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

Scheduler::TaskId ThreadScheduler::scheduleAfter(std::chrono::milliseconds delay,
                                                 Task task)
{
    const auto deadline =
        Clock::now() + std::max(delay, std::chrono::milliseconds{0});
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_nextId++;
        m_tasks.emplace(Key{deadline, id}, std::move(task));
    }
    m_wakeup.notify_all();
    return id;
}

bool ThreadScheduler::cancel(TaskId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto found = std::find_if(
        m_tasks.begin(), m_tasks.end(),
        [id](const auto& entry) { return entry.first.second == id; });
    if (found == m_tasks.end()) {
        return false;
    }
    m_tasks.erase(found);
    return true;
}

std::size_t ThreadScheduler::pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void ThreadScheduler::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        if (m_tasks.empty()) {
            m_wakeup.wait(lock);
            continue;
        }
        const auto deadline = m_tasks.begin()->first.first;
        if (Clock::now() < deadline) {
            // Woken early by a new, earlier task or by shutdown.
            m_wakeup.wait_until(lock, deadline);
            continue;
        }
        auto task = std::move(m_tasks.begin()->second);
        m_tasks.erase(m_tasks.begin());

        lock.unlock();
        task();
        lock.lock();
    }
    if (!m_tasks.empty()) {
        spdlog::debug("ThreadScheduler dropped {} pending task(s)",
                      m_tasks.size());
    }
}

} // namespace burn
