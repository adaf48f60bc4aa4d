#pragma once
#include <spdlog/spdlog.h>
#include <chrono>
#include <string>
#include <utility>

using namespace std::chrono_literals;

template <typename T> class Timer {
public:
    Timer() : m_start(std::chrono::steady_clock::now())
    {
    }

    T elapsed() const
    {
        return std::chrono::duration_cast<T>(std::chrono::steady_clock::now() -
                                             m_start);
    }

    void reset()
    {
        m_start = std::chrono::steady_clock::now();
    }

private:
    std::chrono::time_point<std::chrono::steady_clock> m_start;
};

// Counts frames and logs the rate once per second.
class FrameCounter {
public:
    explicit FrameCounter(std::string name) : m_name(std::move(name))
    {
    }

    void add(int frames)
    {
        m_counter += frames;
        if (m_timer.elapsed() >= 1000ms) {
            spdlog::info("{} fps: {}", m_name, m_counter);
            m_counter = 0;
            m_timer.reset();
        }
    }

private:
    std::string m_name;

    Timer<std::chrono::milliseconds> m_timer;

    int m_counter = 0;
};
