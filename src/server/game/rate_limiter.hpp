// SPDX-License-Identifier: Apache-2.0
// rate_limiter.hpp - Sliding-window event limiter (N events per rolling window).
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

namespace pong::game {

class SlidingWindowLimiter
{
public:
    using clock = std::chrono::steady_clock;

    SlidingWindowLimiter(std::size_t max_events, std::chrono::nanoseconds window)
        : m_max(max_events), m_window(window)
    {}

    // Records the event and returns true when it fits in the window; rejected events are not recorded.
    bool allow(clock::time_point now)
    {
        while (!m_events.empty() && now - m_events.front() >= m_window)
            m_events.pop_front();
        if (m_events.size() >= m_max)
            return false;
        m_events.push_back(now);
        return true;
    }

    void reset() { m_events.clear(); }
    std::size_t in_window() const { return m_events.size(); }

private:
    std::size_t m_max;
    std::chrono::nanoseconds m_window;
    std::deque<clock::time_point> m_events;
};

// Minimum spacing between consecutive events (chat: one message per interval).
class MinIntervalLimiter
{
public:
    using clock = std::chrono::steady_clock;

    explicit MinIntervalLimiter(std::chrono::nanoseconds interval) : m_interval(interval) {}

    bool allow(clock::time_point now)
    {
        if (m_has_last && now - m_last < m_interval)
            return false;
        m_last = now;
        m_has_last = true;
        return true;
    }

private:
    std::chrono::nanoseconds m_interval;
    clock::time_point m_last{};
    bool m_has_last{false};
};

} // namespace pong::game
