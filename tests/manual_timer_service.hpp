// SPDX-License-Identifier: Apache-2.0
// manual_timer_service.hpp - Virtual-clock timers for deterministic session tests.
#pragma once
#include "server/game/timer_service.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace pong::test {

class ManualTimerService : public pong::game::ITimerService
{
public:
    clock::time_point now() const override { return m_now; }

    pong::game::TimerHandle schedule_after(std::chrono::nanoseconds delay, std::function<void()> fn) override
    {
        return add(m_now + delay, std::chrono::nanoseconds(0), std::move(fn));
    }

    pong::game::TimerHandle schedule_every(std::chrono::nanoseconds interval, std::function<void()> fn) override
    {
        if (interval.count() <= 0)
            interval = std::chrono::nanoseconds(1);
        return add(m_now + interval, interval, std::move(fn));
    }

    // Moves the clock forward, firing every due timer in deadline order (ties in arming order),
    // including timers armed by callbacks during the advance.
    void advance(std::chrono::nanoseconds d)
    {
        auto target = m_now + d;
        for (;;) {
            auto it = std::min_element(m_entries.begin(), m_entries.end(), [](const Entry &a, const Entry &b) {
                return a.due != b.due ? a.due < b.due : a.seq < b.seq;
            });
            if (it == m_entries.end() || it->due > target)
                break;
            if (it->state->cancelled.load()) {
                m_entries.erase(it);
                continue;
            }
            m_now = std::max(m_now, it->due);
            std::function<void()> fn = it->fn;
            if (it->interval.count() > 0) {
                it->due += it->interval;
                it->seq = ++m_seq;
            } else {
                it->state->done.store(true);
                m_entries.erase(it);
            }
            fn();
        }
        m_now = target;
    }

    // Timers that can still fire.
    size_t pending() const
    {
        return static_cast<size_t>(std::count_if(
            m_entries.begin(), m_entries.end(), [](const Entry &e) { return !e.state->cancelled.load(); }));
    }

private:
    struct Entry
    {
        clock::time_point due;
        std::chrono::nanoseconds interval;
        uint64_t seq;
        std::function<void()> fn;
        std::shared_ptr<pong::game::detail::TimerState> state;
    };

    pong::game::TimerHandle add(clock::time_point due, std::chrono::nanoseconds interval, std::function<void()> fn)
    {
        auto st = std::make_shared<pong::game::detail::TimerState>();
        m_entries.push_back(Entry{due, interval, ++m_seq, std::move(fn), st});
        return pong::game::TimerHandle{st};
    }

    clock::time_point m_now{std::chrono::hours(1)};
    uint64_t m_seq{0};
    std::vector<Entry> m_entries;
};

} // namespace pong::test
