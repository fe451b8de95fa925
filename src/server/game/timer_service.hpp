// SPDX-License-Identifier: Apache-2.0
// timer_service.hpp - Cancellable one-shot / periodic timers for match sessions.
#pragma once

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace pong::game {

namespace detail {
struct TimerState
{
    std::atomic<bool> cancelled{false};
    std::atomic<bool> done{false}; // one-shot already fired
};
} // namespace detail

// Owned by whoever armed the timer. Cancelling twice, or after the timer fired, is a no-op.
class TimerHandle
{
public:
    TimerHandle() = default;
    explicit TimerHandle(std::shared_ptr<detail::TimerState> st) : m_state(std::move(st)) {}

    void cancel() noexcept
    {
        if (m_state)
            m_state->cancelled.store(true, std::memory_order_release);
    }

    bool active() const noexcept
    {
        return m_state && !m_state->cancelled.load(std::memory_order_acquire)
            && !m_state->done.load(std::memory_order_acquire);
    }

    // Cancel and forget.
    void reset() noexcept
    {
        cancel();
        m_state.reset();
    }

private:
    std::shared_ptr<detail::TimerState> m_state;
};

class ITimerService
{
public:
    using clock = std::chrono::steady_clock;

    virtual ~ITimerService() = default;
    virtual clock::time_point now() const = 0;
    // Callbacks always run later than the call that armed them, never inline.
    virtual TimerHandle schedule_after(std::chrono::nanoseconds delay, std::function<void()> fn) = 0;
    // First invocation after one interval; deadlines advance by `interval` without drift.
    virtual TimerHandle schedule_every(std::chrono::nanoseconds interval, std::function<void()> fn) = 0;
};

// Production timers: one coroutine per armed timer on the shared io_scheduler.
class CoroTimerService : public ITimerService
{
public:
    explicit CoroTimerService(std::shared_ptr<coro::io_scheduler> scheduler) : m_scheduler(std::move(scheduler)) {}

    clock::time_point now() const override { return clock::now(); }
    TimerHandle schedule_after(std::chrono::nanoseconds delay, std::function<void()> fn) override;
    TimerHandle schedule_every(std::chrono::nanoseconds interval, std::function<void()> fn) override;

private:
    std::shared_ptr<coro::io_scheduler> m_scheduler;
};

// Tick period for a rate in Hz, rounded to the nearest nanosecond.
inline std::chrono::nanoseconds tick_interval_for(uint32_t rate_hz)
{
    if (rate_hz == 0)
        rate_hz = 1;
    return std::chrono::nanoseconds((1'000'000'000ull + rate_hz / 2) / rate_hz);
}

} // namespace pong::game
