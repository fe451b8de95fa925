// SPDX-License-Identifier: Apache-2.0
#include "server/game/timer_service.hpp"

#include "common/logger.hpp"

#include <exception>

namespace pong::game {

namespace {

void invoke_guarded(const std::function<void()> &fn)
{
    try {
        fn();
    } catch (const std::exception &e) {
        pong::log::error("[timer] callback threw: {}", e.what());
    }
}

coro::task<void> run_once(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::chrono::nanoseconds delay,
    std::shared_ptr<detail::TimerState> st,
    std::function<void()> fn)
{
    co_await scheduler->schedule();
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (!st->cancelled.load(std::memory_order_acquire)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;
        co_await scheduler->yield_for(deadline - now);
    }
    if (st->cancelled.load(std::memory_order_acquire))
        co_return;
    st->done.store(true, std::memory_order_release);
    invoke_guarded(fn);
}

coro::task<void> run_periodic(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::chrono::nanoseconds interval,
    std::shared_ptr<detail::TimerState> st,
    std::function<void()> fn)
{
    using clock = std::chrono::steady_clock;
    co_await scheduler->schedule();
    auto next = clock::now() + interval;
    while (!st->cancelled.load(std::memory_order_acquire)) {
        auto now = clock::now();
        if (now < next) {
            co_await scheduler->yield_for(next - now);
            continue;
        }
        next += interval;
        invoke_guarded(fn);
    }
}

} // namespace

TimerHandle CoroTimerService::schedule_after(std::chrono::nanoseconds delay, std::function<void()> fn)
{
    auto st = std::make_shared<detail::TimerState>();
    m_scheduler->spawn(run_once(m_scheduler, delay, st, std::move(fn)));
    return TimerHandle{st};
}

TimerHandle CoroTimerService::schedule_every(std::chrono::nanoseconds interval, std::function<void()> fn)
{
    auto st = std::make_shared<detail::TimerState>();
    m_scheduler->spawn(run_periodic(m_scheduler, interval, st, std::move(fn)));
    return TimerHandle{st};
}

} // namespace pong::game
