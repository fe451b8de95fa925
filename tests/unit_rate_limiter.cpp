// SPDX-License-Identifier: Apache-2.0
#include "server/game/rate_limiter.hpp"
#include "server/game/timer_service.hpp"

#include <cassert>
#include <iostream>

using namespace std::chrono_literals;

int main()
{
    using clock = std::chrono::steady_clock;
    auto t0 = clock::time_point{} + 10s;

    pong::game::SlidingWindowLimiter lim{3, 1s};
    assert(lim.allow(t0));
    assert(lim.allow(t0 + 100ms));
    assert(lim.allow(t0 + 200ms));
    assert(!lim.allow(t0 + 300ms));
    // rejected attempts do not extend the window
    assert(!lim.allow(t0 + 999ms));
    assert(lim.in_window() == 3);
    assert(lim.allow(t0 + 1s)); // first event aged out
    assert(!lim.allow(t0 + 1s + 50ms));
    assert(lim.allow(t0 + 1s + 100ms));
    lim.reset();
    assert(lim.in_window() == 0);
    assert(lim.allow(t0 + 1s + 101ms));

    pong::game::MinIntervalLimiter chat{1s};
    assert(chat.allow(t0));
    assert(!chat.allow(t0 + 500ms));
    assert(!chat.allow(t0 + 999ms));
    assert(chat.allow(t0 + 1s));
    assert(!chat.allow(t0 + 1500ms));

    assert(pong::game::tick_interval_for(60) == std::chrono::nanoseconds(16'666'667));
    assert(pong::game::tick_interval_for(50) == 20ms);
    assert(pong::game::tick_interval_for(0) == 1s);

    std::cout << "unit_rate_limiter OK" << std::endl;
    return 0;
}
