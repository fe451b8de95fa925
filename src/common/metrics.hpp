// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide runtime counters (atomics, no dynamic allocation) exported by the metrics endpoint.
#pragma once
#include <atomic>
#include <cstdint>

namespace pong::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for tick durations (base 250k ns) -> up to ~128ms.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{}; // bucket 0:<250k,1:<500k,...
    // Gauges
    std::atomic<uint64_t> queue_depth{0};
    std::atomic<uint64_t> active_matches{0};
    std::atomic<uint64_t> connected_players{0};
    // Counters
    std::atomic<uint64_t> matches_started{0};
    std::atomic<uint64_t> matches_finished{0};
    std::atomic<uint64_t> matches_cancelled{0};
    std::atomic<uint64_t> forfeits{0};
    std::atomic<uint64_t> snapshots_sent{0};
    std::atomic<uint64_t> inputs_rate_limited{0};
    std::atomic<uint64_t> inputs_rejected{0};
    std::atomic<uint64_t> settlements_ok{0};
    std::atomic<uint64_t> settlements_failed{0};
    std::atomic<uint64_t> auth_failures{0};
    std::atomic<uint64_t> frame_errors{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    constexpr uint64_t base = 250000; // 0.25ms
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (base << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    constexpr uint64_t base = 250000;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return base << i;
    }
    return base << (RuntimeCounters::TICK_BUCKETS - 1);
}

// Saturating decrement for gauges.
inline void gauge_dec(std::atomic<uint64_t> &g)
{
    uint64_t cur = g.load(std::memory_order_relaxed);
    while (cur > 0 && !g.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {}
}

} // namespace pong::metrics
