// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <cstdint>

// Per-callsite rate-limited logging.
// Emits every Nth invocation at the given level. Intended for per-tick or per-input paths
// (dropped inputs, rejected frames) where one line per event would flood the writer queue.
// Usage: PONG_LOG_EVERY_N(debug, 60, "[match] id={} dropped input", id);
#define PONG_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> _pong_log_counter_##__LINE__{0}; \
        if ((_pong_log_counter_##__LINE__.fetch_add(1, std::memory_order_relaxed) + 1) % (N) == 0) { \
            pong::log::level(__VA_ARGS__); \
        } \
    } while (0)
