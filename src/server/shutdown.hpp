// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <atomic>

namespace pong {
// Set by the signal handler / --duration; long-running coroutines poll it.
inline std::atomic_bool g_shutdown{false};
} // namespace pong
