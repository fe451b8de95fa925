// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/auth/auth_provider.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/matchmaking/session_manager.hpp"
#include "server/net/presence.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>

namespace pong::net {

struct ListenerDeps
{
    pong::mm::SessionManager *sessions{nullptr};
    Presence *presence{nullptr};
    pong::auth::IAuthProvider *auth{nullptr};
    pong::mm::Matchmaker *matchmaker{nullptr};
};

// Starts the TCP accept loop on the given port.
// poll/read timeout inside each connection loop is derived from tick_rate to
// keep outbound flush latency bounded relative to simulation ticks.
coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, uint32_t tick_rate, ListenerDeps deps);

// Closes peers whose last heartbeat is older than `timeout_sec`; they are then handled as disconnects.
coro::task<void> run_heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> scheduler, uint32_t timeout_sec, ListenerDeps deps);

} // namespace pong::net
