// SPDX-License-Identifier: Apache-2.0
// presence.hpp - Binds authenticated peers to player ids and routes their events to the live match.
#pragma once

#include "server/game/match_session.hpp"
#include "server/matchmaking/session_manager.hpp"
#include "server/matchmaking/session_registry.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace pong::net {

class Presence
{
public:
    Presence(pong::mm::SessionManager &sessions, pong::mm::SessionRegistry &registry)
        : m_sessions(sessions), m_registry(registry)
    {}

    // Called after a successful auth. If the player has a live match the new connection replaces the
    // old one in place and the match is returned.
    std::shared_ptr<pong::game::MatchSession> bind(const std::shared_ptr<pong::mm::Session> &s);

    bool ready(const std::shared_ptr<pong::mm::Session> &s, const std::string &match_id);
    bool input(const std::shared_ptr<pong::mm::Session> &s, const std::string &match_id, std::string_view direction);
    bool chat(
        const std::shared_ptr<pong::mm::Session> &s,
        const std::string &match_id,
        std::string_view text,
        std::chrono::steady_clock::time_point now);

    // True while the player belongs to a match that has not ended.
    bool in_live_match(const std::string &player_id) const;

    // Socket closed, frame error or heartbeat timeout. Idempotent per connection.
    void peer_lost(const std::shared_ptr<pong::mm::Session> &s, std::string_view cause);

private:
    std::shared_ptr<pong::game::MatchSession> resolve(
        const std::shared_ptr<pong::mm::Session> &s, const std::string &match_id) const;

    pong::mm::SessionManager &m_sessions;
    pong::mm::SessionRegistry &m_registry;
};

} // namespace pong::net
