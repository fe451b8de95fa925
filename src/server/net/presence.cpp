// SPDX-License-Identifier: Apache-2.0
#include "server/net/presence.hpp"

#include "common/logger.hpp"

namespace pong::net {

std::shared_ptr<pong::game::MatchSession> Presence::bind(const std::shared_ptr<pong::mm::Session> &s)
{
    if (!s->authenticated)
        return nullptr;
    auto match = m_registry.find_by_player(s->player_id);
    if (!match)
        return nullptr;
    if (!match->player_reconnected(s->player_id, s))
        return nullptr;
    pong::log::info("[presence] player={} rejoined match={} via {}", s->player_id, match->id(), s->connection_id);
    return match;
}

std::shared_ptr<pong::game::MatchSession> Presence::resolve(
    const std::shared_ptr<pong::mm::Session> &s, const std::string &match_id) const
{
    if (!s->authenticated)
        return nullptr;
    auto match = match_id.empty() ? m_registry.find_by_player(s->player_id) : m_registry.find(match_id);
    if (!match || !match->has_player(s->player_id))
        return nullptr;
    return match;
}

bool Presence::ready(const std::shared_ptr<pong::mm::Session> &s, const std::string &match_id)
{
    auto match = resolve(s, match_id);
    return match && match->player_ready(s->player_id);
}

bool Presence::input(const std::shared_ptr<pong::mm::Session> &s, const std::string &match_id, std::string_view direction)
{
    auto match = resolve(s, match_id);
    return match && match->handle_input(s->player_id, direction);
}

bool Presence::chat(
    const std::shared_ptr<pong::mm::Session> &s,
    const std::string &match_id,
    std::string_view text,
    std::chrono::steady_clock::time_point now)
{
    auto match = resolve(s, match_id);
    if (!match)
        return false;
    if (!m_sessions.allow_chat(s, now)) {
        pong::log::debug("[presence] chat throttled player={}", s->player_id);
        return false;
    }
    return match->handle_chat(s->player_id, text);
}

bool Presence::in_live_match(const std::string &player_id) const
{
    auto match = m_registry.find_by_player(player_id);
    if (!match)
        return false;
    auto ph = match->phase();
    return ph != pong::game::Phase::finished && ph != pong::game::Phase::cancelled;
}

void Presence::peer_lost(const std::shared_ptr<pong::mm::Session> &s, std::string_view cause)
{
    if (!m_sessions.disconnect_session(s))
        return;
    pong::log::info("[presence] peer lost conn={} player={} cause={}", s->connection_id, s->player_id, cause);
    if (!s->authenticated)
        return;
    if (auto match = m_registry.find_by_player(s->player_id))
        match->player_disconnected(s->player_id, s);
}

} // namespace pong::net
