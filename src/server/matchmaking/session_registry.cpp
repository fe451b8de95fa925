// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/session_registry.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace pong::mm {

bool SessionRegistry::insert(std::shared_ptr<pong::game::MatchSession> session)
{
    if (!session)
        return false;
    auto ids = session->players();
    std::scoped_lock lk{m_mutex};
    auto [it, inserted] = m_by_id.emplace(session->id(), session);
    if (!inserted)
        return false;
    for (const auto &p : ids)
        m_match_of_player[p.player_id] = session->id();
    pong::metrics::runtime().active_matches.store(m_by_id.size(), std::memory_order_relaxed);
    pong::log::debug("[registry] insert id={} size={}", session->id(), m_by_id.size());
    return true;
}

std::shared_ptr<pong::game::MatchSession> SessionRegistry::find(const std::string &match_id) const
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_id.find(match_id);
    return it == m_by_id.end() ? nullptr : it->second;
}

std::shared_ptr<pong::game::MatchSession> SessionRegistry::find_by_player(const std::string &player_id) const
{
    std::scoped_lock lk{m_mutex};
    auto pit = m_match_of_player.find(player_id);
    if (pit == m_match_of_player.end())
        return nullptr;
    auto it = m_by_id.find(pit->second);
    return it == m_by_id.end() ? nullptr : it->second;
}

bool SessionRegistry::remove(const std::string &match_id)
{
    std::shared_ptr<pong::game::MatchSession> removed; // released outside the lock
    {
        std::scoped_lock lk{m_mutex};
        auto it = m_by_id.find(match_id);
        if (it == m_by_id.end())
            return false;
        removed = std::move(it->second);
        m_by_id.erase(it);
        for (auto pit = m_match_of_player.begin(); pit != m_match_of_player.end();) {
            if (pit->second == match_id)
                pit = m_match_of_player.erase(pit);
            else
                ++pit;
        }
        pong::metrics::runtime().active_matches.store(m_by_id.size(), std::memory_order_relaxed);
    }
    pong::log::debug("[registry] remove id={}", match_id);
    return true;
}

size_t SessionRegistry::size() const
{
    std::scoped_lock lk{m_mutex};
    return m_by_id.size();
}

std::vector<std::shared_ptr<pong::game::MatchSession>> SessionRegistry::snapshot() const
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<pong::game::MatchSession>> out;
    out.reserve(m_by_id.size());
    for (const auto &kv : m_by_id)
        out.push_back(kv.second);
    return out;
}

} // namespace pong::mm
