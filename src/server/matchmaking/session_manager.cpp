// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/session_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>

namespace pong::mm {

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid, std::move(client));
    s->chat_limiter = pong::game::MinIntervalLimiter{m_chat_min_interval};
    m_by_connection.emplace(cid, s);
    return s;
}

std::shared_ptr<Session> SessionManager::add_detached(std::string connection_id)
{
    std::scoped_lock lk{m_mutex};
    auto s = std::make_shared<Session>();
    s->connection_id = std::move(connection_id);
    s->chat_limiter = pong::game::MinIntervalLimiter{m_chat_min_interval};
    m_by_connection[s->connection_id] = s;
    return s;
}

void SessionManager::authenticate(
    const std::shared_ptr<Session> &s, std::string player_id, std::string display_name, std::optional<std::string> skin)
{
    std::scoped_lock lk{m_mutex};
    bool first = !s->authenticated;
    s->authenticated = true;
    s->player_id = std::move(player_id);
    s->display_name = display_name.empty() ? s->player_id : std::move(display_name);
    s->skin = std::move(skin);
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_player[s->player_id] = s; // a newer connection supersedes an older one
    if (first)
        pong::metrics::runtime().connected_players.fetch_add(1, std::memory_order_relaxed);
}

bool SessionManager::enqueue(const std::shared_ptr<Session> &s, std::string tier)
{
    std::scoped_lock lk{m_mutex};
    if (s->in_queue || s->closed || !s->authenticated)
        return false;
    // One queue entry per player, whichever connection joined first.
    for (const auto &q : m_queue)
        if (q->player_id == s->player_id)
            return false;
    s->in_queue = true;
    s->queue_tier = std::move(tier);
    s->queue_join_time = std::chrono::steady_clock::now();
    m_queue.push_back(s);
    pong::metrics::runtime().queue_depth.store(m_queue.size(), std::memory_order_relaxed);
    return true;
}

bool SessionManager::leave_queue(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (!s->in_queue)
        return false;
    m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), s), m_queue.end());
    s->in_queue = false;
    pong::metrics::runtime().queue_depth.store(m_queue.size(), std::memory_order_relaxed);
    return true;
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_queue()
{
    std::scoped_lock lk{m_mutex};
    return m_queue; // copy of vector (shared_ptr copied)
}

void SessionManager::pop_from_queue(const std::vector<std::shared_ptr<Session>> &sessions)
{
    std::scoped_lock lk{m_mutex};
    m_queue.erase(
        std::remove_if(
            m_queue.begin(),
            m_queue.end(),
            [&](auto &sp) { return std::find(sessions.begin(), sessions.end(), sp) != sessions.end(); }),
        m_queue.end());
    for (auto &s : sessions)
        s->in_queue = false;
    pong::metrics::runtime().queue_depth.store(m_queue.size(), std::memory_order_relaxed);
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, const pong::ServerMessage &msg)
{
    if (!s)
        return;
    std::scoped_lock lk{m_mutex};
    if (s->closed)
        return; // peer gone; state is re-sent after reconnect
    s->outgoing.push_back(msg);
}

std::vector<pong::ServerMessage> SessionManager::drain_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<pong::ServerMessage> out;
    out.swap(s->outgoing);
    return out;
}

void SessionManager::update_heartbeat(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    s->last_heartbeat = std::chrono::steady_clock::now();
}

bool SessionManager::allow_chat(const std::shared_ptr<Session> &s, std::chrono::steady_clock::time_point now)
{
    std::scoped_lock lk{m_mutex};
    return s->chat_limiter.allow(now);
}

std::shared_ptr<Session> SessionManager::find_by_player(const std::string &player_id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_player.find(player_id);
    return it == m_by_player.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_all_sessions()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_by_connection.size());
    for (auto &kv : m_by_connection)
        res.push_back(kv.second);
    return res;
}

bool SessionManager::disconnect_session(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->closed)
        return false;
    s->closed = true;
    s->outgoing.clear();
    if (s->in_queue) {
        m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), s), m_queue.end());
        s->in_queue = false;
        pong::metrics::runtime().queue_depth.store(m_queue.size(), std::memory_order_relaxed);
    }
    if (s->authenticated) {
        auto it = m_by_player.find(s->player_id);
        if (it != m_by_player.end() && it->second == s)
            m_by_player.erase(it);
        pong::metrics::gauge_dec(pong::metrics::runtime().connected_players);
    }
    m_by_connection.erase(s->connection_id);
    pong::log::debug("[conn] closed id={} player={}", s->connection_id, s->player_id);
    return true;
}

bool SessionManager::is_closed(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->closed;
}

size_t SessionManager::queue_size()
{
    std::scoped_lock lk{m_mutex};
    return m_queue.size();
}

} // namespace pong::mm
