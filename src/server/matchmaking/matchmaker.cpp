// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/matchmaker.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/shutdown.hpp"

#include <chrono>
#include <random>
#include <unordered_map>

namespace pong::mm {

static uint64_t random_seed()
{
    static std::mt19937_64 rng(std::random_device{}());
    return rng();
}

std::vector<Pairing> pair_by_tier(const std::vector<std::shared_ptr<Session>> &queue)
{
    std::vector<Pairing> out;
    std::unordered_map<std::string, std::shared_ptr<Session>> waiting; // first unmatched peer per tier
    for (const auto &s : queue) {
        if (!s)
            continue;
        auto it = waiting.find(s->queue_tier);
        if (it == waiting.end()) {
            waiting.emplace(s->queue_tier, s);
            continue;
        }
        if (it->second->player_id == s->player_id)
            continue; // same player queued twice from two connections
        out.push_back(Pairing{s->queue_tier, it->second, s});
        waiting.erase(it);
    }
    return out;
}

Matchmaker::Matchmaker(
    SessionManager &sessions, SessionRegistry &registry, MatchmakerConfig cfg, pong::game::MatchDeps base)
    : m_sessions(sessions), m_registry(registry), m_cfg(std::move(cfg)), m_base(std::move(base))
{}

bool Matchmaker::has_live_match(const std::string &player_id) const
{
    auto match = m_registry.find_by_player(player_id);
    if (!match)
        return false;
    auto ph = match->phase();
    return ph != pong::game::Phase::finished && ph != pong::game::Phase::cancelled;
}

std::vector<std::shared_ptr<pong::game::MatchSession>> Matchmaker::poll_once()
{
    std::vector<std::shared_ptr<pong::game::MatchSession>> created;
    auto queued = m_sessions.snapshot_queue();
    for (auto &pair : pair_by_tier(queued)) {
        auto tier_it = m_cfg.stake_tiers.find(pair.tier);
        if (tier_it == m_cfg.stake_tiers.end()) {
            pong::log::warn("[mm] dropping pairing for unknown tier '{}'", pair.tier);
            m_sessions.pop_from_queue({pair.first, pair.second});
            continue;
        }
        // A player who is already in a live match loses the queue entry; the partner keeps waiting.
        std::vector<std::shared_ptr<Session>> busy;
        for (const auto &peer : {pair.first, pair.second})
            if (has_live_match(peer->player_id))
                busy.push_back(peer);
        if (!busy.empty()) {
            for (const auto &peer : busy)
                pong::log::warn("[mm] player {} already in a live match, dropping queue entry", peer->player_id);
            m_sessions.pop_from_queue(busy);
            continue;
        }
        m_sessions.pop_from_queue({pair.first, pair.second});
        uint64_t n = ++m_match_counter;
        pong::game::MatchSetup setup;
        setup.match_id = "m_" + std::to_string(n);
        setup.tier = pair.tier;
        setup.stake_per_player = tier_it->second;
        for (size_t i = 0; i < 2; ++i) {
            const auto &peer = i == 0 ? pair.first : pair.second;
            setup.players[i] = pong::game::PlayerInfo{peer->player_id, peer->display_name, peer->skin, peer};
        }
        auto deps = m_base;
        deps.launch = pong::game::make_random_launch_source(m_cfg.fixed_seed ? m_cfg.fixed_seed + n : random_seed());
        SessionRegistry *registry = &m_registry;
        deps.on_retire = [registry](const std::string &id) { registry->remove(id); };
        auto session = std::make_shared<pong::game::MatchSession>(std::move(setup), m_cfg.match, std::move(deps));
        if (!m_registry.insert(session)) {
            pong::log::error("[mm] duplicate match id {}", session->id());
            continue;
        }
        session->start_ready_phase();
        pong::log::info(
            "[mm] paired {} vs {} tier={} match={}", pair.first->player_id, pair.second->player_id, pair.tier, session->id());
        created.push_back(std::move(session));
    }
    return created;
}

coro::task<void> run_matchmaker(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<Matchmaker> mm)
{
    co_await scheduler->schedule();
    pong::log::info("[mm] matchmaker started tiers={}", mm->config().stake_tiers.size());
    while (!pong::g_shutdown.load()) {
        co_await scheduler->yield_for(std::chrono::milliseconds(mm->config().poll_interval_ms));
        mm->poll_once();
    }
    co_return;
}

} // namespace pong::mm
