// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/match_session.hpp"
#include "server/matchmaking/session_manager.hpp"
#include "server/matchmaking/session_registry.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pong::mm {

struct MatchmakerConfig
{
    std::map<std::string, uint64_t> stake_tiers; // tier -> stake per player
    uint32_t poll_interval_ms{100};
    // Optional fixed seed; when >0 each match seeds its launch source with fixed_seed + match number.
    uint64_t fixed_seed{0};
    pong::game::MatchConfig match;
};

struct Pairing
{
    std::string tier;
    std::shared_ptr<Session> first;
    std::shared_ptr<Session> second;
};

// FIFO per tier: the two earliest queued peers of each tier are paired, repeatedly.
std::vector<Pairing> pair_by_tier(const std::vector<std::shared_ptr<Session>> &queue);

class Matchmaker
{
public:
    // `base` supplies timers, delivery, settlement and store; launch and on_retire are filled per match.
    Matchmaker(SessionManager &sessions, SessionRegistry &registry, MatchmakerConfig cfg, pong::game::MatchDeps base);

    bool has_tier(const std::string &tier) const { return m_cfg.stake_tiers.count(tier) != 0; }

    // Pairs the current queue and starts the ready phase of every new match.
    std::vector<std::shared_ptr<pong::game::MatchSession>> poll_once();

    const MatchmakerConfig &config() const noexcept { return m_cfg; }

private:
    bool has_live_match(const std::string &player_id) const;

    SessionManager &m_sessions;
    SessionRegistry &m_registry;
    MatchmakerConfig m_cfg;
    pong::game::MatchDeps m_base;
    std::atomic<uint64_t> m_match_counter{0};
};

coro::task<void> run_matchmaker(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<Matchmaker> mm);

} // namespace pong::mm
