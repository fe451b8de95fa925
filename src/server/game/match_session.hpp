// SPDX-License-Identifier: Apache-2.0
// match_session.hpp - One match: ready phase, countdown, fixed-rate simulation, finish/forfeit,
// settlement hand-off and retention. All entry points are serialized by the session mutex.
#pragma once
#include "common/pong_sim.hpp"
#include "pong.pb.h"
#include "server/game/match_store.hpp"
#include "server/game/rate_limiter.hpp"
#include "server/game/settlement.hpp"
#include "server/game/timer_service.hpp"
#include "server/matchmaking/session_manager.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pong::game {

enum class Phase : uint8_t
{
    ready_wait,
    countdown,
    active,
    finished,
    cancelled
};

const char *to_string(Phase p);
// Legal transitions:
//   ready_wait -> countdown | cancelled
//   countdown  -> active | finished (forfeit)
//   active     -> finished
// finished and cancelled are terminal.
bool is_legal_transition(Phase from, Phase to);

struct PlayerInfo
{
    std::string player_id;
    std::string display_name;
    std::optional<std::string> skin;
    std::shared_ptr<pong::mm::Session> conn;
};

struct MatchSetup
{
    std::string match_id;
    std::string tier;
    uint64_t stake_per_player{0};
    std::array<PlayerInfo, 2> players; // [0] = slot p1, [1] = slot p2
};

struct MatchConfig
{
    uint32_t tick_rate{60};
    uint32_t snapshot_interval_ticks{1};
    int win_score{pong::sim::kWinScore};
    std::chrono::milliseconds ready_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds countdown{std::chrono::seconds(3)};
    std::chrono::milliseconds disconnect_grace{std::chrono::seconds(15)};
    std::chrono::milliseconds retention{std::chrono::seconds(30)};
    uint32_t input_rate_limit_per_sec{20};
    size_t chat_history_limit{50};
    size_t chat_max_length{100};
};

using LaunchSource = std::function<pong::sim::LaunchParams()>;

// Seeded mt19937: angle uniform in [-pi/4, pi/4], direction +1 or -1.
LaunchSource make_random_launch_source(uint64_t seed);

struct MatchDeps
{
    std::shared_ptr<ITimerService> timers;
    pong::mm::SessionManager *sessions{nullptr}; // outbound delivery; null drops everything
    std::shared_ptr<ISettlement> settlement;
    std::shared_ptr<IMatchStore> store;
    LaunchSource launch;
    // Invoked once when the session should be dropped from the registry.
    std::function<void(const std::string &match_id)> on_retire;
};

struct ChatEntry
{
    std::string player_id;
    std::string display_name;
    std::string text;
    uint64_t sent_ms{0};
};

struct PlayerView
{
    std::string player_id;
    std::string display_name;
    std::optional<std::string> skin;
    bool ready{false};
    bool disconnected{false};
};

class MatchSession : public std::enable_shared_from_this<MatchSession>
{
public:
    MatchSession(MatchSetup setup, MatchConfig cfg, MatchDeps deps);
    ~MatchSession();

    MatchSession(const MatchSession &) = delete;
    MatchSession &operator=(const MatchSession &) = delete;

    const std::string &id() const noexcept { return m_setup.match_id; }
    const std::string &tier() const noexcept { return m_setup.tier; }
    uint64_t total_stake() const noexcept { return m_setup.stake_per_player * 2; }

    // Announces the ready phase and arms the ready timeout. Must be called once, after the
    // session is owned by a shared_ptr.
    bool start_ready_phase();

    // Inbound events. Each returns whether the event took effect; rejected events are dropped silently.
    bool player_ready(std::string_view player_id);
    bool handle_input(std::string_view player_id, std::string_view direction);
    bool handle_chat(std::string_view player_id, std::string_view text);
    // When `conn` is given the notice is ignored unless it is the player's current connection.
    bool player_disconnected(std::string_view player_id, const std::shared_ptr<pong::mm::Session> &conn = nullptr);
    bool player_reconnected(std::string_view player_id, std::shared_ptr<pong::mm::Session> conn);

    Phase phase() const;
    pong::sim::State state() const;
    std::array<PlayerView, 2> players() const;
    std::vector<ChatEntry> chat_history() const;
    uint64_t tick_count() const;
    std::optional<std::string> winner_id() const;
    std::string finish_reason() const;
    bool has_player(std::string_view player_id) const;
    bool retired() const;

private:
    using clock = ITimerService::clock;

    std::optional<size_t> index_of(std::string_view player_id) const;
    bool transition(Phase to);

    // Timer callbacks; each re-checks the phase at fire time.
    void on_ready_timeout();
    void on_countdown_elapsed();
    void on_tick();
    void on_grace_expired(size_t idx);
    void run_settlement();
    void retire();

    void arm_grace_locked(size_t idx);
    void finish_locked(pong::sim::Slot winner, const std::string &reason, bool forfeit);
    void broadcast_state_locked();
    void send_locked(size_t idx, const pong::ServerMessage &msg);
    void send_both_locked(const pong::ServerMessage &msg);
    void fill_identity_locked(size_t idx, pong::PlayerIdentity *out) const;
    void record_locked(const char *status, const std::string &payout_reference = {});
    pong::ServerMessage make_rejoin_locked(size_t idx) const;
    uint64_t wall_ms() const;

    MatchSetup m_setup;
    MatchConfig m_cfg;
    MatchDeps m_deps;

    mutable std::mutex m_mutex;
    Phase m_phase{Phase::ready_wait};
    bool m_ready_started{false};
    std::array<bool, 2> m_ready{false, false};
    std::array<bool, 2> m_disconnected{false, false};
    std::array<pong::sim::Direction, 2> m_intent{pong::sim::Direction::stop, pong::sim::Direction::stop};
    std::array<SlidingWindowLimiter, 2> m_input_limiters;

    pong::sim::State m_state;
    pong::sim::Sound m_pending_sound{pong::sim::Sound::none}; // carried to the next broadcast
    uint64_t m_tick{0};

    TimerHandle m_ready_timer;
    TimerHandle m_countdown_timer;
    TimerHandle m_tick_timer;
    std::array<TimerHandle, 2> m_grace_timers;
    TimerHandle m_retention_timer;

    std::optional<pong::sim::Slot> m_winner;
    std::string m_finish_reason;
    bool m_settlement_started{false};
    bool m_retired{false};

    std::deque<ChatEntry> m_chat;
};

} // namespace pong::game
