// SPDX-License-Identifier: Apache-2.0
#include "server/game/match_session.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "common/snapshot_codec.hpp"

#include <cmath>
#include <exception>
#include <numbers>
#include <random>

namespace pong::game {

namespace {

constexpr const char *kForfeitReason = "opponent disconnected";
constexpr const char *kScoreReason = "score";
constexpr const char *kReadyTimeoutCode = "ready_timeout";
constexpr const char *kReadyTimeoutReason = "Not all players readied up in time";

pong::sim::Slot slot_at(size_t idx)
{
    return idx == 0 ? pong::sim::Slot::p1 : pong::sim::Slot::p2;
}

size_t index_for(pong::sim::Slot s)
{
    return s == pong::sim::Slot::p1 ? 0 : 1;
}

uint32_t whole_seconds(std::chrono::milliseconds d)
{
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(d).count());
}

} // namespace

const char *to_string(Phase p)
{
    switch (p) {
        case Phase::ready_wait:
            return "ready-wait";
        case Phase::countdown:
            return "countdown";
        case Phase::active:
            return "active";
        case Phase::finished:
            return "finished";
        case Phase::cancelled:
            return "cancelled";
    }
    return "unknown";
}

bool is_legal_transition(Phase from, Phase to)
{
    switch (from) {
        case Phase::ready_wait:
            return to == Phase::countdown || to == Phase::cancelled;
        case Phase::countdown:
            return to == Phase::active || to == Phase::finished;
        case Phase::active:
            return to == Phase::finished;
        case Phase::finished:
        case Phase::cancelled:
            return false;
    }
    return false;
}

LaunchSource make_random_launch_source(uint64_t seed)
{
    auto rng = std::make_shared<std::mt19937>(static_cast<std::mt19937::result_type>(seed));
    return [rng]() {
        std::uniform_real_distribution<double> angle(-std::numbers::pi / 4, std::numbers::pi / 4);
        std::bernoulli_distribution coin(0.5);
        pong::sim::LaunchParams p;
        p.angle = angle(*rng);
        p.direction = coin(*rng) ? 1 : -1;
        return p;
    };
}

MatchSession::MatchSession(MatchSetup setup, MatchConfig cfg, MatchDeps deps)
    : m_setup(std::move(setup))
    , m_cfg(cfg)
    , m_deps(std::move(deps))
    , m_input_limiters{
          SlidingWindowLimiter{m_cfg.input_rate_limit_per_sec, std::chrono::seconds(1)},
          SlidingWindowLimiter{m_cfg.input_rate_limit_per_sec, std::chrono::seconds(1)}}
    , m_state(pong::sim::create_state())
{
    if (m_cfg.snapshot_interval_ticks == 0)
        m_cfg.snapshot_interval_ticks = 1;
    if (m_cfg.tick_rate == 0)
        m_cfg.tick_rate = 60;
    if (!m_deps.launch)
        m_deps.launch = make_random_launch_source(std::random_device{}());
}

MatchSession::~MatchSession()
{
    m_ready_timer.cancel();
    m_countdown_timer.cancel();
    m_tick_timer.cancel();
    for (auto &g : m_grace_timers)
        g.cancel();
    m_retention_timer.cancel();
}

std::optional<size_t> MatchSession::index_of(std::string_view player_id) const
{
    for (size_t i = 0; i < m_setup.players.size(); ++i)
        if (m_setup.players[i].player_id == player_id)
            return i;
    return std::nullopt;
}

bool MatchSession::transition(Phase to)
{
    if (!is_legal_transition(m_phase, to)) {
        pong::log::debug(
            "[match] id={} ignored transition {} -> {}", m_setup.match_id, to_string(m_phase), to_string(to));
        return false;
    }
    pong::log::info("[match] id={} phase {} -> {}", m_setup.match_id, to_string(m_phase), to_string(to));
    m_phase = to;
    return true;
}

uint64_t MatchSession::wall_ms() const
{
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
}

// ---------------------------------------------------------------- outbound

void MatchSession::send_locked(size_t idx, const pong::ServerMessage &msg)
{
    if (m_deps.sessions)
        m_deps.sessions->push_message(m_setup.players[idx].conn, msg);
}

void MatchSession::send_both_locked(const pong::ServerMessage &msg)
{
    send_locked(0, msg);
    send_locked(1, msg);
}

void MatchSession::fill_identity_locked(size_t idx, pong::PlayerIdentity *out) const
{
    const auto &p = m_setup.players[idx];
    out->set_player_id(p.player_id);
    out->set_display_name(p.display_name);
    out->set_skin(p.skin.value_or(""));
    out->set_slot(static_cast<uint32_t>(idx + 1));
}

void MatchSession::broadcast_state_locked()
{
    auto snap = pong::sim::serialize_state(m_state);
    if (snap.sound == pong::sim::Sound::none)
        snap.sound = m_pending_sound;
    m_pending_sound = pong::sim::Sound::none;
    pong::ServerMessage msg;
    pong::codec::to_proto(snap, m_setup.match_id, m_tick, *msg.mutable_snapshot());
    send_both_locked(msg);
    pong::metrics::runtime().snapshots_sent.fetch_add(1, std::memory_order_relaxed);
}

void MatchSession::record_locked(const char *status, const std::string &payout_reference)
{
    if (!m_deps.store)
        return;
    MatchRecord rec;
    rec.match_id = m_setup.match_id;
    rec.status = status;
    rec.tier = m_setup.tier;
    rec.total_stake = total_stake();
    rec.score_p1 = m_state.score.p1;
    rec.score_p2 = m_state.score.p2;
    if (m_winner) {
        size_t w = index_for(*m_winner);
        rec.winner_id = m_setup.players[w].player_id;
        rec.loser_id = m_setup.players[1 - w].player_id;
    }
    rec.reason = m_finish_reason;
    rec.payout_reference = payout_reference;
    try {
        m_deps.store->record(rec);
    } catch (const std::exception &e) {
        pong::log::error("[match] id={} record status={} failed: {}", m_setup.match_id, status, e.what());
    }
}

// ---------------------------------------------------------------- ready phase

bool MatchSession::start_ready_phase()
{
    std::scoped_lock lk{m_mutex};
    if (m_phase != Phase::ready_wait || m_ready_started)
        return false;
    m_ready_started = true;
    for (size_t i = 0; i < 2; ++i) {
        pong::ServerMessage msg;
        auto *rp = msg.mutable_ready_phase();
        rp->set_match_id(m_setup.match_id);
        rp->set_timeout_seconds(whole_seconds(m_cfg.ready_timeout));
        fill_identity_locked(0, rp->add_players());
        fill_identity_locked(1, rp->add_players());
        rp->set_your_slot(static_cast<uint32_t>(i + 1));
        rp->set_tier(m_setup.tier);
        rp->set_stake_per_player(m_setup.stake_per_player);
        send_locked(i, msg);
    }
    std::weak_ptr<MatchSession> weak = weak_from_this();
    m_ready_timer = m_deps.timers->schedule_after(m_cfg.ready_timeout, [weak]() {
        if (auto self = weak.lock())
            self->on_ready_timeout();
    });
    pong::log::info(
        "[match] id={} ready phase p1={} p2={} tier={} stake={}",
        m_setup.match_id,
        m_setup.players[0].player_id,
        m_setup.players[1].player_id,
        m_setup.tier,
        m_setup.stake_per_player);
    return true;
}

bool MatchSession::player_ready(std::string_view player_id)
{
    std::scoped_lock lk{m_mutex};
    if (m_phase != Phase::ready_wait)
        return false;
    auto idx = index_of(player_id);
    if (!idx || m_ready[*idx])
        return false;
    m_ready[*idx] = true;
    {
        pong::ServerMessage msg;
        auto *rs = msg.mutable_ready_status();
        rs->set_match_id(m_setup.match_id);
        rs->set_p1_ready(m_ready[0]);
        rs->set_p2_ready(m_ready[1]);
        send_both_locked(msg);
    }
    pong::log::debug("[match] id={} ready player={}", m_setup.match_id, player_id);
    if (!(m_ready[0] && m_ready[1]))
        return true;

    m_ready_timer.cancel();
    transition(Phase::countdown);
    pong::ServerMessage cd;
    cd.mutable_countdown_started()->set_match_id(m_setup.match_id);
    cd.mutable_countdown_started()->set_seconds(whole_seconds(m_cfg.countdown));
    send_both_locked(cd);
    std::weak_ptr<MatchSession> weak = weak_from_this();
    m_countdown_timer = m_deps.timers->schedule_after(m_cfg.countdown, [weak]() {
        if (auto self = weak.lock())
            self->on_countdown_elapsed();
    });
    // A player who dropped after readying now races the grace period.
    for (size_t i = 0; i < 2; ++i)
        if (m_disconnected[i])
            arm_grace_locked(i);
    return true;
}

void MatchSession::on_ready_timeout()
{
    {
        std::scoped_lock lk{m_mutex};
        if (m_phase != Phase::ready_wait || (m_ready[0] && m_ready[1]))
            return;
        transition(Phase::cancelled);
        pong::ServerMessage msg;
        auto *mc = msg.mutable_match_cancelled();
        mc->set_match_id(m_setup.match_id);
        mc->set_code(kReadyTimeoutCode);
        mc->set_reason(kReadyTimeoutReason);
        send_both_locked(msg);
        m_finish_reason = kReadyTimeoutReason;
        record_locked(record_status::cancelled);
        pong::metrics::runtime().matches_cancelled.fetch_add(1, std::memory_order_relaxed);
        pong::log::info(
            "[match] id={} cancelled: ready timeout (p1_ready={} p2_ready={})",
            m_setup.match_id,
            m_ready[0],
            m_ready[1]);
    }
    retire();
}

// ---------------------------------------------------------------- active phase

void MatchSession::on_countdown_elapsed()
{
    std::scoped_lock lk{m_mutex};
    if (m_phase != Phase::countdown)
        return;
    transition(Phase::active);
    m_state = pong::sim::create_state();
    pong::sim::launch_ball(m_state, m_deps.launch());
    for (size_t i = 0; i < 2; ++i) {
        pong::ServerMessage msg;
        auto *ms = msg.mutable_match_started();
        ms->set_match_id(m_setup.match_id);
        fill_identity_locked(0, ms->add_players());
        fill_identity_locked(1, ms->add_players());
        ms->set_your_slot(static_cast<uint32_t>(i + 1));
        ms->set_tick_rate(m_cfg.tick_rate);
        send_locked(i, msg);
    }
    record_locked(record_status::in_progress);
    broadcast_state_locked();
    std::weak_ptr<MatchSession> weak = weak_from_this();
    m_tick_timer = m_deps.timers->schedule_every(tick_interval_for(m_cfg.tick_rate), [weak]() {
        if (auto self = weak.lock())
            self->on_tick();
    });
    pong::metrics::runtime().matches_started.fetch_add(1, std::memory_order_relaxed);
}

bool MatchSession::handle_input(std::string_view player_id, std::string_view direction)
{
    std::scoped_lock lk{m_mutex};
    if (m_phase != Phase::active)
        return false;
    auto dir = pong::sim::parse_direction(direction);
    auto idx = index_of(player_id);
    if (!dir || !idx) {
        pong::metrics::runtime().inputs_rejected.fetch_add(1, std::memory_order_relaxed);
        PONG_LOG_EVERY_N(debug, 50, "[match] id={} rejected input player={}", m_setup.match_id, player_id);
        return false;
    }
    if (!m_input_limiters[*idx].allow(m_deps.timers->now())) {
        pong::metrics::runtime().inputs_rate_limited.fetch_add(1, std::memory_order_relaxed);
        PONG_LOG_EVERY_N(debug, 20, "[match] id={} input rate limited player={}", m_setup.match_id, player_id);
        return false;
    }
    m_intent[*idx] = *dir;
    return true;
}

void MatchSession::on_tick()
{
    std::scoped_lock lk{m_mutex};
    if (m_phase != Phase::active)
        return;
    auto t0 = std::chrono::steady_clock::now();
    ++m_tick;
    auto &st = m_state;
    if (st.status != pong::sim::Status::playing)
        return;
    st.sound = pong::sim::Sound::none;
    pong::sim::apply_input(st, pong::sim::Slot::p1, m_intent[0]);
    pong::sim::apply_input(st, pong::sim::Slot::p2, m_intent[1]);
    bool broadcast_tick = (m_tick % m_cfg.snapshot_interval_ticks) == 0;

    if (st.pause_ticks > 0) {
        if (pong::sim::tick_pause(st))
            pong::sim::launch_ball(st, m_deps.launch());
        if (broadcast_tick)
            broadcast_state_locked();
    } else {
        auto res = pong::sim::step_ball(st);
        st.sound = res.sound;
        if (res.sound == pong::sim::Sound::wall || res.sound == pong::sim::Sound::paddle)
            m_pending_sound = res.sound;
        if (res.scored) {
            int &pts = *res.scored == pong::sim::Slot::p1 ? st.score.p1 : st.score.p2;
            ++pts;
            pong::log::debug(
                "[match] id={} score {}-{} tick={}", m_setup.match_id, st.score.p1, st.score.p2, m_tick);
            if (pts >= m_cfg.win_score) {
                finish_locked(*res.scored, kScoreReason, false);
            } else {
                pong::sim::reset_ball_after_score(st);
                broadcast_state_locked();
            }
        } else if (broadcast_tick) {
            broadcast_state_locked();
        }
    }
    pong::metrics::add_tick_duration(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count()));
}

// ---------------------------------------------------------------- finish / settlement

void MatchSession::finish_locked(pong::sim::Slot winner, const std::string &reason, bool forfeit)
{
    if (!transition(Phase::finished))
        return;
    m_tick_timer.cancel();
    m_countdown_timer.cancel();
    for (auto &g : m_grace_timers)
        g.cancel();

    m_winner = winner;
    m_finish_reason = reason;
    m_state.status = pong::sim::Status::finished;
    m_state.winner = winner;
    size_t w = index_for(winner);
    const auto &winner_id = m_setup.players[w].player_id;
    const auto &loser_id = m_setup.players[1 - w].player_id;

    broadcast_state_locked();
    if (forfeit) {
        pong::ServerMessage fm;
        auto *mf = fm.mutable_match_forfeit();
        mf->set_match_id(m_setup.match_id);
        mf->set_winner_id(winner_id);
        mf->set_reason(reason);
        send_both_locked(fm);
    }
    pong::ServerMessage msg;
    auto *mfin = msg.mutable_match_finished();
    mfin->set_match_id(m_setup.match_id);
    mfin->set_winner_id(winner_id);
    mfin->set_loser_id(loser_id);
    mfin->mutable_score()->set_p1(static_cast<uint32_t>(m_state.score.p1));
    mfin->mutable_score()->set_p2(static_cast<uint32_t>(m_state.score.p2));
    mfin->set_reason(reason);
    mfin->set_forfeit(forfeit);
    send_both_locked(msg);

    record_locked(record_status::completed);
    auto &rt = pong::metrics::runtime();
    rt.matches_finished.fetch_add(1, std::memory_order_relaxed);
    if (forfeit)
        rt.forfeits.fetch_add(1, std::memory_order_relaxed);
    pong::log::info(
        "[match] id={} finished winner={} score={}-{} reason={} ticks={}",
        m_setup.match_id,
        winner_id,
        m_state.score.p1,
        m_state.score.p2,
        reason,
        m_tick);

    std::weak_ptr<MatchSession> weak = weak_from_this();
    m_deps.timers->schedule_after(std::chrono::nanoseconds(0), [weak]() {
        if (auto self = weak.lock())
            self->run_settlement();
    });
    m_retention_timer = m_deps.timers->schedule_after(m_cfg.retention, [weak]() {
        if (auto self = weak.lock())
            self->retire();
    });
}

void MatchSession::run_settlement()
{
    std::string winner_id;
    std::string loser_id;
    {
        std::scoped_lock lk{m_mutex};
        if (m_phase != Phase::finished || m_settlement_started || !m_winner)
            return;
        m_settlement_started = true;
        size_t w = index_for(*m_winner);
        winner_id = m_setup.players[w].player_id;
        loser_id = m_setup.players[1 - w].player_id;
    }

    SettlementResult res;
    if (!m_deps.settlement) {
        res.reason = "settlement unavailable";
    } else {
        try {
            res = m_deps.settlement->settle(winner_id, loser_id, total_stake());
        } catch (const std::exception &e) {
            res = SettlementResult{};
            res.reason = e.what();
        }
    }

    std::scoped_lock lk{m_mutex};
    pong::ServerMessage msg;
    if (res.ok) {
        auto *sc = msg.mutable_settlement_complete();
        sc->set_match_id(m_setup.match_id);
        sc->set_payout_reference(res.payout_reference);
        sc->set_winner_share(res.winner_share);
        sc->set_burned_share(res.burned_share);
        record_locked(record_status::settled, res.payout_reference);
        pong::metrics::runtime().settlements_ok.fetch_add(1, std::memory_order_relaxed);
        pong::log::info("[match] id={} settled ref={}", m_setup.match_id, res.payout_reference);
    } else {
        auto *sf = msg.mutable_settlement_failed();
        sf->set_match_id(m_setup.match_id);
        sf->set_reason(res.reason);
        record_locked(record_status::settlement_failed);
        pong::metrics::runtime().settlements_failed.fetch_add(1, std::memory_order_relaxed);
        pong::log::warn("[match] id={} settlement failed: {}", m_setup.match_id, res.reason);
    }
    send_both_locked(msg);
}

void MatchSession::retire()
{
    {
        std::scoped_lock lk{m_mutex};
        if (m_retired)
            return;
        m_retired = true;
        m_ready_timer.cancel();
        m_countdown_timer.cancel();
        m_tick_timer.cancel();
        for (auto &g : m_grace_timers)
            g.cancel();
        m_retention_timer.cancel();
    }
    pong::log::debug("[match] id={} retired", m_setup.match_id);
    if (m_deps.on_retire)
        m_deps.on_retire(m_setup.match_id);
}

// ---------------------------------------------------------------- presence

void MatchSession::arm_grace_locked(size_t idx)
{
    m_grace_timers[idx].cancel();
    std::weak_ptr<MatchSession> weak = weak_from_this();
    m_grace_timers[idx] = m_deps.timers->schedule_after(m_cfg.disconnect_grace, [weak, idx]() {
        if (auto self = weak.lock())
            self->on_grace_expired(idx);
    });
}

bool MatchSession::player_disconnected(std::string_view player_id, const std::shared_ptr<pong::mm::Session> &conn)
{
    std::scoped_lock lk{m_mutex};
    if (m_phase == Phase::finished || m_phase == Phase::cancelled)
        return false;
    auto idx = index_of(player_id);
    if (!idx || m_disconnected[*idx])
        return false;
    if (conn && m_setup.players[*idx].conn != conn)
        return false; // stale connection; the player is already on a newer one
    m_disconnected[*idx] = true;
    pong::ServerMessage msg;
    msg.mutable_opponent_disconnected()->set_match_id(m_setup.match_id);
    msg.mutable_opponent_disconnected()->set_grace_seconds(whole_seconds(m_cfg.disconnect_grace));
    send_locked(1 - *idx, msg);
    if (m_phase == Phase::countdown || m_phase == Phase::active)
        arm_grace_locked(*idx);
    pong::log::info(
        "[match] id={} player={} disconnected phase={}", m_setup.match_id, player_id, to_string(m_phase));
    return true;
}

void MatchSession::on_grace_expired(size_t idx)
{
    std::scoped_lock lk{m_mutex};
    if (!m_disconnected[idx])
        return; // reconnected in the meantime
    if (m_phase != Phase::countdown && m_phase != Phase::active)
        return;
    pong::log::info(
        "[match] id={} player={} did not return, forfeit", m_setup.match_id, m_setup.players[idx].player_id);
    finish_locked(pong::sim::other(slot_at(idx)), kForfeitReason, true);
}

bool MatchSession::player_reconnected(std::string_view player_id, std::shared_ptr<pong::mm::Session> conn)
{
    std::scoped_lock lk{m_mutex};
    if (m_phase == Phase::cancelled || m_retired)
        return false;
    auto idx = index_of(player_id);
    if (!idx)
        return false;
    m_setup.players[*idx].conn = std::move(conn);
    bool was_disconnected = m_disconnected[*idx];
    m_disconnected[*idx] = false;
    m_grace_timers[*idx].cancel();
    if (was_disconnected) {
        pong::ServerMessage msg;
        msg.mutable_opponent_reconnected()->set_match_id(m_setup.match_id);
        send_locked(1 - *idx, msg);
    }
    send_locked(*idx, make_rejoin_locked(*idx));
    pong::log::info(
        "[match] id={} player={} reconnected phase={}", m_setup.match_id, player_id, to_string(m_phase));
    return true;
}

pong::ServerMessage MatchSession::make_rejoin_locked(size_t idx) const
{
    pong::ServerMessage msg;
    auto *rj = msg.mutable_rejoin();
    rj->set_match_id(m_setup.match_id);
    rj->set_phase(to_string(m_phase));
    rj->set_your_slot(static_cast<uint32_t>(idx + 1));
    fill_identity_locked(0, rj->add_players());
    fill_identity_locked(1, rj->add_players());
    rj->set_tick_rate(m_cfg.tick_rate);
    pong::codec::to_proto(pong::sim::serialize_state(m_state), m_setup.match_id, m_tick, *rj->mutable_snapshot());
    for (const auto &c : m_chat) {
        auto *cm = rj->add_chat_history();
        cm->set_match_id(m_setup.match_id);
        cm->set_player_id(c.player_id);
        cm->set_display_name(c.display_name);
        cm->set_text(c.text);
        cm->set_sent_ms(c.sent_ms);
    }
    return msg;
}

// ---------------------------------------------------------------- chat

bool MatchSession::handle_chat(std::string_view player_id, std::string_view text)
{
    std::scoped_lock lk{m_mutex};
    if (m_retired || m_phase == Phase::cancelled)
        return false;
    auto idx = index_of(player_id);
    if (!idx || text.empty())
        return false;
    ChatEntry e;
    e.player_id = std::string(player_id);
    e.display_name = m_setup.players[*idx].display_name;
    e.text = std::string(text.substr(0, m_cfg.chat_max_length));
    e.sent_ms = wall_ms();
    pong::ServerMessage msg;
    auto *cm = msg.mutable_chat_message();
    cm->set_match_id(m_setup.match_id);
    cm->set_player_id(e.player_id);
    cm->set_display_name(e.display_name);
    cm->set_text(e.text);
    cm->set_sent_ms(e.sent_ms);
    m_chat.push_back(std::move(e));
    while (m_chat.size() > m_cfg.chat_history_limit)
        m_chat.pop_front();
    send_both_locked(msg);
    return true;
}

// ---------------------------------------------------------------- introspection

Phase MatchSession::phase() const
{
    std::scoped_lock lk{m_mutex};
    return m_phase;
}

pong::sim::State MatchSession::state() const
{
    std::scoped_lock lk{m_mutex};
    return m_state;
}

std::array<PlayerView, 2> MatchSession::players() const
{
    std::scoped_lock lk{m_mutex};
    std::array<PlayerView, 2> out;
    for (size_t i = 0; i < 2; ++i) {
        out[i].player_id = m_setup.players[i].player_id;
        out[i].display_name = m_setup.players[i].display_name;
        out[i].skin = m_setup.players[i].skin;
        out[i].ready = m_ready[i];
        out[i].disconnected = m_disconnected[i];
    }
    return out;
}

std::vector<ChatEntry> MatchSession::chat_history() const
{
    std::scoped_lock lk{m_mutex};
    return {m_chat.begin(), m_chat.end()};
}

uint64_t MatchSession::tick_count() const
{
    std::scoped_lock lk{m_mutex};
    return m_tick;
}

std::optional<std::string> MatchSession::winner_id() const
{
    std::scoped_lock lk{m_mutex};
    if (!m_winner)
        return std::nullopt;
    return m_setup.players[index_for(*m_winner)].player_id;
}

std::string MatchSession::finish_reason() const
{
    std::scoped_lock lk{m_mutex};
    return m_finish_reason;
}

bool MatchSession::has_player(std::string_view player_id) const
{
    return index_of(player_id).has_value();
}

bool MatchSession::retired() const
{
    std::scoped_lock lk{m_mutex};
    return m_retired;
}

} // namespace pong::game
