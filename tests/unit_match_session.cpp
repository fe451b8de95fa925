// SPDX-License-Identifier: Apache-2.0
// unit_match_session.cpp
// Full match on a virtual clock: ready phase, countdown, eight horizontal serves that both
// paddles miss, finish at 5-3, settlement and retention.
#include "test_fakes.hpp"

#include <cassert>
#include <iostream>
#include <numbers>

using pong::ServerMessage;
using pong::game::Phase;

static void test_transition_table()
{
    using pong::game::is_legal_transition;
    assert(is_legal_transition(Phase::ready_wait, Phase::countdown));
    assert(is_legal_transition(Phase::ready_wait, Phase::cancelled));
    assert(is_legal_transition(Phase::countdown, Phase::active));
    assert(is_legal_transition(Phase::countdown, Phase::finished));
    assert(is_legal_transition(Phase::active, Phase::finished));
    assert(!is_legal_transition(Phase::ready_wait, Phase::active));
    assert(!is_legal_transition(Phase::active, Phase::cancelled));
    assert(!is_legal_transition(Phase::finished, Phase::active));
    assert(!is_legal_transition(Phase::cancelled, Phase::countdown));
    assert(!is_legal_transition(Phase::finished, Phase::finished));
}

static void test_ready_and_countdown_messages()
{
    pong::test::MatchHarness h;
    assert(h.match->phase() == Phase::ready_wait);
    assert(h.match->start_ready_phase());
    assert(!h.match->start_ready_phase());
    auto a = h.drain(h.alice);
    auto b = h.drain(h.bob);
    const auto *rp_a = pong::test::first_of(a, ServerMessage::kReadyPhase);
    const auto *rp_b = pong::test::first_of(b, ServerMessage::kReadyPhase);
    assert(rp_a && rp_b);
    assert(rp_a->ready_phase().your_slot() == 1);
    assert(rp_b->ready_phase().your_slot() == 2);
    assert(rp_a->ready_phase().timeout_seconds() == 30);
    assert(rp_a->ready_phase().players_size() == 2);
    assert(rp_a->ready_phase().players(1).skin() == "neon");
    assert(rp_a->ready_phase().stake_per_player() == 1000);

    // unknown player and duplicate ready are ignored
    assert(!h.match->player_ready("mallory"));
    assert(h.match->player_ready("alice"));
    assert(!h.match->player_ready("alice"));
    assert(h.match->phase() == Phase::ready_wait);
    assert(h.match->players()[0].ready && !h.match->players()[1].ready);
    assert(h.match->player_ready("bob"));
    assert(h.match->phase() == Phase::countdown);
    b = h.drain(h.bob);
    assert(pong::test::count_of(b, ServerMessage::kReadyStatus) == 2);
    const auto *cd = pong::test::first_of(b, ServerMessage::kCountdownStarted);
    assert(cd && cd->countdown_started().seconds() == 3);

    // input before the match is active is dropped
    assert(!h.match->handle_input("alice", "up"));
    h.timers->advance(std::chrono::milliseconds(2999));
    assert(h.match->phase() == Phase::countdown);
    h.timers->advance(std::chrono::milliseconds(1));
    assert(h.match->phase() == Phase::active);
    a = h.drain(h.alice);
    const auto *ms = pong::test::first_of(a, ServerMessage::kMatchStarted);
    assert(ms && ms->match_started().your_slot() == 1 && ms->match_started().tick_rate() == 60);
    assert(pong::test::count_of(a, ServerMessage::kSnapshot) == 1);
    auto st = h.match->state();
    assert(st.ball.vx > 0 && st.ball.vy == 0.0);
    // ready timeout no longer applies
    h.timers->advance(std::chrono::seconds(40));
    assert(h.match->phase() != Phase::cancelled);
}

static void test_clean_match_to_five()
{
    // p1 scores on +1 serves, p2 on -1 serves: 5-3 after eight serves.
    pong::test::MatchHarness h{{}, pong::test::scripted_launch({1, -1, 1, -1, 1, -1, 1, 1})};
    h.start_active();
    assert(h.match->handle_input("alice", "up"));
    assert(h.match->handle_input("bob", "up"));
    h.drain(h.alice);
    h.drain(h.bob);

    std::vector<ServerMessage> seen;
    int guard = 0;
    while (h.match->phase() == Phase::active && guard++ < 5000) {
        h.advance_ticks(1);
        auto batch = h.drain(h.alice);
        seen.insert(seen.end(), batch.begin(), batch.end());
    }
    assert(h.match->phase() == Phase::finished);
    auto st = h.match->state();
    assert(st.score.p1 == 5 && st.score.p2 == 3);
    assert(st.status == pong::sim::Status::finished);
    assert(st.winner == pong::sim::Slot::p1);
    assert(st.paddle1.y == 0.0 && st.paddle2.y == 0.0);
    assert(h.match->winner_id() == std::optional<std::string>("alice"));
    assert(h.match->finish_reason() == "score");

    // final snapshot then MatchFinished, nothing simulated afterwards
    size_t fin = seen.size();
    for (size_t i = 0; i < seen.size(); ++i)
        if (seen[i].payload_case() == ServerMessage::kMatchFinished)
            fin = i;
    assert(fin < seen.size() && fin > 0);
    assert(pong::test::count_of(seen, ServerMessage::kMatchFinished) == 1);
    const auto &mf = seen[fin].match_finished();
    assert(mf.winner_id() == "alice" && mf.loser_id() == "bob");
    assert(mf.score().p1() == 5 && mf.score().p2() == 3);
    assert(!mf.forfeit() && mf.reason() == "score");
    const auto &final_snap = seen[fin - 1];
    assert(final_snap.payload_case() == ServerMessage::kSnapshot);
    assert(final_snap.snapshot().status() == "finished");
    assert(final_snap.snapshot().winner() == 1);
    for (size_t i = fin + 1; i < seen.size(); ++i)
        assert(seen[i].payload_case() != ServerMessage::kSnapshot);
    assert(pong::test::count_of(seen, ServerMessage::kMatchForfeit) == 0);

    // a score snapshot is paused and recentred
    bool saw_pause = false;
    for (const auto &m : seen) {
        if (m.payload_case() == ServerMessage::kSnapshot && m.snapshot().paused()) {
            assert(m.snapshot().ball().x() == pong::sim::kBallCenterX);
            saw_pause = true;
        }
    }
    assert(saw_pause);

    uint64_t ticks_at_finish = h.match->tick_count();
    h.advance_ticks(120);
    assert(h.match->tick_count() == ticks_at_finish);
    auto after = h.drain(h.alice);
    assert(pong::test::count_of(after, ServerMessage::kSnapshot) == 0);
    seen.insert(seen.end(), after.begin(), after.end());
    assert(pong::test::count_of(seen, ServerMessage::kSettlementComplete) == 1);
    const auto *sc = pong::test::first_of(seen, ServerMessage::kSettlementComplete);
    assert(sc && sc->settlement_complete().payout_reference() == "ref-alice");

    auto calls = h.settlement->calls();
    assert(calls.size() == 1);
    assert(calls[0].winner_id == "alice" && calls[0].loser_id == "bob" && calls[0].total_stake == 2000);

    auto statuses = h.store->statuses();
    assert((statuses == std::vector<std::string>{"in-progress", "completed", "settled"}));
    auto recs = h.store->records();
    assert(recs[1].score_p1 == 5 && recs[1].score_p2 == 3 && recs[1].winner_id == "alice");
    assert(recs[2].payout_reference == "ref-alice");

    // retained for inspection, then retired exactly once
    assert(h.retired.empty());
    h.timers->advance(std::chrono::seconds(30));
    assert(h.retired.size() == 1 && h.retired[0] == "m_test");
    assert(h.match->retired());
    h.timers->advance(std::chrono::seconds(60));
    assert(h.retired.size() == 1);
    assert(h.timers->pending() == 0);
}

static void test_snapshot_throttle_carries_sound()
{
    pong::game::MatchConfig cfg;
    cfg.snapshot_interval_ticks = 5;
    // 45 degree serve upward: reaches the top wall on tick 104, a skipped tick
    auto steep = []() {
        pong::sim::LaunchParams p;
        p.angle = -std::numbers::pi / 4;
        p.direction = 1;
        return p;
    };
    pong::test::MatchHarness h{cfg, steep};
    h.start_active();
    h.drain(h.alice);
    std::vector<ServerMessage> snaps;
    for (int i = 0; i < 120; ++i) {
        h.advance_ticks(1);
        for (const auto &m : h.drain(h.alice))
            if (m.payload_case() == ServerMessage::kSnapshot)
                snaps.push_back(m);
    }
    assert(h.match->phase() == Phase::active);
    assert(snaps.size() == 24);
    bool carried = false;
    for (const auto &m : snaps) {
        assert(m.snapshot().tick() % 5 == 0);
        if (m.snapshot().tick() == 105) {
            assert(m.snapshot().sound() == "wall");
            carried = true;
        } else {
            assert(m.snapshot().sound().empty());
        }
    }
    assert(carried);
}

int main()
{
    test_transition_table();
    test_ready_and_countdown_messages();
    test_clean_match_to_five();
    test_snapshot_throttle_carries_sound();
    std::cout << "unit_match_session OK" << std::endl;
    return 0;
}
