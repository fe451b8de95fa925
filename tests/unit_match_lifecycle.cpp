// SPDX-License-Identifier: Apache-2.0
// unit_match_lifecycle.cpp
// Ready timeout, forfeit, reconnect, finish idempotency, input validation, settlement failure, chat.
#include "test_fakes.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace std::chrono_literals;
using pong::ServerMessage;
using pong::game::Phase;
using pong::test::count_of;
using pong::test::first_of;

static void test_ready_timeout_cancels()
{
    pong::test::MatchHarness h;
    h.match->start_ready_phase();
    assert(h.match->player_ready("alice"));
    h.timers->advance(29s);
    assert(h.match->phase() == Phase::ready_wait);
    h.timers->advance(1s);
    assert(h.match->phase() == Phase::cancelled);
    for (auto &peer : {h.alice, h.bob}) {
        auto msgs = h.drain(peer);
        const auto *mc = first_of(msgs, ServerMessage::kMatchCancelled);
        assert(mc);
        assert(mc->match_cancelled().code() == "ready_timeout");
        assert(mc->match_cancelled().reason() == "Not all players readied up in time");
        assert(count_of(msgs, ServerMessage::kMatchFinished) == 0);
    }
    assert(h.retired.size() == 1 && h.retired[0] == "m_test");
    assert(h.settlement->calls().empty());
    assert((h.store->statuses() == std::vector<std::string>{"cancelled"}));
    // late events are dropped
    assert(!h.match->player_ready("bob"));
    assert(!h.match->handle_chat("bob", "hello?"));
    assert(!h.match->player_reconnected("bob", h.bob));
    h.timers->advance(60s);
    assert(h.retired.size() == 1);
    assert(h.timers->pending() == 0);
}

static void test_forfeit_after_grace()
{
    pong::test::MatchHarness h;
    h.start_active();
    h.drain(h.alice);
    assert(h.match->player_disconnected("bob", h.bob));
    assert(!h.match->player_disconnected("bob", h.bob));
    auto a = h.drain(h.alice);
    const auto *od = first_of(a, ServerMessage::kOpponentDisconnected);
    assert(od && od->opponent_disconnected().grace_seconds() == 15);
    assert(h.match->players()[1].disconnected);

    h.timers->advance(14900ms);
    assert(h.match->phase() == Phase::active);
    h.timers->advance(100ms);
    assert(h.match->phase() == Phase::finished);
    assert(h.match->winner_id() == std::optional<std::string>("alice"));
    assert(h.match->finish_reason() == "opponent disconnected");
    a = h.drain(h.alice);
    const auto *mfo = first_of(a, ServerMessage::kMatchForfeit);
    assert(mfo && mfo->match_forfeit().winner_id() == "alice");
    const auto *mf = first_of(a, ServerMessage::kMatchFinished);
    assert(mf && mf->match_finished().forfeit() && mf->match_finished().loser_id() == "bob");
    auto calls = h.settlement->calls();
    assert(calls.size() == 1 && calls[0].winner_id == "alice" && calls[0].total_stake == 2000);
    // the score at forfeit time is whatever was on the board
    auto st = h.match->state();
    assert(st.status == pong::sim::Status::finished && st.winner == pong::sim::Slot::p1);
}

static void test_reconnect_within_grace()
{
    pong::test::MatchHarness h;
    h.start_active();
    assert(h.match->handle_chat("alice", "gl hf"));
    assert(h.match->player_disconnected("bob", h.bob));
    h.timers->advance(10500ms);
    assert(h.match->phase() == Phase::active);

    auto bob2 = h.sessions.add_detached("c_bob2");
    h.sessions.authenticate(bob2, "bob", "Bob", std::string("neon"));
    h.drain(h.alice);
    assert(h.match->player_reconnected("bob", bob2));
    assert(!h.match->players()[1].disconnected);
    auto a = h.drain(h.alice);
    assert(count_of(a, ServerMessage::kOpponentReconnected) == 1);
    auto b = h.drain(bob2);
    const auto *rj = first_of(b, ServerMessage::kRejoin);
    assert(rj);
    assert(rj->rejoin().phase() == "active");
    assert(rj->rejoin().your_slot() == 2);
    assert(rj->rejoin().players_size() == 2);
    assert(rj->rejoin().tick_rate() == 60);
    assert(rj->rejoin().has_snapshot() && rj->rejoin().snapshot().status() == "playing");
    assert(rj->rejoin().chat_history_size() == 1 && rj->rejoin().chat_history(0).text() == "gl hf");

    // grace timer no longer fires
    h.timers->advance(20s);
    assert(h.match->phase() == Phase::active);
    // a late close of the replaced connection is ignored
    assert(!h.match->player_disconnected("bob", h.bob));
    assert(!h.match->players()[1].disconnected);
    // snapshots now flow to the new connection
    h.advance_ticks(2);
    assert(count_of(h.drain(bob2), ServerMessage::kSnapshot) == 2);
    // a second drop starts a fresh grace period
    assert(h.match->player_disconnected("bob", bob2));
    h.timers->advance(15s);
    assert(h.match->phase() == Phase::finished);
}

static void test_reconnect_then_score_finish()
{
    // Same serve script as the clean match: 5-3 for alice once all eight serves are played.
    pong::test::MatchHarness h{{}, pong::test::scripted_launch({1, -1, 1, -1, 1, -1, 1, 1})};
    h.start_active();
    assert(h.match->handle_input("alice", "up"));
    assert(h.match->handle_input("bob", "up"));
    assert(h.match->player_disconnected("bob", h.bob));
    h.timers->advance(5s);
    assert(h.match->phase() == Phase::active);
    auto bob2 = h.sessions.add_detached("c_bob2");
    h.sessions.authenticate(bob2, "bob", "Bob", std::string("neon"));
    assert(h.match->player_reconnected("bob", bob2));
    h.drain(bob2);

    int guard = 0;
    while (h.match->phase() == Phase::active && guard++ < 5000)
        h.advance_ticks(1);
    assert(h.match->phase() == Phase::finished);
    assert(h.match->winner_id() == std::optional<std::string>("alice"));
    assert(h.match->finish_reason() == "score");
    auto st = h.match->state();
    assert(st.score.p1 == 5 && st.score.p2 == 3);

    auto b = h.drain(bob2);
    assert(count_of(b, ServerMessage::kMatchForfeit) == 0);
    const auto *mf = first_of(b, ServerMessage::kMatchFinished);
    assert(mf && !mf->match_finished().forfeit() && mf->match_finished().reason() == "score");
    assert(mf->match_finished().winner_id() == "alice" && mf->match_finished().loser_id() == "bob");
    assert(count_of(b, ServerMessage::kSettlementComplete) == 1);
    auto calls = h.settlement->calls();
    assert(calls.size() == 1 && calls[0].winner_id == "alice" && calls[0].total_stake == 2000);
    // the cancelled grace timer never reopens the outcome
    h.timers->advance(20s);
    assert(h.match->finish_reason() == "score");
    assert(h.settlement->calls().size() == 1);
}

static void test_disconnect_during_ready_phase()
{
    // Only the opponent is notified; the ready timeout governs cancellation.
    {
        pong::test::MatchHarness h;
        h.match->start_ready_phase();
        assert(h.match->player_disconnected("alice", h.alice));
        assert(count_of(h.drain(h.bob), ServerMessage::kOpponentDisconnected) == 1);
        h.timers->advance(20s);
        assert(h.match->phase() == Phase::ready_wait);
        auto alice2 = h.sessions.add_detached("c_alice2");
        h.sessions.authenticate(alice2, "alice", "Alice", std::nullopt);
        assert(h.match->player_reconnected("alice", alice2));
        auto back = h.drain(alice2);
        const auto *rj = first_of(back, ServerMessage::kRejoin);
        assert(rj && rj->rejoin().phase() == "ready-wait");
        assert(h.match->player_ready("alice") && h.match->player_ready("bob"));
        assert(h.match->phase() == Phase::countdown);
    }
    // A player who readied and dropped races the grace period once the countdown starts.
    {
        pong::test::MatchHarness h;
        h.match->start_ready_phase();
        assert(h.match->player_ready("alice"));
        assert(h.match->player_disconnected("alice", h.alice));
        assert(h.match->player_ready("bob"));
        assert(h.match->phase() == Phase::countdown);
        h.timers->advance(3s);
        assert(h.match->phase() == Phase::active);
        h.timers->advance(12s);
        assert(h.match->phase() == Phase::finished);
        assert(h.match->winner_id() == std::optional<std::string>("bob"));
    }
}

static void test_finish_is_idempotent()
{
    pong::test::MatchHarness h;
    h.start_active();
    assert(h.match->player_disconnected("bob", h.bob));
    h.timers->advance(1s);
    assert(h.match->player_disconnected("alice", h.alice));
    h.timers->advance(14s);
    assert(h.match->phase() == Phase::finished);
    assert(h.match->winner_id() == std::optional<std::string>("alice"));
    // alice's own grace would have expired here
    h.timers->advance(5s);
    assert(h.match->winner_id() == std::optional<std::string>("alice"));
    assert(h.settlement->calls().size() == 1);
    auto statuses = h.store->statuses();
    assert(std::count(statuses.begin(), statuses.end(), std::string("completed")) == 1);
    assert(!h.match->player_disconnected("alice", h.alice));
    assert(!h.match->handle_input("alice", "up"));
    h.timers->advance(30s);
    assert(h.retired.size() == 1);
}

static void test_input_validation_and_rate_limit()
{
    pong::test::MatchHarness h;
    h.start_active();
    assert(!h.match->handle_input("alice", "left"));
    assert(!h.match->handle_input("alice", ""));
    assert(!h.match->handle_input("mallory", "up"));
    int accepted = 0;
    for (int i = 0; i < 19; ++i)
        if (h.match->handle_input("alice", i % 2 ? "up" : "down"))
            ++accepted;
    assert(h.match->handle_input("alice", "stop"));
    ++accepted;
    for (int i = 0; i < 5; ++i)
        if (h.match->handle_input("alice", "down"))
            ++accepted;
    assert(accepted == 20);
    // the dropped "down" never reaches the paddle: the last accepted intent was "stop"
    double y_before = h.match->state().paddle1.y;
    h.advance_ticks(5);
    assert(h.match->state().paddle1.y == y_before);
    assert(!h.match->handle_input("alice", "down"));
    h.advance_ticks(5);
    assert(h.match->state().paddle1.y == y_before);
    // bob has his own window
    assert(h.match->handle_input("bob", "down"));
    h.timers->advance(1s);
    assert(h.match->handle_input("alice", "up"));
    h.advance_ticks(1);
    assert(h.match->state().paddle1.y == y_before - pong::sim::kPaddleSpeed);

    // held direction applies once per tick at kPaddleSpeed
    pong::test::MatchHarness g;
    g.start_active();
    double y0 = g.match->state().paddle2.y;
    assert(g.match->handle_input("bob", "down"));
    g.advance_ticks(3);
    assert(g.match->state().paddle2.y == y0 + 3 * pong::sim::kPaddleSpeed);
    assert(g.match->handle_input("bob", "stop"));
    g.advance_ticks(3);
    assert(g.match->state().paddle2.y == y0 + 3 * pong::sim::kPaddleSpeed);
}

static void finish_by_forfeit(pong::test::MatchHarness &h)
{
    h.start_active();
    h.match->player_disconnected("bob", h.bob);
    h.timers->advance(15s);
    h.timers->advance(1ms);
}

static void test_settlement_failure()
{
    {
        pong::test::MatchHarness h{{}, pong::test::scripted_launch({1}), pong::test::RecordingSettlement::Mode::fail};
        finish_by_forfeit(h);
        assert(h.match->phase() == Phase::finished);
        auto a = h.drain(h.alice);
        const auto *sf = first_of(a, ServerMessage::kSettlementFailed);
        assert(sf && sf->settlement_failed().reason() == "insufficient escrow");
        assert(count_of(a, ServerMessage::kSettlementComplete) == 0);
        assert(h.store->statuses().back() == "settlement-failed");
        // outcome stands
        assert(h.match->winner_id() == std::optional<std::string>("alice"));
    }
    {
        pong::test::MatchHarness h{{}, pong::test::scripted_launch({1}), pong::test::RecordingSettlement::Mode::throws};
        finish_by_forfeit(h);
        auto a = h.drain(h.alice);
        const auto *sf = first_of(a, ServerMessage::kSettlementFailed);
        assert(sf && sf->settlement_failed().reason() == "rpc unavailable");
        assert(h.settlement->calls().size() == 1);
    }
}

static void test_chat()
{
    pong::game::MatchConfig cfg;
    cfg.chat_max_length = 10;
    cfg.chat_history_limit = 3;
    pong::test::MatchHarness h{cfg};
    h.match->start_ready_phase();
    h.drain(h.alice);
    h.drain(h.bob);
    assert(h.match->handle_chat("alice", "this message is far too long"));
    auto b = h.drain(h.bob);
    const auto *cm = first_of(b, ServerMessage::kChatMessage);
    assert(cm && cm->chat_message().text() == "this messa");
    assert(cm->chat_message().display_name() == "Alice");
    assert(count_of(h.drain(h.alice), ServerMessage::kChatMessage) == 1);
    assert(!h.match->handle_chat("mallory", "hi"));
    assert(!h.match->handle_chat("bob", ""));
    for (int i = 0; i < 4; ++i)
        assert(h.match->handle_chat("bob", "msg" + std::to_string(i)));
    auto hist = h.match->chat_history();
    assert(hist.size() == 3);
    assert(hist.front().text == "msg1" && hist.back().text == "msg3");
    assert(hist.back().player_id == "bob");
}

int main()
{
    test_ready_timeout_cancels();
    test_forfeit_after_grace();
    test_reconnect_within_grace();
    test_reconnect_then_score_finish();
    test_disconnect_during_ready_phase();
    test_finish_is_idempotent();
    test_input_validation_and_rate_limit();
    test_settlement_failure();
    test_chat();
    std::cout << "unit_match_lifecycle OK" << std::endl;
    return 0;
}
