// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/matchmaker.hpp"
#include "server/net/presence.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <iostream>

using namespace std::chrono_literals;

static std::shared_ptr<pong::mm::Session> queued(
    pong::mm::SessionManager &mgr, const std::string &cid, const std::string &player, const std::string &tier)
{
    auto s = mgr.add_detached(cid);
    mgr.authenticate(s, player, "", std::nullopt);
    bool ok = mgr.enqueue(s, tier);
    assert(ok);
    return s;
}

static void test_pair_by_tier()
{
    pong::mm::SessionManager mgr;
    auto a = queued(mgr, "c1", "a", "low");
    auto b = queued(mgr, "c2", "b", "high");
    auto c = queued(mgr, "c3", "c", "low");
    auto d = queued(mgr, "c4", "d", "low");
    auto e = queued(mgr, "c5", "e", "high");
    auto pairs = pong::mm::pair_by_tier(mgr.snapshot_queue());
    assert(pairs.size() == 2);
    assert(pairs[0].tier == "low" && pairs[0].first == a && pairs[0].second == c);
    assert(pairs[1].tier == "high" && pairs[1].first == b && pairs[1].second == e);
    // d waits for the next low-tier peer

    // the same player listed from two connections is never paired with itself
    auto peer = [](const std::string &player) {
        auto s = std::make_shared<pong::mm::Session>();
        s->player_id = player;
        s->queue_tier = "low";
        return s;
    };
    auto x1 = peer("x");
    auto x2 = peer("x");
    auto y = peer("y");
    auto p2 = pong::mm::pair_by_tier({x1, x2, y});
    assert(p2.size() == 1 && p2[0].first == x1 && p2[0].second == y);
    (void)d;
}

static void test_one_live_match_per_player()
{
    auto timers = std::make_shared<pong::test::ManualTimerService>();
    pong::mm::SessionManager mgr;
    pong::mm::SessionRegistry registry;
    pong::net::Presence presence{mgr, registry};
    pong::mm::MatchmakerConfig cfg;
    cfg.stake_tiers = {{"low", 500}};
    cfg.match.win_score = 50; // random serves must not end the match before the forfeit
    pong::game::MatchDeps base;
    base.timers = timers;
    base.sessions = &mgr;
    pong::mm::Matchmaker mm{mgr, registry, cfg, base};

    // a second connection of a queued player cannot take another queue slot
    auto a1 = queued(mgr, "c1", "ann", "low");
    auto a2 = mgr.add_detached("c2");
    mgr.authenticate(a2, "ann", "", std::nullopt);
    assert(!mgr.enqueue(a2, "low"));
    auto b = queued(mgr, "c3", "ben", "low");
    auto first = mm.poll_once();
    assert(first.size() == 1);
    auto m1 = first[0];
    assert(mgr.queue_size() == 0);

    // once ann is playing, her other connection may reach the queue but is never paired
    assert(mgr.enqueue(a2, "low"));
    auto c = queued(mgr, "c4", "cat", "low");
    assert(mm.poll_once().empty());
    assert(!a2->in_queue && c->in_queue);
    assert(mgr.queue_size() == 1 && mgr.snapshot_queue()[0] == c);
    assert(registry.size() == 1 && registry.find_by_player("ann") == m1);

    // losing the original connection reaches the match she is actually in
    m1->player_ready("ann");
    m1->player_ready("ben");
    timers->advance(3s);
    assert(m1->phase() == pong::game::Phase::active);
    presence.peer_lost(a1, "eof");
    assert(m1->players()[0].disconnected);
    timers->advance(15s);
    assert(m1->phase() == pong::game::Phase::finished);
    assert(m1->winner_id() == std::optional<std::string>("ben"));

    // after the match ends cat can be paired with a fresh connection of ann
    auto a3 = mgr.add_detached("c5");
    mgr.authenticate(a3, "ann", "", std::nullopt);
    assert(mgr.enqueue(a3, "low"));
    auto next = mm.poll_once();
    assert(next.size() == 1 && next[0]->has_player("ann") && next[0]->has_player("cat"));
    (void)b;
}

static void test_poll_once()
{
    auto timers = std::make_shared<pong::test::ManualTimerService>();
    pong::mm::SessionManager mgr;
    pong::mm::SessionRegistry registry;
    pong::mm::MatchmakerConfig cfg;
    cfg.stake_tiers = {{"low", 500}, {"high", 5000}};
    cfg.fixed_seed = 7;
    pong::game::MatchDeps base;
    base.timers = timers;
    base.sessions = &mgr;
    pong::mm::Matchmaker mm{mgr, registry, cfg, base};
    assert(mm.has_tier("low") && !mm.has_tier("mythic"));

    auto a = queued(mgr, "c1", "alice", "low");
    auto b = queued(mgr, "c2", "bob", "high");
    auto c = queued(mgr, "c3", "carol", "low");
    auto z1 = queued(mgr, "c4", "zed", "mythic");
    auto z2 = queued(mgr, "c5", "zoe", "mythic");

    auto created = mm.poll_once();
    assert(created.size() == 1);
    auto m = created[0];
    assert(m->id() == "m_1" && m->tier() == "low" && m->total_stake() == 1000);
    assert(registry.find("m_1") == m);
    assert(registry.find_by_player("carol") == m);
    assert(m->phase() == pong::game::Phase::ready_wait);
    // unknown tier pairings are discarded, the lone high-tier peer keeps waiting
    assert(mgr.queue_size() == 1 && mgr.snapshot_queue()[0] == b);
    assert(!z1->in_queue && !z2->in_queue && !a->in_queue);

    auto rp = mgr.drain_messages(a);
    auto *ready = pong::test::first_of(rp, pong::ServerMessage::kReadyPhase);
    assert(ready && ready->ready_phase().match_id() == "m_1");
    assert(ready->ready_phase().your_slot() == 1 && ready->ready_phase().stake_per_player() == 500);
    auto rc = mgr.drain_messages(c);
    assert(pong::test::first_of(rc, pong::ServerMessage::kReadyPhase)->ready_phase().your_slot() == 2);

    auto d = queued(mgr, "c6", "dave", "high");
    auto second = mm.poll_once();
    assert(second.size() == 1 && second[0]->id() == "m_2" && second[0]->total_stake() == 10000);
    assert(mm.poll_once().empty());

    // nobody readies: the match is cancelled and leaves the registry
    timers->advance(30s);
    assert(m->phase() == pong::game::Phase::cancelled);
    assert(registry.find("m_1") == nullptr && registry.find("m_2") == nullptr);
    assert(registry.size() == 0);
    (void)d;
}

int main()
{
    test_pair_by_tier();
    test_poll_once();
    test_one_live_match_per_player();
    std::cout << "unit_matchmaker OK" << std::endl;
    return 0;
}
