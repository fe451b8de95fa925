// SPDX-License-Identifier: Apache-2.0
#include "common/snapshot_codec.hpp"

namespace pong::codec {

void to_proto(const pong::sim::Snapshot &snap, const std::string &match_id, uint64_t tick, pong::StateSnapshot &out)
{
    out.set_match_id(match_id);
    out.set_tick(tick);
    auto *ball = out.mutable_ball();
    ball->set_x(snap.ball.x);
    ball->set_y(snap.ball.y);
    ball->set_vx(snap.ball.vx);
    ball->set_vy(snap.ball.vy);
    out.mutable_paddle1()->set_y(snap.paddle1.y);
    out.mutable_paddle2()->set_y(snap.paddle2.y);
    out.mutable_score()->set_p1(static_cast<uint32_t>(snap.score.p1));
    out.mutable_score()->set_p2(static_cast<uint32_t>(snap.score.p2));
    out.set_status(pong::sim::to_string(snap.status));
    out.set_winner(snap.winner ? static_cast<uint32_t>(*snap.winner) : 0u);
    out.set_paused(snap.paused);
    out.set_sound(pong::sim::to_string(snap.sound));
}

pong::sim::Snapshot from_proto(const pong::StateSnapshot &msg)
{
    pong::sim::Snapshot s;
    s.ball.x = msg.ball().x();
    s.ball.y = msg.ball().y();
    s.ball.vx = msg.ball().vx();
    s.ball.vy = msg.ball().vy();
    s.paddle1.y = msg.paddle1().y();
    s.paddle2.y = msg.paddle2().y();
    s.score.p1 = static_cast<int>(msg.score().p1());
    s.score.p2 = static_cast<int>(msg.score().p2());
    s.status = msg.status() == "finished" ? pong::sim::Status::finished : pong::sim::Status::playing;
    if (msg.winner() == 1)
        s.winner = pong::sim::Slot::p1;
    else if (msg.winner() == 2)
        s.winner = pong::sim::Slot::p2;
    s.paused = msg.paused();
    const auto &snd = msg.sound();
    if (snd == "wall")
        s.sound = pong::sim::Sound::wall;
    else if (snd == "paddle")
        s.sound = pong::sim::Sound::paddle;
    else if (snd == "score")
        s.sound = pong::sim::Sound::score;
    return s;
}

} // namespace pong::codec
