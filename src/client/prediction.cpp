// SPDX-License-Identifier: Apache-2.0
#include "client/prediction.hpp"

#include <algorithm>
#include <cmath>

namespace pong::client {

namespace {

double lerp(double a, double b, double t)
{
    return a + (b - a) * t;
}

double clamp_paddle(double y)
{
    return std::clamp(y, 0.0, pong::sim::kCanvasH - pong::sim::kPaddleH);
}

} // namespace

PixelFrame RenderFrame::pixels() const
{
    return PixelFrame{
        .ball_x = static_cast<int>(std::lround(ball_x)),
        .ball_y = static_cast<int>(std::lround(ball_y)),
        .paddle1_y = static_cast<int>(std::lround(paddle1_y)),
        .paddle2_y = static_cast<int>(std::lround(paddle2_y)),
    };
}

Predictor::Predictor(pong::sim::Slot own, std::chrono::nanoseconds tick_interval) : m_own(own), m_interval(tick_interval)
{
    if (m_interval.count() <= 0)
        m_interval = std::chrono::nanoseconds(1'000'000'000 / 60);
}

void Predictor::reset(pong::sim::Slot own)
{
    m_own = own;
    m_held = pong::sim::Direction::stop;
    m_accum = std::chrono::nanoseconds(0);
    m_base_y = pong::sim::kPaddleCenterY;
    m_offset = 0.0;
    m_scratch = pong::sim::State{};
    m_prev.reset();
    m_latest.reset();
    m_latest_arrival = {};
}

void Predictor::set_tick_interval(std::chrono::nanoseconds interval)
{
    if (interval.count() > 0)
        m_interval = interval;
}

double Predictor::own_y(const pong::sim::Snapshot &s) const
{
    return m_own == pong::sim::Slot::p1 ? s.paddle1.y : s.paddle2.y;
}

double Predictor::opponent_y(const pong::sim::Snapshot &s) const
{
    return m_own == pong::sim::Slot::p1 ? s.paddle2.y : s.paddle1.y;
}

void Predictor::advance(clock::duration elapsed)
{
    if (elapsed.count() <= 0)
        return;
    m_accum += std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
    while (m_accum >= m_interval) {
        m_accum -= m_interval;
        if (m_held == pong::sim::Direction::stop)
            continue;
        auto &paddle = pong::sim::paddle_for(m_scratch, m_own);
        paddle.y = clamp_paddle(m_base_y + m_offset);
        pong::sim::apply_input(m_scratch, m_own, m_held);
        m_offset = paddle.y - m_base_y;
    }
}

void Predictor::on_snapshot(const pong::sim::Snapshot &snap, clock::time_point arrival)
{
    double server_y = own_y(snap);
    if (!m_latest) {
        m_offset = 0.0; // first authoritative position after start or rejoin
    } else {
        // Movement the server has now confirmed is no longer part of the prediction.
        m_offset -= server_y - m_base_y;
        m_offset *= kOffsetRetain;
    }
    m_base_y = server_y;
    m_prev = m_latest;
    m_latest = snap;
    m_latest_arrival = arrival;
}

RenderFrame Predictor::render(clock::time_point now) const
{
    RenderFrame f;
    double own = clamp_paddle(m_base_y + m_offset);
    double opp = pong::sim::kPaddleCenterY;
    if (m_latest) {
        const auto &cur = *m_latest;
        f.score = cur.score;
        f.paused = cur.paused;
        f.ball_x = cur.ball.x;
        f.ball_y = cur.ball.y;
        opp = opponent_y(cur);
        if (m_prev) {
            const auto &prev = *m_prev;
            double a = std::chrono::duration<double>(now - m_latest_arrival).count() /
                       std::chrono::duration<double>(m_interval).count();
            a = std::clamp(a, 0.0, 1.0);
            f.alpha = static_cast<float>(a);
            opp = lerp(opponent_y(prev), opponent_y(cur), a);
            // Entering a pause recentres the ball; sweeping it across the court would be wrong.
            if (!(cur.paused && !prev.paused)) {
                f.ball_x = lerp(prev.ball.x, cur.ball.x, a);
                f.ball_y = lerp(prev.ball.y, cur.ball.y, a);
            }
        }
    }
    if (m_own == pong::sim::Slot::p1) {
        f.paddle1_y = own;
        f.paddle2_y = opp;
    } else {
        f.paddle1_y = opp;
        f.paddle2_y = own;
    }
    return f;
}

} // namespace pong::client
