// SPDX-License-Identifier: Apache-2.0
#include "common/pong_sim.hpp"

#include <algorithm>
#include <cmath>

namespace pong::sim {

namespace {

// Paddle response: faster, reflected toward `dir_x`, spin from the hit offset.
void bounce_off(Ball &b, const Paddle &p, double dir_x)
{
    double spd = std::min(std::abs(b.vx) + kBallSpeedIncrement, kBallMaxSpeed);
    b.vx = spd * dir_x;
    double hit_pos = (b.y + kBallSize / 2 - p.y) / kPaddleH;
    b.vy = (hit_pos - 0.5) * spd * 1.5;
}

bool spans(double ball_y, const Paddle &p)
{
    return ball_y + kBallSize >= p.y && ball_y <= p.y + kPaddleH;
}

bool overlaps_y(double ball_y, const Paddle &p)
{
    return ball_y + kBallSize > p.y && ball_y < p.y + kPaddleH;
}

} // namespace

State create_state()
{
    return State{};
}

void apply_input(State &s, Slot slot, Direction dir)
{
    Paddle &p = paddle_for(s, slot);
    if (dir == Direction::up)
        p.y = std::max(0.0, p.y - kPaddleSpeed);
    else if (dir == Direction::down)
        p.y = std::min(kCanvasH - kPaddleH, p.y + kPaddleSpeed);
}

void launch_ball(State &s, double angle, int direction)
{
    s.ball.vx = std::cos(angle) * kBallSpeedInitial * direction;
    s.ball.vy = std::sin(angle) * kBallSpeedInitial;
}

StepResult step_ball(State &s)
{
    Ball &b = s.ball;
    StepResult r{};

    double speed = std::sqrt(b.vx * b.vx + b.vy * b.vy);
    int steps = std::max(1, static_cast<int>(std::ceil(speed / (kPaddleW / 2))));
    double step_vx = b.vx / steps;
    double step_vy = b.vy / steps;

    for (int i = 0; i < steps; ++i) {
        double old_x = b.x;
        double old_y = b.y;
        b.x += step_vx;
        b.y += step_vy;

        if (b.y <= 0) {
            b.vy = std::abs(b.vy);
            b.y = -b.y;
            r.sound = Sound::wall;
        }
        if (b.y >= kCanvasH - kBallSize) {
            b.vy = -std::abs(b.vy);
            b.y = 2 * (kCanvasH - kBallSize) - b.y;
            r.sound = Sound::wall;
        }

        if (b.vx < 0) {
            // left edge crossed paddle1's right edge during this sub-step
            if (old_x >= kP1Right && b.x < kP1Right) {
                double t = (old_x - kP1Right) / (old_x - b.x);
                double hit_y = old_y + (b.y - old_y) * t;
                if (spans(hit_y, s.paddle1)) {
                    b.x = kP1Right;
                    b.y = hit_y;
                    bounce_off(b, s.paddle1, 1.0);
                    r.sound = Sound::paddle;
                    break;
                }
            }
            if (b.x < kP1Right && b.x + kBallSize > kP1X && overlaps_y(b.y, s.paddle1)) {
                b.x = kP1Right;
                bounce_off(b, s.paddle1, 1.0);
                r.sound = Sound::paddle;
                break;
            }
        }

        if (b.vx > 0) {
            double old_right = old_x + kBallSize;
            double new_right = b.x + kBallSize;
            if (old_right <= kP2Left && new_right > kP2Left) {
                double t = (kP2Left - old_right) / (new_right - old_right);
                double hit_y = old_y + (b.y - old_y) * t;
                if (spans(hit_y, s.paddle2)) {
                    b.x = kP2Left - kBallSize;
                    b.y = hit_y;
                    bounce_off(b, s.paddle2, -1.0);
                    r.sound = Sound::paddle;
                    break;
                }
            }
            if (b.x + kBallSize > kP2Left && b.x < kP2Right && overlaps_y(b.y, s.paddle2)) {
                b.x = kP2Left - kBallSize;
                bounce_off(b, s.paddle2, -1.0);
                r.sound = Sound::paddle;
                break;
            }
        }

        if (b.x + kBallSize < 0) {
            r.scored = Slot::p2;
            r.sound = Sound::score;
            return r;
        }
        if (b.x > kCanvasW) {
            r.scored = Slot::p1;
            r.sound = Sound::score;
            return r;
        }
    }
    return r;
}

void reset_ball_after_score(State &s)
{
    s.ball = Ball{};
    s.pause_ticks = kScorePauseTicks;
    s.paused = true;
}

bool tick_pause(State &s)
{
    if (s.pause_ticks <= 0)
        return false;
    --s.pause_ticks;
    if (s.pause_ticks == 0) {
        s.paused = false;
        return true;
    }
    return false;
}

Snapshot serialize_state(const State &s)
{
    return Snapshot{
        .ball = s.ball,
        .paddle1 = s.paddle1,
        .paddle2 = s.paddle2,
        .score = s.score,
        .status = s.status,
        .winner = s.winner,
        .paused = s.paused,
        .sound = s.sound,
    };
}

std::optional<Direction> parse_direction(std::string_view text)
{
    if (text == "up")
        return Direction::up;
    if (text == "down")
        return Direction::down;
    if (text == "stop")
        return Direction::stop;
    return std::nullopt;
}

const char *to_string(Direction d)
{
    switch (d) {
        case Direction::up:
            return "up";
        case Direction::down:
            return "down";
        case Direction::stop:
            return "stop";
    }
    return "stop";
}

const char *to_string(Sound s)
{
    switch (s) {
        case Sound::wall:
            return "wall";
        case Sound::paddle:
            return "paddle";
        case Sound::score:
            return "score";
        case Sound::none:
            return "";
    }
    return "";
}

const char *to_string(Status s)
{
    return s == Status::finished ? "finished" : "playing";
}

} // namespace pong::sim
