// SPDX-License-Identifier: Apache-2.0
// pong_sim.hpp - Deterministic ball/paddle kernel shared by server and client.
// Pure functions over a plain State value: no clock, no randomness, no I/O.
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pong::sim {

inline constexpr double kCanvasW = 800.0;
inline constexpr double kCanvasH = 600.0;
inline constexpr double kPaddleW = 26.0;
inline constexpr double kPaddleH = 110.0;
inline constexpr double kPaddleSpeed = 6.0; // per tick
inline constexpr double kBallSize = 16.0;
inline constexpr double kBallSpeedInitial = 4.0;
inline constexpr double kBallSpeedIncrement = 0.25;
inline constexpr double kBallMaxSpeed = 14.0;
inline constexpr int kWinScore = 5;
inline constexpr int kScorePauseTicks = 120; // 2s at 60 Hz

// Paddle edges along x.
inline constexpr double kP1X = 10.0;
inline constexpr double kP1Right = kP1X + kPaddleW;
inline constexpr double kP2Left = kCanvasW - 10.0 - kPaddleW;
inline constexpr double kP2Right = kCanvasW - 10.0;

inline constexpr double kBallCenterX = kCanvasW / 2 - kBallSize / 2;
inline constexpr double kBallCenterY = kCanvasH / 2 - kBallSize / 2;
inline constexpr double kPaddleCenterY = kCanvasH / 2 - kPaddleH / 2;

enum class Slot : uint8_t
{
    p1 = 1,
    p2 = 2
};

enum class Direction : uint8_t
{
    stop,
    up,
    down
};

enum class Sound : uint8_t
{
    none,
    wall,
    paddle,
    score
};

enum class Status : uint8_t
{
    playing,
    finished
};

struct Ball
{
    double x{kBallCenterX};
    double y{kBallCenterY};
    double vx{0.0};
    double vy{0.0};
};

struct Paddle
{
    double y{kPaddleCenterY};
};

struct Score
{
    int p1{0};
    int p2{0};
};

struct State
{
    Ball ball;
    Paddle paddle1;
    Paddle paddle2;
    Score score;
    Status status{Status::playing};
    std::optional<Slot> winner;
    bool paused{false};
    int pause_ticks{0}; // server-internal, never serialized
    Sound sound{Sound::none};
};

// Network/render projection of State (pause_ticks stripped).
struct Snapshot
{
    Ball ball;
    Paddle paddle1;
    Paddle paddle2;
    Score score;
    Status status{Status::playing};
    std::optional<Slot> winner;
    bool paused{false};
    Sound sound{Sound::none};
};

struct StepResult
{
    std::optional<Slot> scored;
    Sound sound{Sound::none};
};

struct LaunchParams
{
    double angle{0.0}; // radians
    int direction{1}; // +1 toward p2, -1 toward p1
};

State create_state();
void apply_input(State &s, Slot slot, Direction dir);
void launch_ball(State &s, double angle, int direction);
inline void launch_ball(State &s, const LaunchParams &p)
{
    launch_ball(s, p.angle, p.direction);
}
// Advances the ball one tick using speed-scaled sub-steps; returns on the first score.
StepResult step_ball(State &s);
void reset_ball_after_score(State &s);
// Returns true exactly once per pause, on the tick the countdown reaches zero.
bool tick_pause(State &s);
Snapshot serialize_state(const State &s);

inline Paddle &paddle_for(State &s, Slot slot)
{
    return slot == Slot::p1 ? s.paddle1 : s.paddle2;
}

inline const Paddle &paddle_for(const State &s, Slot slot)
{
    return slot == Slot::p1 ? s.paddle1 : s.paddle2;
}

inline Slot other(Slot slot)
{
    return slot == Slot::p1 ? Slot::p2 : Slot::p1;
}

std::optional<Direction> parse_direction(std::string_view text);
const char *to_string(Direction d);
const char *to_string(Sound s);
const char *to_string(Status s);

} // namespace pong::sim
