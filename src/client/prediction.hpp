// SPDX-License-Identifier: Apache-2.0
// prediction.hpp - Client-side rendering state: own paddle predicted from held input and
// reconciled against snapshots; opponent paddle and ball interpolated between the last two snapshots.
#pragma once
#include "common/pong_sim.hpp"

#include <chrono>
#include <optional>

namespace pong::client {

struct PixelFrame
{
    int ball_x{0};
    int ball_y{0};
    int paddle1_y{0};
    int paddle2_y{0};
};

struct RenderFrame
{
    double ball_x{pong::sim::kBallCenterX};
    double ball_y{pong::sim::kBallCenterY};
    double paddle1_y{pong::sim::kPaddleCenterY};
    double paddle2_y{pong::sim::kPaddleCenterY};
    pong::sim::Score score;
    bool paused{false};
    float alpha{0.f};

    // Positions are kept fractional until drawn.
    PixelFrame pixels() const;
};

class Predictor
{
public:
    using clock = std::chrono::steady_clock;

    // Fraction of the own-paddle offset kept after each snapshot.
    static constexpr double kOffsetRetain = 0.95;

    explicit Predictor(
        pong::sim::Slot own = pong::sim::Slot::p1,
        std::chrono::nanoseconds tick_interval = std::chrono::nanoseconds(1'000'000'000 / 60));

    // Back to centered positions with no snapshot history (match start / rejoin).
    void reset(pong::sim::Slot own);
    void set_tick_interval(std::chrono::nanoseconds interval);
    void set_held_input(pong::sim::Direction dir) { m_held = dir; }

    // Local frame step: moves the own paddle one kPaddleSpeed per elapsed tick interval.
    void advance(clock::duration elapsed);
    void on_snapshot(const pong::sim::Snapshot &snap, clock::time_point arrival);
    RenderFrame render(clock::time_point now) const;

    pong::sim::Slot own_slot() const { return m_own; }
    double own_offset() const { return m_offset; }
    bool has_snapshot() const { return m_latest.has_value(); }
    const std::optional<pong::sim::Snapshot> &latest() const { return m_latest; }

private:
    double own_y(const pong::sim::Snapshot &s) const;
    double opponent_y(const pong::sim::Snapshot &s) const;

    pong::sim::Slot m_own;
    std::chrono::nanoseconds m_interval;
    pong::sim::Direction m_held{pong::sim::Direction::stop};
    std::chrono::nanoseconds m_accum{0};
    double m_base_y{pong::sim::kPaddleCenterY}; // own paddle in the latest snapshot
    double m_offset{0.0};
    pong::sim::State m_scratch; // own paddle stepped with the kernel's apply_input
    std::optional<pong::sim::Snapshot> m_prev;
    std::optional<pong::sim::Snapshot> m_latest;
    clock::time_point m_latest_arrival{};
};

} // namespace pong::client
