// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Decoded trajectory: the poses and speeds the ego reaches when the solved
// control sequence is replayed through the vehicle model.

#pragma once

#include <cassert>
#include <span>
#include <vector>

#include "recede/core/types.hpp"

namespace recede {

// ─── TrajectoryPoint: pose + speed + time ────────────────────────────────────
struct TrajectoryPoint {
    Scalar x{0};
    Scalar y{0};
    Scalar heading{0};  // host convention (model heading - π/2)
    Scalar speed{0};
    Scalar t{0};        // seconds after the planning tick

    [[nodiscard]] Vec2 position() const noexcept { return {x, y}; }

    friend bool operator==(const TrajectoryPoint&, const TrajectoryPoint&) = default;
};

// ─── Trajectory2D: ordered sequence of TrajectoryPoint ───────────────────────
class Trajectory2D {
public:
    Trajectory2D() = default;

    explicit Trajectory2D(std::vector<TrajectoryPoint> points)
        : points_(std::move(points)) {}

    [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }
    [[nodiscard]] bool empty() const noexcept { return points_.empty(); }

    [[nodiscard]] const TrajectoryPoint& operator[](std::size_t i) const noexcept {
        assert(i < points_.size());
        return points_[i];
    }

    [[nodiscard]] const TrajectoryPoint& front() const noexcept { return points_.front(); }
    [[nodiscard]] const TrajectoryPoint& back() const noexcept { return points_.back(); }

    [[nodiscard]] std::span<const TrajectoryPoint> points() const noexcept {
        return points_;
    }

    void append(TrajectoryPoint p) { points_.push_back(p); }
    void reserve(std::size_t n) { points_.reserve(n); }

    /// Total path length (Euclidean positions only)
    [[nodiscard]] Scalar pathLength() const noexcept;

    /// Total duration (last time - first time)
    [[nodiscard]] Scalar duration() const noexcept;

    auto begin() const noexcept { return points_.begin(); }
    auto end() const noexcept { return points_.end(); }

private:
    std::vector<TrajectoryPoint> points_;
};

}  // namespace recede
