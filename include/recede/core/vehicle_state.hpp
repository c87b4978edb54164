// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Kinematic bicycle model. State: (x, y, heading, speed) | Control: (accel, yaw_rate)
// Templated on the scalar so the same step drives both the autodiff cost
// rollout and the numeric decoding of a solution.

#pragma once

#include <cmath>

#include "recede/core/reference_point.hpp"
#include "recede/core/types.hpp"

namespace recede {

namespace vehicle {
    inline constexpr Scalar kLength   = 4.0;    // m
    inline constexpr Scalar kMaxSpeed = 14.0;   // m/s, roughly 50 km/h
    inline constexpr Scalar kMaxAccel = 5.0;    // m/s²
}  // namespace vehicle

// ─── Control: normalised acceleration + yaw rate ─────────────────────────────
template <typename T>
struct ControlT {
    T accel{0};       // [-1, 1], scaled by kMaxAccel
    T yawRate{0};     // [-0.3π, 0.3π]
};

using Control = ControlT<Scalar>;

// ─── VehicleState ────────────────────────────────────────────────────────────
template <typename T>
struct VehicleStateT {
    T x{0};
    T y{0};
    T heading{0};     // model convention, not normalised
    T speed{0};

    static constexpr int kDof = 4;

    /// Forward-integrate one step of length ts. Speed is clamped to
    /// [0, kMaxSpeed]; heading is left unwrapped.
    template <typename U>
    void step(const ControlT<U>& u, Scalar ts) {
        using std::cos;
        using std::sin;
        T nx = x + ts * speed * cos(heading);
        T ny = y + ts * speed * sin(heading);
        T nh = heading + ts * speed / vehicle::kLength * u.yawRate;
        T ns = speed + ts * vehicle::kMaxAccel * u.accel;
        x = nx;
        y = ny;
        heading = nh;
        speed = clampLike<T>(ns, 0, vehicle::kMaxSpeed);
    }

    [[nodiscard]] ReferencePointT<T> asReference() const {
        return {x, y, heading};
    }
};

using VehicleState = VehicleStateT<Scalar>;

}  // namespace recede
