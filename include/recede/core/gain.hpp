// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Cost-term weights. The field order of toArray() is the order the gains
// occupy at the head of the parameter vector.

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include "recede/core/types.hpp"

namespace recede {

struct Gain {
    Scalar theta{10};        // Heading tracking error
    Scalar position{10};     // Position tracking error
    Scalar obstacle{100};    // Social-vehicle proximity
    Scalar uAccel{10};       // Acceleration smoothness
    Scalar uYawRate{4};      // Yaw-rate smoothness
    Scalar terminal{4};      // Pull toward the last reference point
    Scalar impatience{1};    // First-step acceleration bias when stalled
    Scalar speed{0};         // Speed shaping

    static constexpr std::size_t kDof = 8;

    /// Names as they appear in the gain file, in parameter-vector order.
    static constexpr std::array<std::string_view, kDof> kFieldNames{
        "theta", "position", "obstacle", "u_accel",
        "u_yaw_rate", "terminal", "impatience", "speed"};

    [[nodiscard]] std::array<Scalar, kDof> toArray() const noexcept {
        return {theta, position, obstacle, uAccel,
                uYawRate, terminal, impatience, speed};
    }

    [[nodiscard]] static Gain fromArray(const std::array<Scalar, kDof>& v) noexcept {
        Gain g;
        g.theta      = v[0];
        g.position   = v[1];
        g.obstacle   = v[2];
        g.uAccel     = v[3];
        g.uYawRate   = v[4];
        g.terminal   = v[5];
        g.impatience = v[6];
        g.speed      = v[7];
        return g;
    }

    friend bool operator==(const Gain&, const Gain&) = default;
};

}  // namespace recede
