// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Horizon of (accel, yaw_rate) decision variables, stored flat and
// interleaved: [a_0, w_0, a_1, w_1, ...]. This is also the wire layout of a
// solver solution and of a warm start.

#pragma once

#include <cassert>

#include "recede/core/gain.hpp"
#include "recede/core/types.hpp"
#include "recede/core/vehicle_state.hpp"

namespace recede {

template <typename T>
class ControlSequenceT {
public:
    static constexpr int kControlDim = 2;

    ControlSequenceT() = default;

    explicit ControlSequenceT(int horizon)
        : u_(VecXT<T>::Zero(horizon * kControlDim)) {}

    explicit ControlSequenceT(VecXT<T> flat) : u_(std::move(flat)) {
        assert(u_.size() % kControlDim == 0);
    }

    [[nodiscard]] int horizon() const noexcept {
        return static_cast<int>(u_.size()) / kControlDim;
    }

    [[nodiscard]] ControlT<T> operator[](int t) const {
        assert(0 <= t && t < horizon());
        return {u_[t * kControlDim], u_[t * kControlDim + 1]};
    }

    void set(int t, const ControlT<T>& c) {
        assert(0 <= t && t < horizon());
        u_[t * kControlDim] = c.accel;
        u_[t * kControlDim + 1] = c.yawRate;
    }

    [[nodiscard]] const VecXT<T>& flat() const noexcept { return u_; }

    /// Σ_{t≥1} gain.uAccel·(Δaccel)² + gain.uYawRate·(Δyaw_rate)²
    [[nodiscard]] T smoothnessCost(const Gain& gain) const {
        if (u_.size() == 0) return T(0);
        T cost = constantLike(Scalar(0), u_[0]);
        for (int t = 1; t < horizon(); ++t) {
            T da = u_[t * kControlDim] - u_[(t - 1) * kControlDim];
            T dw = u_[t * kControlDim + 1] - u_[(t - 1) * kControlDim + 1];
            cost += gain.uAccel * da * da;
            cost += gain.uYawRate * dw * dw;
        }
        return cost;
    }

private:
    VecXT<T> u_;
};

using ControlSequence = ControlSequenceT<Scalar>;

}  // namespace recede
