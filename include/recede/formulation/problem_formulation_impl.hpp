// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// ProblemFormulation template implementation, included from
// problem_formulation.hpp. This file should NOT be included directly.

#pragma once

#include "recede/formulation/problem_formulation.hpp"

#include <cassert>
#include <span>

#include "recede/core/reference_point.hpp"

namespace recede {

template <typename T>
CostBreakdownT<T> ProblemFormulation::costTerms(const VecXT<T>& u,
                                                const ParameterSet& params) const {
    assert(u.size() == numDecisionVariables());
    assert(static_cast<int>(params.socialVehicles.size()) == config_.socialVehicles);
    assert(static_cast<int>(params.reference.size()) == config_.referencePoints);

    const Gain& gain = params.gain;
    const Scalar ts = config_.ts;
    const T zero = constantLike(Scalar(0), u[0]);

    CostBreakdownT<T> c;
    c.tracking = zero;
    c.speedShaping = zero;
    c.obstacle = zero;
    c.terminal = zero;
    c.impatience = zero;

    // Every autodiff value carries derivatives of length 2·N from here on.
    VehicleStateT<T> ego{constantLike(params.ego.x, u[0]),
                         constantLike(params.ego.y, u[0]),
                         constantLike(params.ego.heading, u[0]),
                         constantLike(params.ego.speed, u[0])};

    std::vector<VehicleState> others = params.socialVehicles;
    const std::span<const ReferencePoint> refs(params.reference);
    const ControlSequenceT<T> controls(u);
    constexpr Scalar kMinDistSq = vehicle::kLength * vehicle::kLength;

    for (int t = 0; t < config_.horizon; ++t) {
        ego.step(controls[t], ts);

        c.tracking += minWeightedDistance<T>(refs, ego.asReference(), gain);

        if (t > 0) {
            c.speedShaping += gain.speed * params.targetSpeed / static_cast<Scalar>(t);
        }

        for (auto& sv : others) {
            sv.step(Control{}, ts);
            T dx = ego.x - sv.x;
            T dy = ego.y - sv.y;
            T penetration = kMinDistSq - (dx * dx + dy * dy);
            c.obstacle += gain.obstacle
                        * maxOf<T>(constantLike(Scalar(-1), penetration), penetration);
        }
    }

    c.terminal = gain.terminal * weightedDistance<T>(refs.back(), ego.asReference(), gain);
    c.smoothness = controls.smoothnessCost(gain);

    const Scalar imp = params.impatience;
    c.impatience = gain.impatience * ((controls[0].accel - Scalar(1)) * (imp * imp)) * Scalar(-1);

    return c;
}

}  // namespace recede
