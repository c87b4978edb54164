// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Reference poses sampled from the desired path, and the heading-aware
// distance used by the tracking and terminal costs.

#pragma once

#include <span>

#include "recede/core/gain.hpp"
#include "recede/core/types.hpp"

namespace recede {

template <typename T>
struct ReferencePointT {
    T x{0};
    T y{0};
    T heading{0};     // model convention

    static constexpr int kDof = 3;
};

using ReferencePoint = ReferencePointT<Scalar>;

/// Wrap-tolerant squared heading error: min((a-b)², (a-(b+2π))²).
/// Only the +2π branch is tested, so the result is symmetric in (a, b)
/// for |a - b| <= π and one-sided beyond that.
template <typename T>
T headingError(const T& a, const T& b) {
    T direct  = (a - b) * (a - b);
    T wrapped = (a - (b + constants::kTwoPi)) * (a - (b + constants::kTwoPi));
    return minOf<T>(direct, wrapped);
}

/// gain.position · |p_to - p_from|² + gain.theta · headingError(from, to)
template <typename T>
T weightedDistance(const ReferencePoint& from, const ReferencePointT<T>& to,
                   const Gain& gain) {
    T thetaErr = headingError<T>(constantLike(from.heading, to.heading), to.heading);
    T dx = to.x - from.x;
    T dy = to.y - from.y;
    T posErr = dx * dx + dy * dy;
    return gain.position * posErr + gain.theta * thetaErr;
}

/// Smallest weightedDistance from any reference point to `pose`.
/// `refs` must not be empty.
template <typename T>
T minWeightedDistance(std::span<const ReferencePoint> refs,
                      const ReferencePointT<T>& pose, const Gain& gain) {
    T best = weightedDistance<T>(refs.front(), pose, gain);
    for (std::size_t i = 1; i < refs.size(); ++i) {
        T d = weightedDistance<T>(refs[i], pose, gain);
        best = minOf<T>(best, d);
    }
    return best;
}

}  // namespace recede
