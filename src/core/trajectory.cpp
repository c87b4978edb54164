// SPDX-License-Identifier: BSD-3-Clause
#include "recede/core/trajectory.hpp"

#include <cmath>

namespace recede {

Scalar Trajectory2D::pathLength() const noexcept {
    if (points_.size() < 2) return 0;
    Scalar total = 0;
    for (std::size_t i = 1; i < points_.size(); ++i) {
        Scalar dx = points_[i].x - points_[i - 1].x;
        Scalar dy = points_[i].y - points_[i - 1].y;
        total += std::sqrt(dx * dx + dy * dy);
    }
    return total;
}

Scalar Trajectory2D::duration() const noexcept {
    if (points_.size() < 2) return 0;
    return points_.back().t - points_.front().t;
}

}  // namespace recede
