// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Observation → parameter vector, and solved controls → trajectory.
// Headings cross the boundary with a +π/2 offset (host → model) and come
// back with -π/2 (model → host).

#pragma once

#include <span>
#include <vector>

#include "recede/core/gain.hpp"
#include "recede/core/parameter_layout.hpp"
#include "recede/core/trajectory.hpp"
#include "recede/formulation/problem_formulation.hpp"
#include "recede/planning/observation.hpp"

namespace recede::planning {

/// Placeholder social vehicles sit this far from the ego along both axes.
inline constexpr Scalar kPlaceholderOffset = 100000;

/// Host heading → model heading.
[[nodiscard]] constexpr Scalar toModelHeading(Scalar hostHeading) noexcept {
    return hostHeading + constants::kHalfPi;
}

/// Model heading → host heading.
[[nodiscard]] constexpr Scalar toHostHeading(Scalar modelHeading) noexcept {
    return modelHeading - constants::kHalfPi;
}

[[nodiscard]] VehicleState toModelState(const VehicleObservation& v);

/// Non-empty path whose first waypoint is nearest the ego; ties keep the
/// earlier path. Throws std::invalid_argument when every path is empty.
[[nodiscard]] const WaypointPath& selectReferencePath(const Observation& obs);

/// First `count` waypoints of `path` in model convention, padded by
/// repeating the last one. `path` must not be empty.
[[nodiscard]] std::vector<ReferencePoint> windowReferencePath(const WaypointPath& path,
                                                              int count);

/// Exactly `count` social vehicles: far-away placeholders when there are
/// no neighbors, otherwise the nearest ones by distance, padded by
/// repeating the farthest selected.
[[nodiscard]] std::vector<VehicleState> selectSocialVehicles(
    const VehicleObservation& ego, std::span<const VehicleObservation> neighbors, int count);

/// Decoded form of the parameter vector for one tick.
[[nodiscard]] ParameterSet buildParameterSet(const Observation& obs, const Gain& gain,
                                             const FormulationConfig& config,
                                             int impatience);

/// Flat parameter vector for one tick.
[[nodiscard]] VecX encodeObservation(const Observation& obs, const Gain& gain,
                                     const ProblemFormulation& formulation, int impatience);

/// Replay `controls` from `ego` (model convention) with the formulation's
/// dynamics. Point k is stamped (k+1)·ts and carries a host heading.
[[nodiscard]] Trajectory2D decodeTrajectory(const ProblemFormulation& formulation,
                                            const VecX& controls, const VehicleState& ego);

}  // namespace recede::planning
