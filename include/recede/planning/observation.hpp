// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// What the host hands the planner each tick. Headings are in the host
// convention (the vehicle model's heading minus π/2).

#pragma once

#include <vector>

#include "recede/core/types.hpp"

namespace recede::planning {

struct VehicleObservation {
    Vec2 position{Vec2::Zero()};
    Scalar heading{0};
    Scalar speed{0};
};

struct PathWaypoint {
    Vec2 position{Vec2::Zero()};
    Scalar heading{0};
    Scalar speedLimit{0};
};

using WaypointPath = std::vector<PathWaypoint>;

struct Observation {
    VehicleObservation ego;
    std::vector<VehicleObservation> neighbors;
    std::vector<WaypointPath> waypointPaths;   // Candidate reference paths
};

}  // namespace recede::planning
