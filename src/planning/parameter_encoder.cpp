// SPDX-License-Identifier: BSD-3-Clause
#include "recede/planning/parameter_encoder.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

namespace recede::planning {

VehicleState toModelState(const VehicleObservation& v) {
    return {v.position.x(), v.position.y(), toModelHeading(v.heading), v.speed};
}

const WaypointPath& selectReferencePath(const Observation& obs) {
    const WaypointPath* best = nullptr;
    Scalar best_dist = constants::kInfinity;
    for (const auto& path : obs.waypointPaths) {
        if (path.empty()) continue;
        Scalar d = (path.front().position - obs.ego.position).norm();
        if (best == nullptr || d < best_dist) {
            best = &path;
            best_dist = d;
        }
    }
    if (best == nullptr) {
        throw std::invalid_argument("observation has no non-empty waypoint path");
    }
    return *best;
}

std::vector<ReferencePoint> windowReferencePath(const WaypointPath& path, int count) {
    assert(!path.empty());
    std::vector<ReferencePoint> window;
    window.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        const auto& wp = path[std::min(static_cast<std::size_t>(i), path.size() - 1)];
        window.push_back({wp.position.x(), wp.position.y(), toModelHeading(wp.heading)});
    }
    return window;
}

std::vector<VehicleState> selectSocialVehicles(const VehicleObservation& ego,
                                               std::span<const VehicleObservation> neighbors,
                                               int count) {
    std::vector<VehicleState> selected;
    if (count <= 0) return selected;
    selected.reserve(static_cast<std::size_t>(count));

    if (neighbors.empty()) {
        const VehicleState placeholder{ego.position.x() + kPlaceholderOffset,
                                       ego.position.y() + kPlaceholderOffset, 0, 0};
        selected.assign(static_cast<std::size_t>(count), placeholder);
        return selected;
    }

    std::vector<const VehicleObservation*> order;
    order.reserve(neighbors.size());
    for (const auto& n : neighbors) order.push_back(&n);
    std::stable_sort(order.begin(), order.end(),
                     [&ego](const VehicleObservation* a, const VehicleObservation* b) {
                         return (a->position - ego.position).squaredNorm() <
                                (b->position - ego.position).squaredNorm();
                     });

    const std::size_t take = std::min(order.size(), static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < take; ++i) selected.push_back(toModelState(*order[i]));
    while (selected.size() < static_cast<std::size_t>(count)) selected.push_back(selected.back());
    return selected;
}

ParameterSet buildParameterSet(const Observation& obs, const Gain& gain,
                               const FormulationConfig& config, int impatience) {
    const WaypointPath& path = selectReferencePath(obs);

    ParameterSet p;
    p.gain = gain;
    p.ego = toModelState(obs.ego);
    p.socialVehicles = selectSocialVehicles(obs.ego, obs.neighbors, config.socialVehicles);
    p.reference = windowReferencePath(path, config.referencePoints);
    p.impatience = static_cast<Scalar>(impatience);
    p.targetSpeed = path.front().speedLimit;
    return p;
}

VecX encodeObservation(const Observation& obs, const Gain& gain,
                       const ProblemFormulation& formulation, int impatience) {
    VecX z = formulation.layout().encode(
        buildParameterSet(obs, gain, formulation.config(), impatience));
    assert(z.size() == formulation.numParameters());
    return z;
}

Trajectory2D decodeTrajectory(const ProblemFormulation& formulation, const VecX& controls,
                              const VehicleState& ego) {
    assert(controls.size() == formulation.numDecisionVariables());
    const auto states = formulation.rollout(controls, ego);

    Trajectory2D trajectory;
    trajectory.reserve(states.size());
    const Scalar ts = formulation.config().ts;
    for (std::size_t k = 0; k < states.size(); ++k) {
        const auto& s = states[k];
        trajectory.append({s.x, s.y, toHostHeading(s.heading), s.speed,
                           static_cast<Scalar>(k + 1) * ts});
    }
    return trajectory;
}

}  // namespace recede::planning
