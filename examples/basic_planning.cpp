// SPDX-License-Identifier: BSD-3-Clause
// Recede Basic Planning Example
// Demonstrates: configuring a planner, running a few receding-horizon ticks
// past a slower vehicle, exporting the trajectories.
//
// Usage: basic_planning [planner.json]

#include <fstream>
#include <iostream>

#include <spdlog/spdlog.h>

#include "recede/recede.hpp"

int main(int argc, char** argv) {
    using namespace recede;
    using namespace recede::planning;

    // ── Configure ────────────────────────────────────────────────────────────
    PlannerOptions options;
    if (argc > 1) {
        try {
            options = io::loadPlannerOptionsJSON(argv[1]);
        } catch (const std::runtime_error& e) {
            spdlog::error("{}", e.what());
            return 1;
        }
    } else {
        options.session.backend = session::SolverBackend::kInProcess;
    }

    // ── Scene: straight road along +y, one slower vehicle ahead ──────────────
    WaypointPath road;
    for (int i = 0; i < 200; ++i) {
        road.push_back({Vec2(0, static_cast<Scalar>(i)), 0, 10});
    }
    VehicleObservation ego{Vec2(0, 0), 0, 6};
    VehicleObservation lead{Vec2(0, 15), 0, 3};

    try {
        Planner planner(options);
        std::ofstream out("recede_trajectories.json");

        for (int tick = 0; tick < 20; ++tick) {
            Observation obs;
            obs.ego = ego;
            obs.neighbors.push_back(lead);
            obs.waypointPaths.push_back(road);

            auto traj = planner.plan(obs);
            if (!traj) {
                spdlog::warn("tick {}: no trajectory, holding course", tick);
            } else {
                // Execute the first planned step
                const auto& next = traj->front();
                ego.position = next.position();
                ego.heading = next.heading;
                ego.speed = next.speed;
                io::toJSON(out, *traj, "tick_" + std::to_string(tick));
                out << '\n';
            }
            lead.position.y() += static_cast<Scalar>(0.1) * lead.speed;

            std::cout << "tick " << tick << " | ego=(" << ego.position.x() << ", "
                      << ego.position.y() << ") v=" << ego.speed
                      << " | gap=" << (lead.position - ego.position).norm()
                      << " | impatience=" << planner.stepsWithoutMoving() << std::endl;
        }
    } catch (const session::SessionStartError& e) {
        spdlog::error("{} ({} attempts)", e.what(), e.attempts());
        return 1;
    }

    std::cout << "Exported trajectories to recede_trajectories.json" << std::endl;
    return 0;
}
