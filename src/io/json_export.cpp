// SPDX-License-Identifier: BSD-3-Clause
#include "recede/io/json_export.hpp"

#include "recede/io/json.hpp"

namespace recede::io {

void toJSON(std::ostream& os, const Trajectory2D& trajectory, const std::string& label) {
    JsonArray points;
    points.reserve(trajectory.size());
    for (const auto& p : trajectory) {
        points.push_back(JsonValue{JsonObject{
            {"x", JsonValue{static_cast<double>(p.x)}},
            {"y", JsonValue{static_cast<double>(p.y)}},
            {"heading", JsonValue{static_cast<double>(p.heading)}},
            {"speed", JsonValue{static_cast<double>(p.speed)}},
            {"t", JsonValue{static_cast<double>(p.t)}},
        }});
    }
    writeJson(os, JsonValue{JsonObject{{label, JsonValue{std::move(points)}}}});
}

void toJSON(std::ostream& os, const SolveResponse& response) {
    JsonObject root;
    if (response.isOk()) {
        const auto& s = response.solution();
        root.emplace_back("status", JsonValue{std::string(toString(s.exitStatus))});
        root.emplace_back("cost", JsonValue{static_cast<double>(s.cost)});
        root.emplace_back("outer_iterations", JsonValue{static_cast<double>(s.outerIterations)});
        root.emplace_back("inner_iterations", JsonValue{static_cast<double>(s.innerIterations)});
        root.emplace_back("solve_time_ms", JsonValue{s.solveTimeMs});
        root.emplace_back("controls", toJsonArray(s.controls));
    } else {
        const auto& e = response.error();
        root.emplace_back("status", JsonValue{std::string("Error")});
        root.emplace_back("code", JsonValue{static_cast<double>(static_cast<int>(e.code))});
        root.emplace_back("name", JsonValue{std::string(toString(e.code))});
        root.emplace_back("message", JsonValue{e.message});
    }
    writeJson(os, JsonValue{std::move(root)});
}

}  // namespace recede::io
