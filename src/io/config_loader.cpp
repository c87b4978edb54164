// SPDX-License-Identifier: BSD-3-Clause
#include "recede/io/config_loader.hpp"

#include <stdexcept>

namespace recede::io {

namespace {

void readScalar(const JsonValue& root, std::string_view key, Scalar& out) {
    if (const auto* v = root.find(key)) out = static_cast<Scalar>(v->asNumber());
}

void readInt(const JsonValue& root, std::string_view key, int& out) {
    if (const auto* v = root.find(key)) out = static_cast<int>(v->asNumber());
}

void readMillis(const JsonValue& root, std::string_view key, std::chrono::milliseconds& out) {
    if (const auto* v = root.find(key)) {
        out = std::chrono::milliseconds(static_cast<long long>(v->asNumber()));
    }
}

void readString(const JsonValue& root, std::string_view key, std::string& out) {
    if (const auto* v = root.find(key)) out = v->asString();
}

void readPath(const JsonValue& root, std::string_view key, std::filesystem::path& out) {
    if (const auto* v = root.find(key)) out = v->asString();
}

}  // namespace

planning::PlannerOptions parsePlannerOptions(const JsonValue& root) {
    if (!root.isObject()) throw std::runtime_error("config must be a JSON object");

    planning::PlannerOptions o;

    auto& f = o.formulation;
    readInt(root, "N", f.horizon);
    readInt(root, "SV_N", f.socialVehicles);
    readInt(root, "WP_N", f.referencePoints);
    readScalar(root, "ts", f.ts);

    auto& g = o.gain;
    readScalar(root, "Q_theta", g.theta);
    readScalar(root, "Q_position", g.position);
    readScalar(root, "Q_obstacle", g.obstacle);
    readScalar(root, "Q_u_accel", g.uAccel);
    readScalar(root, "Q_u_yaw_rate", g.uYawRate);
    readScalar(root, "Q_n", g.terminal);
    readScalar(root, "Q_impatience", g.impatience);
    readScalar(root, "Q_speed", g.speed);

    auto& s = o.session;
    readInt(root, "retries", s.startRetries);
    readMillis(root, "stop_poll_interval_ms", s.stopPollInterval);
    readInt(root, "stop_max_polls", s.stopMaxPolls);
    readPath(root, "build_dir", s.buildDirectory);
    readString(root, "solver_name", s.solverName);
    readString(root, "server_executable", s.serverExecutable);
    readMillis(root, "request_timeout_ms", s.requestTimeout);
    readMillis(root, "startup_timeout_ms", s.startupTimeout);

    if (const auto* v = root.find("backend")) {
        const auto& name = v->asString();
        if (name == "process") {
            s.backend = session::SolverBackend::kProcess;
        } else if (name == "in_process") {
            s.backend = session::SolverBackend::kInProcess;
        } else {
            throw std::runtime_error("unknown backend '" + name + "'");
        }
    }
    if (const auto* v = root.find("build_mode")) {
        const auto& name = v->asString();
        if (name == "release") {
            s.buildMode = session::BuildMode::kRelease;
        } else if (name == "debug") {
            s.buildMode = session::BuildMode::kDebug;
        } else {
            throw std::runtime_error("unknown build mode '" + name + "'");
        }
    }
    if (const auto* solver = root.find("solver")) {
        auto& sqp = s.solverSettings;
        readInt(*solver, "max_iterations", sqp.maxIterations);
        readScalar(*solver, "tolerance", sqp.tolerance);
        readScalar(*solver, "stagnation_tolerance", sqp.stagnationTolerance);
        readInt(*solver, "qp_max_iterations", sqp.qpMaxIterations);
        if (const auto* t = solver->find("time_limit_ms")) sqp.timeLimitMs = t->asNumber();
    }

    readPath(root, "gain_file", o.gainFile);
    readScalar(root, "stationary_epsilon", o.stationaryEpsilon);
    return o;
}

planning::PlannerOptions loadPlannerOptionsJSON(const std::filesystem::path& path) {
    try {
        return parsePlannerOptions(parseJson(readTextFile(path)));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path.string() + ": " + e.what());
    }
}

}  // namespace recede::io
