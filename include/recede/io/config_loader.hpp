// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Planner configuration from a JSON file. Every key is optional; absent
// keys keep the PlannerOptions defaults.
//
//   {
//     "N": 11, "SV_N": 4, "WP_N": 15, "ts": 0.1,
//     "Q_theta": 10, "Q_position": 10, "Q_obstacle": 100, "Q_u_accel": 10,
//     "Q_u_yaw_rate": 4, "Q_n": 4, "Q_impatience": 1, "Q_speed": 0,
//     "retries": 5, "stop_poll_interval_ms": 100, "stop_max_polls": 50,
//     "backend": "process" | "in_process", "build_dir": "recede_build",
//     "solver_name": "trajectory_optimizer", "build_mode": "release" | "debug",
//     "server_executable": "recede_solver_server", "request_timeout_ms": 10000,
//     "gain_file": "gain.json", "stationary_epsilon": 0.1,
//     "solver": {"max_iterations": 50, "tolerance": 1e-5, "time_limit_ms": 5000}
//   }

#pragma once

#include <filesystem>

#include "recede/io/json.hpp"
#include "recede/planning/planner.hpp"

namespace recede::io {

/// Throws std::runtime_error on a wrongly typed or unknown enum value.
[[nodiscard]] planning::PlannerOptions parsePlannerOptions(const JsonValue& root);

/// Throws std::runtime_error when the file is unreadable or malformed.
[[nodiscard]] planning::PlannerOptions loadPlannerOptionsJSON(const std::filesystem::path& path);

}  // namespace recede::io
