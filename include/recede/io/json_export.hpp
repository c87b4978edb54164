// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// JSON export of planning output for hosts and offline inspection.

#pragma once

#include <ostream>
#include <string>

#include "recede/core/result.hpp"
#include "recede/core/trajectory.hpp"

namespace recede::io {

/// {"<label>":[{"x":..,"y":..,"heading":..,"speed":..,"t":..}, ...]}
void toJSON(std::ostream& os, const Trajectory2D& trajectory,
            const std::string& label = "trajectory");

/// Solver outcome: status and statistics, or the error code and message.
void toJSON(std::ostream& os, const SolveResponse& response);

}  // namespace recede::io
