// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Recede: receding-horizon motion planning among social vehicles.
// Umbrella header for convenient inclusion.

#pragma once

// Core
#include "recede/core/types.hpp"
#include "recede/core/gain.hpp"
#include "recede/core/vehicle_state.hpp"
#include "recede/core/reference_point.hpp"
#include "recede/core/control_sequence.hpp"
#include "recede/core/parameter_layout.hpp"
#include "recede/core/trajectory.hpp"
#include "recede/core/result.hpp"

// Formulation
#include "recede/formulation/problem_formulation.hpp"

// Optimization Framework
#include "recede/optimization/nlp_problem.hpp"
#include "recede/optimization/trajectory_nlp.hpp"

// Solvers
#include "recede/solvers/qp_admm.hpp"
#include "recede/solvers/sqp.hpp"
#include "recede/solvers/trajectory_optimizer.hpp"

// Solver Session
#include "recede/session/artifact_store.hpp"
#include "recede/session/solver_client.hpp"
#include "recede/session/solver_protocol.hpp"
#include "recede/session/solver_session.hpp"

// Planning
#include "recede/planning/observation.hpp"
#include "recede/planning/parameter_encoder.hpp"
#include "recede/planning/planner.hpp"

// IO
#include "recede/io/json.hpp"
#include "recede/io/gain_file.hpp"
#include "recede/io/config_loader.hpp"
#include "recede/io/json_export.hpp"
