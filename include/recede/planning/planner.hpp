// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Per-tick receding-horizon planning loop:
//   1. count stationary ticks from the ego displacement
//   2. encode the observation into a parameter vector, then commit the
//      counter and the ego position
//   3. solve, warm-started with the previous accepted solution
//   4. success: decode, keep the controls as the next warm start
//      failure: log, drop the warm start, reinitialize the session
//
// A tick that yields no trajectory means "hold the previous course".

#pragma once

#include <filesystem>
#include <optional>

#include "recede/core/gain.hpp"
#include "recede/core/trajectory.hpp"
#include "recede/formulation/problem_formulation.hpp"
#include "recede/planning/observation.hpp"
#include "recede/session/solver_session.hpp"

namespace recede::planning {

struct PlannerOptions {
    FormulationConfig formulation;
    Gain gain;
    session::SessionOptions session;
    std::filesystem::path gainFile{"gain.json"};      // Replaces `gain` when present
    Scalar stationaryEpsilon{static_cast<Scalar>(0.1)};
};

class Planner {
public:
    /// Builds or reuses the solver and starts it. Throws
    /// session::SessionStartError when the solver cannot be started,
    /// std::runtime_error for an unreadable gain file.
    explicit Planner(PlannerOptions options);

    /// Uses an externally constructed session and starts it.
    Planner(PlannerOptions options, session::SolverSession session);

    /// One tick. std::nullopt when the solve failed. Throws
    /// std::invalid_argument for an observation without a usable path
    /// (loop state is left as it was) and session::SessionStartError when
    /// the solver cannot be restarted.
    [[nodiscard]] std::optional<Trajectory2D> plan(const Observation& obs);

    /// Consecutive ticks with less than stationaryEpsilon displacement.
    [[nodiscard]] int stepsWithoutMoving() const noexcept { return steps_without_moving_; }

    [[nodiscard]] const std::optional<VecX>& warmStart() const noexcept { return warm_start_; }

    /// Parameter vector sent on the most recent tick.
    [[nodiscard]] const VecX& lastParameters() const noexcept { return last_parameters_; }

    [[nodiscard]] const Gain& gain() const noexcept { return options_.gain; }

    /// Takes effect from the next tick.
    void setGain(const Gain& gain) noexcept { options_.gain = gain; }

    [[nodiscard]] const ProblemFormulation& formulation() const noexcept { return formulation_; }
    [[nodiscard]] session::SolverSession& session() noexcept { return session_; }
    [[nodiscard]] const PlannerOptions& options() const noexcept { return options_; }

private:
    PlannerOptions options_;
    ProblemFormulation formulation_;
    session::SolverSession session_;

    int steps_without_moving_{0};
    std::optional<Vec2> last_position_;
    std::optional<VecX> warm_start_;
    VecX last_parameters_;
};

}  // namespace recede::planning
