// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Sequential Quadratic Programming for box-constrained NLPs built from the
// composable NLPProblem, with QPSolverADMM as the sub-problem solver.
//
// Solves:   min   f(x)
//           s.t.  xl ≤ x ≤ xu
//
// At each iterate x_k:
//   1. Evaluate f, ∇f and the projected gradient x - Π(x - ∇f).
//   2. Solve the QP   min ∇f'·d + 0.5·d'·H·d   s.t.  xl - x ≤ d ≤ xu - x
//      where H is a damped-BFGS approximation of the Hessian.
//   3. Armijo backtracking on f along d; projected steepest descent (and a
//      Hessian reset) when d is not a descent direction or the search fails.
//   4. BFGS update; stop on a small projected gradient, a small step or
//      cost stagnation.

#pragma once

#include <string_view>

#include "recede/core/types.hpp"
#include "recede/optimization/nlp_problem.hpp"

namespace recede::solvers {

enum class SQPStatus {
    kConverged,
    kMaxIterations,
    kTimeLimit,
    kLineSearchFailed,  // No sufficient decrease along any direction
    kQPSetupFailed,
    kNonFinite,         // Cost or gradient became NaN/inf
};

[[nodiscard]] constexpr std::string_view toString(SQPStatus s) noexcept {
    switch (s) {
        case SQPStatus::kConverged:     return "Converged";
        case SQPStatus::kMaxIterations: return "MaxIterations";
        case SQPStatus::kTimeLimit:     return "TimeLimit";
        case SQPStatus::kLineSearchFailed: return "LineSearchFailed";
        case SQPStatus::kQPSetupFailed: return "QPSetupFailed";
        case SQPStatus::kNonFinite:     return "NonFinite";
    }
    return "Unknown";
}

struct SQPSettings {
    int maxIterations{50};
    Scalar tolerance{static_cast<Scalar>(1e-5)};            // Projected gradient / step
    Scalar stagnationTolerance{static_cast<Scalar>(1e-7)};  // Relative cost change
    Scalar lineSearchAlpha{static_cast<Scalar>(1e-4)};      // Armijo constant
    Scalar lineSearchBeta{static_cast<Scalar>(0.5)};        // Step shrink factor
    int lineSearchMaxTrials{20};
    int qpMaxIterations{400};
    double timeLimitMs{5000.0};

    friend bool operator==(const SQPSettings&, const SQPSettings&) = default;
};

struct SQPResult {
    VecX x;
    Scalar cost{0};
    int iterations{0};
    int totalQPIterations{0};  // Sum of ADMM iterations across all QP solves
    SQPStatus status{SQPStatus::kMaxIterations};
    double solveTimeMs{0};

    [[nodiscard]] bool converged() const noexcept { return status == SQPStatus::kConverged; }
};

/// Usage:
///   auto problem = optimization::makeTrajectoryProblem(formulation, params, u0);
///   solvers::SQPSolver solver(settings);
///   auto result = solver.solve(problem);
class SQPSolver {
public:
    SQPSolver() = default;
    explicit SQPSolver(SQPSettings settings) : settings_(std::move(settings)) {}

    /// The variable values in `problem` are the initial guess (projected
    /// onto the bounds) and hold the final iterate on return.
    [[nodiscard]] SQPResult solve(optimization::NLPProblem& problem) const;

    [[nodiscard]] const SQPSettings& settings() const noexcept { return settings_; }
    SQPSettings& settings() noexcept { return settings_; }

private:
    SQPSettings settings_;

    /// Damped BFGS update of H with s = x_{k+1} - x_k, y = ∇f_{k+1} - ∇f_k.
    static void bfgsUpdate(MatX& H, const VecX& s, const VecX& y);
};

}  // namespace recede::solvers
