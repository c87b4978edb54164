// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// The solver program core: one parameter vector (+ optional initial guess)
// in, one SolveResponse out. Served over TCP by the solver server and
// called directly by the in-process client.

#pragma once

#include <optional>

#include "recede/core/result.hpp"
#include "recede/formulation/problem_formulation.hpp"
#include "recede/solvers/sqp.hpp"

namespace recede::solvers {

class TrajectoryOptimizer {
public:
    explicit TrajectoryOptimizer(FormulationConfig config, SQPSettings settings = {});

    /// Never throws on bad input; malformed requests come back as failures
    /// (3003 wrong parameter count, 1600 wrong initial-guess length,
    /// 2000 non-finite result).
    [[nodiscard]] SolveResponse solve(const VecX& parameters,
                                      const std::optional<VecX>& initialGuess = std::nullopt) const;

    [[nodiscard]] const ProblemFormulation& formulation() const noexcept { return formulation_; }
    [[nodiscard]] const SQPSettings& settings() const noexcept { return sqp_.settings(); }

private:
    ProblemFormulation formulation_;
    SQPSolver sqp_;
};

}  // namespace recede::solvers
