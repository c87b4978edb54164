// SPDX-License-Identifier: BSD-3-Clause
#include "recede/solvers/trajectory_optimizer.hpp"

#include <cmath>
#include <string>

#include "recede/optimization/trajectory_nlp.hpp"

namespace recede::solvers {

TrajectoryOptimizer::TrajectoryOptimizer(FormulationConfig config, SQPSettings settings)
    : formulation_(config), sqp_(std::move(settings)) {}

SolveResponse TrajectoryOptimizer::solve(const VecX& parameters,
                                         const std::optional<VecX>& initialGuess) const {
    const int np = formulation_.numParameters();
    const int nu = formulation_.numDecisionVariables();

    if (parameters.size() != np) {
        return SolveResponse::failure(
            SolverErrorCode::kWrongParameterCount,
            "expected " + std::to_string(np) + " parameters, got " +
                std::to_string(parameters.size()));
    }
    if (initialGuess && initialGuess->size() != nu) {
        return SolveResponse::failure(
            SolverErrorCode::kWrongInitialGuessSize,
            "expected initial guess of length " + std::to_string(nu) + ", got " +
                std::to_string(initialGuess->size()));
    }
    if (!parameters.allFinite()) {
        return SolveResponse::failure(SolverErrorCode::kSolveFailed,
                                      "parameter vector contains non-finite values");
    }

    const VecX u0 = initialGuess ? *initialGuess : VecX(VecX::Zero(nu));
    auto problem = optimization::makeTrajectoryProblem(
        formulation_, formulation_.layout().decode(parameters), u0);

    SQPResult r = sqp_.solve(problem);

    if (r.status == SQPStatus::kNonFinite || r.status == SQPStatus::kQPSetupFailed ||
        !r.x.allFinite() || !std::isfinite(r.cost)) {
        return SolveResponse::failure(SolverErrorCode::kSolveFailed,
                                      std::string("solver stopped: ") +
                                          std::string(toString(r.status)));
    }

    SolverSolution solution;
    solution.controls = r.x;
    solution.cost = r.cost;
    solution.outerIterations = r.iterations;
    solution.innerIterations = r.totalQPIterations;
    solution.solveTimeMs = r.solveTimeMs;
    switch (r.status) {
        case SQPStatus::kTimeLimit:
            solution.exitStatus = ExitStatus::kNotConvergedOutOfTime;
            break;
        case SQPStatus::kMaxIterations:
        case SQPStatus::kLineSearchFailed:
            solution.exitStatus = ExitStatus::kNotConvergedIterations;
            break;
        default:
            solution.exitStatus = ExitStatus::kConverged;
            break;
    }
    return SolveResponse::ok(std::move(solution));
}

}  // namespace recede::solvers
