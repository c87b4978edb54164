// SPDX-License-Identifier: BSD-3-Clause
#include "recede/solvers/sqp.hpp"
#include "recede/solvers/qp_admm.hpp"

#include <cmath>
#include <vector>

namespace recede::solvers {

namespace {

double elapsedMs(TimePoint since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

VecX project(const VecX& x, const VecX& lb, const VecX& ub) {
    return x.cwiseMax(lb).cwiseMin(ub);
}

SpMatX identity(int n) {
    std::vector<Triplet> triplets;
    triplets.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) triplets.emplace_back(i, i, Scalar(1));
    SpMatX I(n, n);
    I.setFromTriplets(triplets.begin(), triplets.end());
    return I;
}

}  // namespace

void SQPSolver::bfgsUpdate(MatX& H, const VecX& s, const VecX& y) {
    VecX Hs = H * s;
    Scalar sHs = s.dot(Hs);
    if (sHs < Scalar(1e-16)) return;

    // Powell damping keeps sᵀr ≥ 0.2·sᵀHs so H stays positive definite
    Scalar sy = s.dot(y);
    VecX r = y;
    if (sy < Scalar(0.2) * sHs) {
        Scalar theta = Scalar(0.8) * sHs / (sHs - sy);
        r = theta * y + (Scalar(1) - theta) * Hs;
    }

    Scalar sr = s.dot(r);
    if (sr < Scalar(1e-12) * s.squaredNorm()) return;
    H += (r * r.transpose()) / sr - (Hs * Hs.transpose()) / sHs;
}

SQPResult SQPSolver::solve(optimization::NLPProblem& problem) const {
    SQPResult result;
    const auto t0 = Clock::now();
    const int n = problem.numVariables();

    const VecX xl = problem.variableLowerBounds();
    const VecX xu = problem.variableUpperBounds();
    VecX x = project(problem.variableValues(), xl, xu);

    if (n == 0) {
        result.status = SQPStatus::kConverged;
        result.x = x;
        return result;
    }

    const SpMatX A = identity(n);
    MatX H = MatX::Identity(n, n);

    problem.setVariableValues(x);
    Scalar f = problem.totalCost();
    VecX grad = problem.costGradient();

    VecX prev_d = VecX::Zero(n);
    VecX prev_y = VecX::Zero(n);
    bool stopped = false;

    for (int iter = 0; iter < settings_.maxIterations; ++iter) {
        if (!std::isfinite(f) || !grad.allFinite()) {
            result.status = SQPStatus::kNonFinite;
            stopped = true;
            break;
        }
        if (elapsedMs(t0) > settings_.timeLimitMs) {
            result.status = SQPStatus::kTimeLimit;
            stopped = true;
            break;
        }

        // First-order optimality for box constraints
        if ((x - project(x - grad, xl, xu)).norm() < settings_.tolerance) {
            result.status = SQPStatus::kConverged;
            stopped = true;
            break;
        }

        // ── QP sub-problem ──────────────────────────────────────────────────
        const VecX lb = xl - x;
        const VecX ub = xu - x;

        MatX H_reg = H;
        Scalar min_diag = H.diagonal().minCoeff();
        if (min_diag < Scalar(1e-8)) {
            H_reg += MatX::Identity(n, n) * (Scalar(1e-8) - min_diag);
        }

        // Coarse QPs early, tighter once the iterate settles
        QPSolverADMM qp;
        Scalar qp_tol = (iter < 5) ? Scalar(1e-3) : Scalar(1e-4);
        qp.settings().maxIterations = settings_.qpMaxIterations;
        qp.settings().absTolerance = qp_tol;
        qp.settings().relTolerance = qp_tol;

        if (!qp.setup(H_reg, grad, A, lb, ub)) {
            result.status = SQPStatus::kQPSetupFailed;
            stopped = true;
            break;
        }
        if (iter > 0) qp.warmStart(prev_d, prev_y);

        QPResult qp_result = qp.solve();
        result.totalQPIterations += qp_result.iterations;
        prev_y = qp_result.y;

        VecX d = qp_result.x.cwiseMax(lb).cwiseMin(ub);
        const VecX steepest = project(x - grad, xl, xu) - x;
        if (!(grad.dot(d) < 0)) d = steepest;
        prev_d = d;

        // ── Armijo line search ──────────────────────────────────────────────
        VecX x_trial = x;
        Scalar f_trial = f;
        auto lineSearch = [&](const VecX& dir) {
            const Scalar slope = grad.dot(dir);
            Scalar alpha = 1;
            for (int ls = 0; ls < settings_.lineSearchMaxTrials; ++ls) {
                x_trial = project(x + alpha * dir, xl, xu);
                problem.setVariableValues(x_trial);
                f_trial = problem.totalCost();
                if (std::isfinite(f_trial) &&
                    f_trial <= f + settings_.lineSearchAlpha * alpha * slope) {
                    return true;
                }
                alpha *= settings_.lineSearchBeta;
            }
            return false;
        };

        bool accepted = lineSearch(d);
        if (!accepted && d != steepest) {
            // The quasi-Newton model is off; restart it from steepest descent
            H = MatX::Identity(n, n);
            accepted = lineSearch(steepest);
        }

        result.iterations = iter + 1;

        if (!accepted) {
            problem.setVariableValues(x);
            result.status = SQPStatus::kLineSearchFailed;
            stopped = true;
            break;
        }

        VecX grad_new = problem.costGradient();
        VecX s = x_trial - x;
        bfgsUpdate(H, s, grad_new - grad);

        Scalar rel_change = std::abs(f_trial - f) / (std::abs(f) + Scalar(1));
        x = x_trial;
        f = f_trial;
        grad = grad_new;

        if (s.norm() < settings_.tolerance || rel_change < settings_.stagnationTolerance) {
            result.status = SQPStatus::kConverged;
            stopped = true;
            break;
        }
    }

    if (!stopped) result.status = SQPStatus::kMaxIterations;

    problem.setVariableValues(x);
    result.x = x;
    result.cost = f;
    result.solveTimeMs = elapsedMs(t0);
    return result;
}

}  // namespace recede::solvers
