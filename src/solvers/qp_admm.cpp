// SPDX-License-Identifier: BSD-3-Clause
#include "recede/solvers/qp_admm.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace recede::solvers {

bool QPSolverADMM::setup(const MatX& Q, const VecX& c, const SpMatX& A,
                         const VecX& lb, const VecX& ub) {
    n_ = static_cast<int>(Q.rows());
    m_ = static_cast<int>(A.rows());

    if (Q.cols() != n_ || c.size() != n_ || A.cols() != n_ ||
        lb.size() != m_ || ub.size() != m_) {
        return false;
    }

    Q_ = Q;
    c_ = c;
    lb_ = lb;
    ub_ = ub;
    A_ = A;
    A_.makeCompressed();
    At_ = SpMatX(A_.transpose());
    AtA_ = MatX(At_ * A_);

    x_ = VecX::Zero(n_);
    z_ = VecX::Zero(m_);
    y_ = VecX::Zero(m_);

    // Scale the initial penalty to the problem when left at its default
    if (settings_.rho <= Scalar(0.1) + Scalar(1e-12)) {
        Scalar trQ = Q_.trace();
        Scalar trAtA = AtA_.trace();
        if (trAtA > Scalar(1e-12) && trQ > Scalar(1e-12)) {
            settings_.rho = std::sqrt(trQ / Scalar(n_)) / std::sqrt(trAtA / Scalar(m_));
            settings_.rho = clamp(settings_.rho, Scalar(1e-4), Scalar(1e4));
        }
    }

    assembleKKT();
    is_setup_ = true;
    return true;
}

QPResult QPSolverADMM::solve() {
    QPResult result;
    if (!is_setup_) return result;

    Eigen::LDLT<MatX> ldlt(kkt_);
    const Scalar a = settings_.alpha;

    for (int iter = 0; iter < settings_.maxIterations; ++iter) {
        VecX rhs = settings_.sigma * x_ - c_ + At_ * (settings_.rho * z_ - y_);
        x_ = ldlt.solve(rhs);

        VecX z_prev = z_;
        VecX ax = A_ * x_;
        VecX relaxed = a * ax + (1 - a) * z_prev;
        z_ = (relaxed + y_ / settings_.rho).cwiseMax(lb_).cwiseMin(ub_);
        y_ += settings_.rho * (relaxed - z_);

        result.iterations = iter + 1;

        // Residuals every 5 iterations
        if ((iter + 1) % 5 != 0 && iter != 0) continue;

        Scalar primal = (ax - z_).norm();
        VecX dz = z_ - z_prev;
        Scalar dual = (settings_.rho * (At_ * dz)).norm();

        Scalar eps_primal = settings_.absTolerance * std::sqrt(static_cast<Scalar>(m_))
                          + settings_.relTolerance * std::max(ax.norm(), z_.norm());
        Scalar eps_dual = settings_.absTolerance * std::sqrt(static_cast<Scalar>(n_))
                        + settings_.relTolerance * std::max(settings_.rho * dz.norm(),
                                                            y_.norm());

        result.primalResidual = primal;
        result.dualResidual = dual;

        if (primal <= eps_primal && dual <= eps_dual) {
            result.converged = true;
            break;
        }

        if (settings_.adaptiveRho && updateRho(primal, dual)) {
            assembleKKT();
            ldlt.compute(kkt_);
        }
    }

    result.x = x_;
    result.y = y_;
    result.objectiveValue = static_cast<Scalar>(0.5) * x_.dot(Q_ * x_) + c_.dot(x_);
    return result;
}

void QPSolverADMM::warmStart(const VecX& x0, const VecX& y0) {
    if (x0.size() == n_) x_ = x0;
    if (y0.size() == m_) y_ = y0;
}

void QPSolverADMM::assembleKKT() {
    kkt_ = Q_ + settings_.sigma * MatX::Identity(n_, n_) + settings_.rho * AtA_;
}

bool QPSolverADMM::updateRho(Scalar primal_res, Scalar dual_res) {
    constexpr Scalar kRatio = 10;
    constexpr Scalar kFactor = 2;

    // y is the unscaled dual, so it carries over unchanged

    if (primal_res > kRatio * dual_res) {
        settings_.rho *= kFactor;
        return true;
    }
    if (dual_res > kRatio * primal_res) {
        settings_.rho /= kFactor;
        return true;
    }
    return false;
}

}  // namespace recede::solvers
