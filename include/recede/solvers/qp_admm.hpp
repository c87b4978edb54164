// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// ADMM-based Quadratic Program solver in the style of OSQP: one KKT
// factorization per penalty value, cheap iterations afterwards.
//
// Solves:  min  0.5 * x' Q x + c' x
//          s.t. lb <= A x <= ub
//
// A is sparse; for the SQP step of a box-bounded NLP it is the identity.

#pragma once

#include "recede/core/types.hpp"

namespace recede::solvers {

struct QPSettings {
    int maxIterations{4000};
    Scalar absTolerance{static_cast<Scalar>(1e-4)};
    Scalar relTolerance{static_cast<Scalar>(1e-4)};
    Scalar rho{static_cast<Scalar>(0.1)};           // ADMM penalty parameter
    Scalar sigma{static_cast<Scalar>(1e-6)};        // Regularization
    Scalar alpha{static_cast<Scalar>(1.6)};         // Over-relaxation parameter
    bool adaptiveRho{true};
};

struct QPResult {
    VecX x;               // Primal solution
    VecX y;               // Dual solution
    int iterations{0};
    Scalar primalResidual{0};
    Scalar dualResidual{0};
    Scalar objectiveValue{0};
    bool converged{false};
};

/// ADMM iteration:
///   x ← (Q + σI + ρA'A)⁻¹ (σx - c + A'(ρz - y))
///   z ← Π_[lb,ub](αAx + (1-α)z + y/ρ)
///   y ← y + ρ(αAx + (1-α)z_prev - z)
/// until the primal and dual residuals meet the OSQP stopping rule.
class QPSolverADMM {
public:
    QPSolverADMM() = default;
    explicit QPSolverADMM(QPSettings settings) : settings_(std::move(settings)) {}

    /// Returns false on inconsistent dimensions.
    bool setup(const MatX& Q, const VecX& c, const SpMatX& A,
               const VecX& lb, const VecX& ub);

    /// Solve the QP. Call setup() first.
    [[nodiscard]] QPResult solve();

    /// Seed the primal and dual iterates; ignored on size mismatch.
    void warmStart(const VecX& x0, const VecX& y0);

    [[nodiscard]] const QPSettings& settings() const noexcept { return settings_; }
    QPSettings& settings() noexcept { return settings_; }

private:
    QPSettings settings_;

    MatX Q_;
    SpMatX A_;
    SpMatX At_;
    VecX c_, lb_, ub_;
    int n_{0};
    int m_{0};

    VecX x_, z_, y_;
    MatX AtA_;
    MatX kkt_;
    bool is_setup_{false};

    void assembleKKT();
    bool updateRho(Scalar primal_res, Scalar dual_res);
};

}  // namespace recede::solvers
