// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// NLPProblem pieces for one planning solve: the control sequence as a
// bounded variable set and the formulation cost bound to one decoded
// parameter vector.

#pragma once

#include <memory>

#include "recede/core/parameter_layout.hpp"
#include "recede/formulation/problem_formulation.hpp"
#include "recede/optimization/nlp_problem.hpp"

namespace recede::optimization {

inline constexpr const char* kControlsName = "controls";

/// Interleaved (accel, yaw_rate) over the horizon, box-bounded.
class ControlVariables : public VariableSet {
public:
    explicit ControlVariables(const ProblemFormulation& formulation);

    [[nodiscard]] VecX lowerBounds() const override { return lb_; }
    [[nodiscard]] VecX upperBounds() const override { return ub_; }

private:
    VecX lb_;
    VecX ub_;
};

/// Formulation cost with its gradient from autodiff. Holds a reference to
/// the formulation, which must outlive the term.
class FormulationCost : public CostTerm {
public:
    FormulationCost(const ProblemFormulation& formulation, ParameterSet params);

    [[nodiscard]] Scalar evaluate() const override;
    void fillGradientBlock(const std::string& var_name, VecX& grad) const override;

    [[nodiscard]] const ParameterSet& parameters() const noexcept { return params_; }

private:
    const ProblemFormulation& formulation_;
    ParameterSet params_;
};

/// Problem with one ControlVariables set initialised to `initial` and one
/// FormulationCost linked to it.
[[nodiscard]] NLPProblem makeTrajectoryProblem(const ProblemFormulation& formulation,
                                               ParameterSet params,
                                               const VecX& initial);

}  // namespace recede::optimization
