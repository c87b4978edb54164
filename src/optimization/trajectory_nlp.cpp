// SPDX-License-Identifier: BSD-3-Clause
#include "recede/optimization/trajectory_nlp.hpp"

#include <cassert>

namespace recede::optimization {

ControlVariables::ControlVariables(const ProblemFormulation& formulation)
    : VariableSet(formulation.numDecisionVariables(), kControlsName),
      lb_(formulation.lowerBounds()),
      ub_(formulation.upperBounds()) {}

FormulationCost::FormulationCost(const ProblemFormulation& formulation,
                                 ParameterSet params)
    : CostTerm("formulation_cost"),
      formulation_(formulation),
      params_(std::move(params)) {}

Scalar FormulationCost::evaluate() const {
    return formulation_.cost(getVariableValues(kControlsName), params_);
}

void FormulationCost::fillGradientBlock(const std::string& var_name, VecX& grad) const {
    if (var_name != kControlsName) return;
    grad = formulation_.gradient(getVariableValues(kControlsName), params_);
}

NLPProblem makeTrajectoryProblem(const ProblemFormulation& formulation,
                                 ParameterSet params, const VecX& initial) {
    assert(initial.size() == formulation.numDecisionVariables());

    auto controls = std::make_shared<ControlVariables>(formulation);
    controls->setValues(initial);

    auto cost = std::make_shared<FormulationCost>(formulation, std::move(params));
    cost->linkVariables({controls});

    NLPProblem problem;
    problem.addVariableSet(controls);
    problem.addCostSet(cost);
    return problem;
}

}  // namespace recede::optimization
