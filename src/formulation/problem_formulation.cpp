// SPDX-License-Identifier: BSD-3-Clause
#include "recede/formulation/problem_formulation.hpp"

#include <stdexcept>
#include <string>

namespace recede {

namespace {

FormulationConfig validated(FormulationConfig config) {
    if (config.horizon < 2)
        throw std::invalid_argument("horizon must be at least 2, got " +
                                    std::to_string(config.horizon));
    if (config.socialVehicles < 0)
        throw std::invalid_argument("social vehicle count must be non-negative");
    if (config.referencePoints < 1)
        throw std::invalid_argument("at least one reference point is required");
    if (!(config.ts > 0))
        throw std::invalid_argument("timestep must be positive");
    if (!(config.maxAccelCommand > 0) || !(config.maxYawRateCommand > 0))
        throw std::invalid_argument("control bounds must be positive");
    return config;
}

}  // namespace

ProblemFormulation::ProblemFormulation(FormulationConfig config)
    : config_(validated(config)),
      layout_(config_.socialVehicles, config_.referencePoints) {}

Scalar ProblemFormulation::cost(const VecX& u, const ParameterSet& params) const {
    return costTerms<Scalar>(u, params).total();
}

Scalar ProblemFormulation::costAndGradient(const VecX& u, const ParameterSet& params,
                                           VecX& grad) const {
    const int n = numDecisionVariables();
    VecXT<ADScalar> u_ad(n);
    for (int i = 0; i < n; ++i) {
        u_ad[i] = ADScalar(u[i], n, i);
    }

    ADScalar j = costTerms<ADScalar>(u_ad, params).total();
    grad = j.derivatives().size() == n ? VecX(j.derivatives()) : VecX::Zero(n);
    return j.value();
}

VecX ProblemFormulation::gradient(const VecX& u, const ParameterSet& params) const {
    VecX grad;
    costAndGradient(u, params, grad);
    return grad;
}

CostBreakdown ProblemFormulation::breakdown(const VecX& u, const VecX& z) const {
    return costTerms<Scalar>(u, layout_.decode(z));
}

VecX ProblemFormulation::lowerBounds() const {
    VecX lb(numDecisionVariables());
    for (int t = 0; t < config_.horizon; ++t) {
        lb[2 * t]     = -config_.maxAccelCommand;
        lb[2 * t + 1] = -config_.maxYawRateCommand;
    }
    return lb;
}

VecX ProblemFormulation::upperBounds() const {
    return -lowerBounds();
}

std::vector<VehicleState> ProblemFormulation::rollout(const VecX& u,
                                                      const VehicleState& ego) const {
    const ControlSequence controls(u);
    std::vector<VehicleState> states;
    states.reserve(static_cast<std::size_t>(controls.horizon()));

    VehicleState state = ego;
    for (int t = 0; t < controls.horizon(); ++t) {
        state.step(controls[t], config_.ts);
        states.push_back(state);
    }
    return states;
}

}  // namespace recede
