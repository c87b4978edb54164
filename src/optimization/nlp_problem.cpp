// SPDX-License-Identifier: BSD-3-Clause
#include "recede/optimization/nlp_problem.hpp"

namespace recede::optimization {

VecX NLPProblem::variableValues() const {
    VecX x(total_vars_);
    for (const auto& vs : variable_sets_) {
        x.segment(vs->startIndex(), vs->size()) = vs->values();
    }
    return x;
}

void NLPProblem::setVariableValues(const VecX& x) {
    for (auto& vs : variable_sets_) {
        vs->setValues(x.segment(vs->startIndex(), vs->size()));
    }
}

VecX NLPProblem::variableLowerBounds() const {
    VecX lb(total_vars_);
    for (const auto& vs : variable_sets_) {
        lb.segment(vs->startIndex(), vs->size()) = vs->lowerBounds();
    }
    return lb;
}

VecX NLPProblem::variableUpperBounds() const {
    VecX ub(total_vars_);
    for (const auto& vs : variable_sets_) {
        ub.segment(vs->startIndex(), vs->size()) = vs->upperBounds();
    }
    return ub;
}

Scalar NLPProblem::totalCost() const {
    Scalar total = 0;
    for (const auto& ct : cost_terms_) {
        total += ct->evaluate();
    }
    return total;
}

VecX NLPProblem::costGradient() const {
    VecX grad = VecX::Zero(total_vars_);
    for (const auto& ct : cost_terms_) {
        for (const auto& vs : ct->linkedVariables()) {
            VecX block = VecX::Zero(vs->size());
            ct->fillGradientBlock(vs->name(), block);
            grad.segment(vs->startIndex(), vs->size()) += block;
        }
    }
    return grad;
}

}  // namespace recede::optimization
