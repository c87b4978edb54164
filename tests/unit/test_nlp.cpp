// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include "recede/optimization/nlp_problem.hpp"
#include "recede/optimization/trajectory_nlp.hpp"

using namespace recede;
using namespace recede::optimization;

namespace {

class TestVars : public VariableSet {
public:
    TestVars(int n, std::string name) : VariableSet(n, std::move(name)) {}

    [[nodiscard]] VecX lowerBounds() const override {
        return VecX::Constant(size(), -10.0);
    }
    [[nodiscard]] VecX upperBounds() const override {
        return VecX::Constant(size(), 10.0);
    }
};

// 0.5 * ||x||²
class QuadraticCost : public CostTerm {
public:
    explicit QuadraticCost(std::string var_name)
        : CostTerm("quadratic_cost"), var_name_(std::move(var_name)) {}

    [[nodiscard]] Scalar evaluate() const override {
        VecX x = getVariableValues(var_name_);
        return 0.5 * x.squaredNorm();
    }

    void fillGradientBlock(const std::string& vn, VecX& grad) const override {
        if (vn == var_name_) grad = getVariableValues(var_name_);
    }

private:
    std::string var_name_;
};

}  // namespace

TEST(NLPProblem, AddVariableSet) {
    NLPProblem nlp;
    nlp.addVariableSet(std::make_shared<TestVars>(3, "x"));
    EXPECT_EQ(nlp.numVariables(), 3);
}

TEST(NLPProblem, MultipleVariableSets) {
    NLPProblem nlp;
    auto v1 = std::make_shared<TestVars>(3, "x");
    auto v2 = std::make_shared<TestVars>(2, "y");
    nlp.addVariableSet(v1);
    nlp.addVariableSet(v2);

    EXPECT_EQ(nlp.numVariables(), 5);
    EXPECT_EQ(v1->startIndex(), 0);
    EXPECT_EQ(v2->startIndex(), 3);
}

TEST(NLPProblem, VariableValuesRoundTrip) {
    NLPProblem nlp;
    auto v1 = std::make_shared<TestVars>(3, "x");
    auto v2 = std::make_shared<TestVars>(2, "y");
    nlp.addVariableSet(v1);
    nlp.addVariableSet(v2);

    VecX vals(5);
    vals << 1, 2, 3, 4, 5;
    nlp.setVariableValues(vals);

    EXPECT_TRUE(nlp.variableValues().isApprox(vals));
    EXPECT_NEAR(v1->values()[0], 1.0, 1e-12);
    EXPECT_NEAR(v2->values()[0], 4.0, 1e-12);
}

TEST(NLPProblem, UnboundedByDefault) {
    NLPProblem nlp;
    nlp.addVariableSet(std::make_shared<VariableSet>(2, "free"));
    EXPECT_TRUE(std::isinf(nlp.variableLowerBounds()[0]));
    EXPECT_TRUE(std::isinf(nlp.variableUpperBounds()[1]));
}

TEST(NLPProblem, ComposedCostOnlyTouchesLinkedSet) {
    NLPProblem nlp;
    auto v1 = std::make_shared<TestVars>(2, "x");
    auto v2 = std::make_shared<TestVars>(2, "y");
    nlp.addVariableSet(v1);
    nlp.addVariableSet(v2);

    auto cost = std::make_shared<QuadraticCost>("y");
    cost->linkVariables({v2});
    nlp.addCostSet(cost);

    VecX vals(4);
    vals << 1, 2, 3, 4;
    nlp.setVariableValues(vals);

    EXPECT_NEAR(nlp.totalCost(), 0.5 * (9 + 16), 1e-12);

    VecX grad = nlp.costGradient();
    EXPECT_NEAR(grad[0], 0.0, 1e-12);
    EXPECT_NEAR(grad[1], 0.0, 1e-12);
    EXPECT_NEAR(grad[2], 3.0, 1e-12);
    EXPECT_NEAR(grad[3], 4.0, 1e-12);
}

// ── Trajectory problem ───────────────────────────────────────────────────────

TEST(TrajectoryNLP, ControlsCarryFormulationBounds) {
    ProblemFormulation formulation;
    ParameterSet params;
    params.socialVehicles.assign(4, VehicleState{100000, 100000, 0, 0});
    params.reference.assign(15, ReferencePoint{10, 0, 0});

    VecX u0 = VecX::Zero(formulation.numDecisionVariables());
    auto problem = makeTrajectoryProblem(formulation, params, u0);

    ASSERT_EQ(problem.numVariables(), 22);
    ASSERT_EQ(problem.variableSets().size(), 1u);
    EXPECT_EQ(problem.variableSets()[0]->name(), kControlsName);
    EXPECT_TRUE(problem.variableLowerBounds().isApprox(formulation.lowerBounds()));
    EXPECT_TRUE(problem.variableUpperBounds().isApprox(formulation.upperBounds()));

    EXPECT_NEAR(problem.totalCost(), formulation.cost(u0, params), 1e-9);
    EXPECT_TRUE(problem.costGradient().isApprox(formulation.gradient(u0, params)));
}
