// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include <cmath>
#include "recede/solvers/sqp.hpp"

using namespace recede;
using namespace recede::optimization;
using namespace recede::solvers;

// ── Concrete test helpers (anonymous namespace to avoid ODR collisions) ──────

namespace {

/// 2D variables with optional box bounds
class TestVars2D : public VariableSet {
public:
    TestVars2D() : VariableSet(2, "x") {}
    TestVars2D(Scalar lo, Scalar hi) : VariableSet(2, "x"), lo_(lo), hi_(hi) {}

    VecX lowerBounds() const override { return VecX::Constant(2, lo_); }
    VecX upperBounds() const override { return VecX::Constant(2, hi_); }

private:
    Scalar lo_{-constants::kInfinity};
    Scalar hi_{constants::kInfinity};
};

/// Quadratic cost: 0.5 * x' Q x + c' x
class QuadraticCost : public CostTerm {
public:
    QuadraticCost(MatX Q, VecX c)
        : CostTerm("quad"), Q_(std::move(Q)), c_(std::move(c)) {}

    Scalar evaluate() const override {
        VecX x = getVariableValues("x");
        return Scalar(0.5) * x.dot(Q_ * x) + c_.dot(x);
    }
    void fillGradientBlock(const std::string&, VecX& grad) const override {
        VecX x = getVariableValues("x");
        grad = Q_ * x + c_;
    }

private:
    MatX Q_;
    VecX c_;
};

/// Rosenbrock cost: (a - x0)² + b*(x1 - x0²)²
class RosenbrockCost : public CostTerm {
public:
    RosenbrockCost(Scalar a = 1.0, Scalar b = 100.0)
        : CostTerm("rosenbrock"), a_(a), b_(b) {}

    Scalar evaluate() const override {
        VecX x = getVariableValues("x");
        Scalar t1 = a_ - x[0];
        Scalar t2 = x[1] - x[0] * x[0];
        return t1 * t1 + b_ * t2 * t2;
    }
    void fillGradientBlock(const std::string&, VecX& grad) const override {
        VecX x = getVariableValues("x");
        Scalar t2 = x[1] - x[0] * x[0];
        grad[0] = -2.0 * (a_ - x[0]) - 4.0 * b_ * x[0] * t2;
        grad[1] = 2.0 * b_ * t2;
    }

private:
    Scalar a_, b_;
};

/// Cost that turns NaN once x0 leaves [-1, 1]
class PoisonedCost : public CostTerm {
public:
    PoisonedCost() : CostTerm("poisoned") {}

    Scalar evaluate() const override {
        VecX x = getVariableValues("x");
        return std::sqrt(1.0 - x[0] * x[0]);
    }
    void fillGradientBlock(const std::string&, VecX& grad) const override {
        VecX x = getVariableValues("x");
        grad[0] = -x[0] / std::sqrt(1.0 - x[0] * x[0]);
        grad[1] = 0;
    }
};

NLPProblem makeProblem(std::shared_ptr<VariableSet> vars, CostTerm::Ptr cost,
                       Scalar x0, Scalar x1) {
    VecX init(2);
    init << x0, x1;
    vars->setValues(init);
    cost->linkVariables({vars});

    NLPProblem problem;
    problem.addVariableSet(vars);
    problem.addCostSet(cost);
    return problem;
}

}  // anonymous namespace

// ── Tests ────────────────────────────────────────────────────────────────────

TEST(SQPSolver, UnconstrainedQuadratic) {
    // min 0.5*(x0² + x1²) + [-2, -3]*x  =>  x = [2, 3]
    VecX c(2);
    c << -2, -3;
    auto problem = makeProblem(std::make_shared<TestVars2D>(),
                               std::make_shared<QuadraticCost>(MatX::Identity(2, 2), c),
                               0, 0);

    SQPSolver solver;
    auto result = solver.solve(problem);

    EXPECT_TRUE(result.converged());
    EXPECT_NEAR(result.x[0], 2.0, 1e-3);
    EXPECT_NEAR(result.x[1], 3.0, 1e-3);
}

TEST(SQPSolver, BoxConstrainedQuadratic) {
    // Unconstrained solution: [5, 5], box-constrained: [3, 3]
    VecX c(2);
    c << -5, -5;
    auto problem = makeProblem(std::make_shared<TestVars2D>(0.0, 3.0),
                               std::make_shared<QuadraticCost>(MatX::Identity(2, 2), c),
                               1, 1);

    SQPSolver solver;
    auto result = solver.solve(problem);

    EXPECT_TRUE(result.converged());
    EXPECT_NEAR(result.x[0], 3.0, 1e-2);
    EXPECT_NEAR(result.x[1], 3.0, 1e-2);
}

TEST(SQPSolver, InfeasibleStartIsProjected) {
    VecX c = VecX::Zero(2);
    auto problem = makeProblem(std::make_shared<TestVars2D>(1.0, 2.0),
                               std::make_shared<QuadraticCost>(MatX::Identity(2, 2), c),
                               -5, 7);

    SQPSolver solver;
    auto result = solver.solve(problem);

    EXPECT_TRUE(result.converged());
    EXPECT_NEAR(result.x[0], 1.0, 1e-4);
    EXPECT_NEAR(result.x[1], 1.0, 1e-4);
    EXPECT_GE(result.x.minCoeff(), 1.0);
}

TEST(SQPSolver, Rosenbrock) {
    // min (1-x0)² + 100*(x1-x0²)²  =>  x = [1, 1]
    auto problem = makeProblem(std::make_shared<TestVars2D>(),
                               std::make_shared<RosenbrockCost>(), -1, 1);

    SQPSettings settings;
    settings.maxIterations = 500;
    settings.tolerance = 1e-6;
    settings.stagnationTolerance = 0;

    SQPSolver solver(settings);
    auto result = solver.solve(problem);

    EXPECT_NE(result.status, SQPStatus::kNonFinite);
    EXPECT_NEAR(result.x[0], 1.0, 0.05);
    EXPECT_NEAR(result.x[1], 1.0, 0.05);
}

TEST(SQPSolver, EmptyProblem) {
    NLPProblem problem;
    SQPSolver solver;
    auto result = solver.solve(problem);
    EXPECT_TRUE(result.converged());
    EXPECT_EQ(result.iterations, 0);
}

TEST(SQPSolver, IterationBudget) {
    auto problem = makeProblem(std::make_shared<TestVars2D>(),
                               std::make_shared<RosenbrockCost>(), -1.2, 1);

    SQPSettings settings;
    settings.maxIterations = 2;
    settings.tolerance = 1e-12;
    settings.stagnationTolerance = 0;

    SQPSolver solver(settings);
    auto result = solver.solve(problem);
    EXPECT_EQ(result.status, SQPStatus::kMaxIterations);
    EXPECT_EQ(result.iterations, 2);
    EXPECT_FALSE(result.converged());
}

TEST(SQPSolver, NonFiniteStartReported) {
    auto problem = makeProblem(std::make_shared<TestVars2D>(),
                               std::make_shared<PoisonedCost>(), 3, 0);

    SQPSolver solver;
    auto result = solver.solve(problem);
    EXPECT_EQ(result.status, SQPStatus::kNonFinite);
    EXPECT_EQ(toString(result.status), "NonFinite");
}

TEST(SQPSolver, FinalIterateWrittenBack) {
    VecX c(2);
    c << -2, -3;
    auto vars = std::make_shared<TestVars2D>();
    auto problem = makeProblem(vars,
                               std::make_shared<QuadraticCost>(MatX::Identity(2, 2), c),
                               0, 0);

    SQPSolver solver;
    auto result = solver.solve(problem);
    EXPECT_TRUE(vars->values().isApprox(result.x));
}

TEST(SQPSolver, TotalQPIterationsPopulated) {
    VecX c = VecX::Zero(2);
    auto problem = makeProblem(std::make_shared<TestVars2D>(-10.0, 10.0),
                               std::make_shared<QuadraticCost>(MatX::Identity(2, 2), c),
                               3, 3);

    SQPSolver solver;
    auto result = solver.solve(problem);
    EXPECT_GT(result.totalQPIterations, 0);
    EXPECT_LT(result.cost, 1e-3);
}
