// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include <limits>
#include "recede/solvers/trajectory_optimizer.hpp"

using namespace recede;
using namespace recede::solvers;

namespace {

VecX straightRoadParameters(const ProblemFormulation& f) {
    const auto& cfg = f.config();
    ParameterSet p;
    p.ego = VehicleState{0, 0, 0, 5};
    p.socialVehicles.assign(static_cast<std::size_t>(cfg.socialVehicles),
                            VehicleState{100000, 100000, 0, 0});
    for (int k = 0; k < cfg.referencePoints; ++k) {
        p.reference.push_back({static_cast<Scalar>(k + 1), 0, 0});
    }
    p.targetSpeed = 10;
    return f.layout().encode(p);
}

}  // namespace

TEST(TrajectoryOptimizer, SolvesStraightRoad) {
    TrajectoryOptimizer optimizer(FormulationConfig{});
    const auto& f = optimizer.formulation();

    auto response = optimizer.solve(straightRoadParameters(f));
    ASSERT_TRUE(response.isOk()) << response.error().message;

    const auto& sol = response.solution();
    ASSERT_EQ(sol.controls.size(), 22);
    EXPECT_TRUE(sol.controls.allFinite());
    EXPECT_GT(sol.outerIterations, 0);

    const VecX lb = f.lowerBounds();
    const VecX ub = f.upperBounds();
    for (Index i = 0; i < sol.controls.size(); ++i) {
        EXPECT_GE(sol.controls[i], lb[i] - 1e-9) << "i=" << i;
        EXPECT_LE(sol.controls[i], ub[i] + 1e-9) << "i=" << i;
    }

    // Optimised cost beats coasting
    ParameterSet p = f.layout().decode(straightRoadParameters(f));
    EXPECT_LE(sol.cost, f.cost(VecX::Zero(22), p) + 1e-9);
}

TEST(TrajectoryOptimizer, WarmStartAccepted) {
    TrajectoryOptimizer optimizer(FormulationConfig{});
    VecX z = straightRoadParameters(optimizer.formulation());

    auto first = optimizer.solve(z);
    ASSERT_TRUE(first.isOk());
    auto second = optimizer.solve(z, first.solution().controls);
    ASSERT_TRUE(second.isOk());
    EXPECT_LE(second.solution().cost, first.solution().cost + 1e-6);
}

TEST(TrajectoryOptimizer, WrongParameterCount) {
    TrajectoryOptimizer optimizer(FormulationConfig{});
    auto response = optimizer.solve(VecX::Zero(74));
    ASSERT_FALSE(response.isOk());
    EXPECT_EQ(response.error().code, SolverErrorCode::kWrongParameterCount);
    EXPECT_EQ(static_cast<int>(response.error().code), 3003);
}

TEST(TrajectoryOptimizer, WrongInitialGuessLength) {
    TrajectoryOptimizer optimizer(FormulationConfig{});
    VecX z = straightRoadParameters(optimizer.formulation());
    auto response = optimizer.solve(z, VecX::Zero(21));
    ASSERT_FALSE(response.isOk());
    EXPECT_EQ(static_cast<int>(response.error().code), 1600);
}

TEST(TrajectoryOptimizer, NonFiniteParameters) {
    TrajectoryOptimizer optimizer(FormulationConfig{});
    VecX z = straightRoadParameters(optimizer.formulation());
    z[9] = std::numeric_limits<Scalar>::quiet_NaN();
    auto response = optimizer.solve(z);
    ASSERT_FALSE(response.isOk());
    EXPECT_EQ(response.error().code, SolverErrorCode::kSolveFailed);
}

TEST(TrajectoryOptimizer, IterationBudgetStillReturnsControls) {
    SQPSettings settings;
    settings.maxIterations = 1;
    settings.tolerance = 1e-14;
    settings.stagnationTolerance = 0;
    TrajectoryOptimizer optimizer(FormulationConfig{}, settings);

    auto response = optimizer.solve(straightRoadParameters(optimizer.formulation()));
    ASSERT_TRUE(response.isOk());
    EXPECT_EQ(response.solution().exitStatus, ExitStatus::kNotConvergedIterations);
    EXPECT_EQ(response.solution().controls.size(), 22);
}

TEST(ExitStatus, StringRoundTrip) {
    for (auto s : {ExitStatus::kConverged, ExitStatus::kNotConvergedIterations,
                   ExitStatus::kNotConvergedOutOfTime}) {
        EXPECT_EQ(exitStatusFromString(toString(s)), s);
    }
    EXPECT_FALSE(exitStatusFromString("Sideways").has_value());
}
