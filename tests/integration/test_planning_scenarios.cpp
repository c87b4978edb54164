// SPDX-License-Identifier: BSD-3-Clause
// Integration tests: full planning ticks against the real solver core.
#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include "recede/recede.hpp"

using namespace recede;
using namespace recede::planning;

class PlanningScenarioTest : public ::testing::Test {
protected:
    static PlannerOptions inProcessOptions() {
        PlannerOptions o;
        o.gainFile.clear();
        o.session.backend = session::SolverBackend::kInProcess;
        return o;
    }

    /// Ego heading along +y (host heading 0) on a straight road.
    static Observation straightRoad(Scalar egoY, Scalar speed) {
        Observation obs;
        obs.ego = {Vec2(0, egoY), 0, speed};
        WaypointPath path;
        for (int i = 1; i <= 30; ++i) {
            path.push_back({Vec2(0, egoY + static_cast<Scalar>(i)), 0, 10});
        }
        obs.waypointPaths.push_back(path);
        return obs;
    }
};

TEST_F(PlanningScenarioTest, StraightRoadNoNeighbors) {
    Planner planner(inProcessOptions());
    const auto obs = straightRoad(0, 5);

    auto traj = planner.plan(obs);
    ASSERT_TRUE(traj.has_value());
    ASSERT_EQ(traj->size(), 11u);

    const VecX z = planner.lastParameters();
    const auto& layout = planner.formulation().layout();
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(z[layout.offset(ParameterField::kSocialVehicles, i)], 100000);
    }

    ASSERT_TRUE(planner.warmStart().has_value());
    const VecX& u = *planner.warmStart();
    ASSERT_EQ(u.size(), 22);
    const VecX lb = planner.formulation().lowerBounds();
    const VecX ub = planner.formulation().upperBounds();
    for (Index i = 0; i < u.size(); ++i) {
        EXPECT_GE(u[i], lb[i] - 1e-9);
        EXPECT_LE(u[i], ub[i] + 1e-9);
    }

    // Monotone progress along the road, no sideways drift worth noting
    for (std::size_t k = 1; k < traj->size(); ++k) {
        EXPECT_GT((*traj)[k].y, (*traj)[k - 1].y);
        EXPECT_LT(std::abs((*traj)[k].x), 1.0);
    }
    std::cout << "[StraightRoad] end=(" << traj->back().x << ", " << traj->back().y
              << ") length=" << traj->pathLength() << std::endl;
}

TEST_F(PlanningScenarioTest, RecedingHorizonKeepsPlanning) {
    Planner planner(inProcessOptions());
    Scalar y = 0;
    Scalar speed = 5;
    for (int tick = 0; tick < 5; ++tick) {
        auto traj = planner.plan(straightRoad(y, speed));
        ASSERT_TRUE(traj.has_value()) << "tick " << tick;
        // Execute the first step of the plan
        y = traj->front().y;
        speed = traj->front().speed;
        EXPECT_EQ(planner.stepsWithoutMoving(), 0);
    }
    EXPECT_GT(y, 0);
}

TEST_F(PlanningScenarioTest, StalledEgoBuildsImpatience) {
    Planner planner(inProcessOptions());
    const auto obs = straightRoad(0, 0);
    const int impatienceAt =
        planner.formulation().layout().offset(ParameterField::kImpatience);

    constexpr int kStalledTicks = 3;
    for (int tick = 0; tick <= kStalledTicks; ++tick) {
        ASSERT_TRUE(planner.plan(obs).has_value());
    }
    EXPECT_EQ(planner.stepsWithoutMoving(), kStalledTicks);
    EXPECT_EQ(planner.lastParameters()[impatienceAt], kStalledTicks);

    // The impatience term pushes the first acceleration toward its bound
    EXPECT_GT((*planner.warmStart())[0], 0);
}

TEST_F(PlanningScenarioTest, SingleWaypointPathIsPadded) {
    Planner planner(inProcessOptions());
    Observation obs;
    obs.ego = {Vec2(0, 0), 0, 3};
    obs.waypointPaths.push_back({{Vec2(0, 8), 0, 6}});

    auto traj = planner.plan(obs);
    ASSERT_TRUE(traj.has_value());

    const VecX& z = planner.lastParameters();
    const auto& layout = planner.formulation().layout();
    for (int i = 0; i < 15; ++i) {
        const int at = layout.offset(ParameterField::kReferencePath, i);
        EXPECT_EQ(z[at], 0);
        EXPECT_EQ(z[at + 1], 8);
        EXPECT_NEAR(z[at + 2], constants::kHalfPi, 1e-12);
    }
    EXPECT_EQ(z[layout.offset(ParameterField::kTargetSpeed)], 6);
}

TEST_F(PlanningScenarioTest, StoppedVehicleAheadSlowsEgo) {
    Planner free(inProcessOptions());
    Planner blocked(inProcessOptions());

    auto open = straightRoad(0, 8);
    auto jammed = open;
    jammed.neighbors.push_back({Vec2(0, 9), 0, 0});

    auto clearTraj = free.plan(open);
    auto blockedTraj = blocked.plan(jammed);
    ASSERT_TRUE(clearTraj.has_value());
    ASSERT_TRUE(blockedTraj.has_value());

    // Either brakes harder or swerves away from the stopped vehicle
    const auto& a = clearTraj->back();
    const auto& b = blockedTraj->back();
    const Scalar gapClear = (a.position() - Vec2(0, 9)).norm();
    const Scalar gapBlocked = (b.position() - Vec2(0, 9)).norm();
    EXPECT_TRUE(b.speed < a.speed || gapBlocked > gapClear)
        << "clear speed " << a.speed << " blocked speed " << b.speed;
}
