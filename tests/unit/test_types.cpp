// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include "recede/core/gain.hpp"
#include "recede/core/reference_point.hpp"
#include "recede/core/types.hpp"

using namespace recede;

TEST(Types, Clamp) {
    EXPECT_EQ(clamp(5.0, 0.0, 10.0), 5.0);
    EXPECT_EQ(clamp(-1.0, 0.0, 10.0), 0.0);
    EXPECT_EQ(clamp(15.0, 0.0, 10.0), 10.0);
}

TEST(Types, Sq) {
    EXPECT_NEAR(sq(3.0), 9.0, 1e-10);
    EXPECT_NEAR(sq(-4.0), 16.0, 1e-10);
}

TEST(Types, MinMaxOfScalars) {
    EXPECT_EQ(minOf<Scalar>(2.0, -1.0), -1.0);
    EXPECT_EQ(maxOf<Scalar>(2.0, -1.0), 2.0);
}

TEST(Types, MinOfFollowsSelectedDerivative) {
    ADScalar a(1.0, 2, 0);   // da/du0 = 1
    ADScalar b(3.0, 2, 1);   // db/du1 = 1
    ADScalar m = minOf<ADScalar>(a, b);
    EXPECT_NEAR(m.value(), 1.0, 1e-12);
    EXPECT_NEAR(m.derivatives()[0], 1.0, 1e-12);
    EXPECT_NEAR(m.derivatives()[1], 0.0, 1e-12);
}

TEST(Types, ClampLikeZeroesDerivativeWhenSaturated) {
    ADScalar v(-0.5, 3, 2);
    ADScalar c = clampLike<ADScalar>(v, 0.0, 14.0);
    EXPECT_NEAR(c.value(), 0.0, 1e-12);
    ASSERT_EQ(c.derivatives().size(), 3);
    EXPECT_NEAR(c.derivatives().norm(), 0.0, 1e-12);

    ADScalar inside = clampLike<ADScalar>(ADScalar(5.0, 3, 1), 0.0, 14.0);
    EXPECT_NEAR(inside.derivatives()[1], 1.0, 1e-12);
}

TEST(Types, ConstantLikeMatchesDerivativeLength) {
    ADScalar like(0.0, 22, 5);
    ADScalar c = constantLike(7.0, like);
    EXPECT_NEAR(c.value(), 7.0, 1e-12);
    EXPECT_EQ(c.derivatives().size(), 22);
}

// ── Heading error ────────────────────────────────────────────────────────────

TEST(HeadingError, ZeroForEqualHeadings) {
    for (Scalar a : {-3.0, -1.0, 0.0, 0.5, 2.0, 3.1}) {
        EXPECT_NEAR(headingError<Scalar>(a, a), 0.0, 1e-12) << "a=" << a;
    }
}

TEST(HeadingError, SymmetricWithinHalfTurn) {
    const Scalar pairs[][2] = {{0.0, 1.0}, {0.3, -0.4}, {2.0, -1.0}, {-1.5, 1.5}};
    for (const auto& p : pairs) {
        EXPECT_NEAR(headingError<Scalar>(p[0], p[1]), headingError<Scalar>(p[1], p[0]), 1e-12);
    }
}

TEST(HeadingError, WrapsOnlyThePositiveBranch) {
    // a - (b + 2π) brings a = 3, b = -3 close together
    const Scalar a = 3.0, b = -3.0;
    EXPECT_NEAR(headingError<Scalar>(a, b), sq(a - (b + constants::kTwoPi)), 1e-12);
    // The mirrored pair has no -2π branch, so it keeps the direct error
    EXPECT_NEAR(headingError<Scalar>(b, a), sq(b - a), 1e-12);
}

TEST(WeightedDistance, CombinesPositionAndHeading) {
    Gain gain;
    gain.position = 2;
    gain.theta = 3;
    ReferencePoint from{1, 1, 0.5};
    ReferencePoint to{4, 5, 0.0};
    // 2·(9+16) + 3·0.25
    EXPECT_NEAR(weightedDistance<Scalar>(from, to, gain), 50.75, 1e-12);
}

TEST(WeightedDistance, MinimumOverReferenceWindow) {
    Gain gain;
    std::vector<ReferencePoint> refs{{0, 0, 0}, {10, 0, 0}, {20, 0, 0}};
    ReferencePoint pose{11, 0, 0};
    EXPECT_NEAR(minWeightedDistance<Scalar>(refs, pose, gain), gain.position * 1.0, 1e-12);
}

// ── Gain ─────────────────────────────────────────────────────────────────────

TEST(Gain, DefaultsMatchTunedValues) {
    Gain g;
    EXPECT_EQ(g.toArray(), (std::array<Scalar, 8>{10, 10, 100, 10, 4, 4, 1, 0}));
}

TEST(Gain, ArrayOrderMatchesFieldNames) {
    Gain g;
    g.obstacle = 42;
    g.speed = 7;
    auto arr = g.toArray();
    EXPECT_EQ(Gain::kFieldNames[2], "obstacle");
    EXPECT_EQ(arr[2], 42);
    EXPECT_EQ(Gain::kFieldNames[7], "speed");
    EXPECT_EQ(arr[7], 7);
    EXPECT_EQ(Gain::fromArray(arr), g);
}
