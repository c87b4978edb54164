// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include "recede/core/parameter_layout.hpp"

using namespace recede;

TEST(ParameterLayout, DimensionFormula) {
    EXPECT_EQ(ParameterLayout::dimension(4, 15), 75);
    EXPECT_EQ(ParameterLayout::dimension(0, 1), 17);
    for (int sv = 0; sv < 6; ++sv) {
        for (int wp = 1; wp < 20; wp += 3) {
            ParameterLayout layout(sv, wp);
            EXPECT_EQ(layout.size(), 8 + 4 + 4 * sv + 3 * wp + 2);
        }
    }
}

TEST(ParameterLayout, FieldsAreContiguousAndOrdered) {
    ParameterLayout layout(4, 15);
    int expected = 0;
    for (const auto& f : layout.fields()) {
        EXPECT_EQ(f.offset, expected) << f.name;
        expected += f.size();
    }
    EXPECT_EQ(expected, layout.size());

    EXPECT_EQ(layout.offset(ParameterField::kGain), 0);
    EXPECT_EQ(layout.offset(ParameterField::kEgo), 8);
    EXPECT_EQ(layout.offset(ParameterField::kSocialVehicles, 1), 16);
    EXPECT_EQ(layout.offset(ParameterField::kReferencePath), 28);
    EXPECT_EQ(layout.offset(ParameterField::kImpatience), 73);
    EXPECT_EQ(layout.offset(ParameterField::kTargetSpeed), 74);
}

TEST(ParameterLayout, EncodePlacesEachRecord) {
    ParameterLayout layout(2, 3);

    ParameterSet p;
    p.gain.theta = 1.5;
    p.gain.speed = 2.5;
    p.ego = VehicleState{1, 2, 3, 4};
    p.socialVehicles = {VehicleState{5, 6, 7, 8}, VehicleState{9, 10, 11, 12}};
    p.reference = {{13, 14, 15}, {16, 17, 18}, {19, 20, 21}};
    p.impatience = 3;
    p.targetSpeed = 11;

    VecX z = layout.encode(p);
    ASSERT_EQ(z.size(), layout.size());
    EXPECT_EQ(z[0], 1.5);
    EXPECT_EQ(z[7], 2.5);
    EXPECT_EQ(z[8], 1);
    EXPECT_EQ(z[11], 4);
    EXPECT_EQ(z[12], 5);
    EXPECT_EQ(z[16], 9);
    EXPECT_EQ(z[19], 12);
    EXPECT_EQ(z[20], 13);
    EXPECT_EQ(z[28], 21);
    EXPECT_EQ(z[29], 3);
    EXPECT_EQ(z[30], 11);
}

TEST(ParameterLayout, DecodeRecoversParameterSet) {
    ParameterLayout layout(1, 2);
    VecX z = VecX::LinSpaced(layout.size(), 0, layout.size() - 1);

    ParameterSet p = layout.decode(z);
    EXPECT_EQ(p.gain.theta, 0);
    EXPECT_EQ(p.gain.speed, 7);
    EXPECT_EQ(p.ego.x, 8);
    EXPECT_EQ(p.ego.speed, 11);
    ASSERT_EQ(p.socialVehicles.size(), 1u);
    EXPECT_EQ(p.socialVehicles[0].heading, 14);
    ASSERT_EQ(p.reference.size(), 2u);
    EXPECT_EQ(p.reference[1].heading, 21);
    EXPECT_EQ(p.impatience, 22);
    EXPECT_EQ(p.targetSpeed, 23);

    EXPECT_TRUE(layout.encode(p).isApprox(z));
}
