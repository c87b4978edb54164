// SPDX-License-Identifier: BSD-3-Clause
#include "recede/core/parameter_layout.hpp"

#include <cassert>

namespace recede {

ParameterLayout::ParameterLayout(int socialVehicles, int referencePoints)
    : socialVehicles_(socialVehicles), referencePoints_(referencePoints) {
    const std::array<FieldSpec, kNumParameterFields> specs{{
        {ParameterField::kGain, "gain", layout::kGainWidth, 1, 0},
        {ParameterField::kEgo, "ego", layout::kVehicleWidth, 1, 0},
        {ParameterField::kSocialVehicles, "social_vehicles",
         layout::kVehicleWidth, socialVehicles, 0},
        {ParameterField::kReferencePath, "reference_path",
         layout::kReferenceWidth, referencePoints, 0},
        {ParameterField::kImpatience, "impatience", layout::kNumberWidth, 1, 0},
        {ParameterField::kTargetSpeed, "target_speed", layout::kNumberWidth, 1, 0},
    }};

    int position = 0;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        fields_[i] = specs[i];
        fields_[i].offset = position;
        position += specs[i].size();
    }
    size_ = position;
    assert(size_ == dimension(socialVehicles, referencePoints));
}

VecX ParameterLayout::encode(const ParameterSet& params) const {
    assert(static_cast<int>(params.socialVehicles.size()) == socialVehicles_);
    assert(static_cast<int>(params.reference.size()) == referencePoints_);

    VecX z(size_);

    const auto gains = params.gain.toArray();
    int g0 = offset(ParameterField::kGain);
    for (std::size_t i = 0; i < gains.size(); ++i)
        z[g0 + static_cast<int>(i)] = gains[i];

    auto writeVehicle = [&z](int at, const VehicleState& v) {
        z[at]     = v.x;
        z[at + 1] = v.y;
        z[at + 2] = v.heading;
        z[at + 3] = v.speed;
    };

    writeVehicle(offset(ParameterField::kEgo), params.ego);
    for (int i = 0; i < socialVehicles_; ++i) {
        writeVehicle(offset(ParameterField::kSocialVehicles, i),
                     params.socialVehicles[static_cast<std::size_t>(i)]);
    }

    for (int i = 0; i < referencePoints_; ++i) {
        const auto& ref = params.reference[static_cast<std::size_t>(i)];
        int at = offset(ParameterField::kReferencePath, i);
        z[at]     = ref.x;
        z[at + 1] = ref.y;
        z[at + 2] = ref.heading;
    }

    z[offset(ParameterField::kImpatience)]  = params.impatience;
    z[offset(ParameterField::kTargetSpeed)] = params.targetSpeed;
    return z;
}

ParameterSet ParameterLayout::decode(const VecX& z) const {
    assert(z.size() == size_);

    ParameterSet params;

    std::array<Scalar, Gain::kDof> gains{};
    int g0 = offset(ParameterField::kGain);
    for (std::size_t i = 0; i < gains.size(); ++i)
        gains[i] = z[g0 + static_cast<int>(i)];
    params.gain = Gain::fromArray(gains);

    auto readVehicle = [&z](int at) {
        return VehicleState{z[at], z[at + 1], z[at + 2], z[at + 3]};
    };

    params.ego = readVehicle(offset(ParameterField::kEgo));
    params.socialVehicles.reserve(static_cast<std::size_t>(socialVehicles_));
    for (int i = 0; i < socialVehicles_; ++i)
        params.socialVehicles.push_back(
            readVehicle(offset(ParameterField::kSocialVehicles, i)));

    params.reference.reserve(static_cast<std::size_t>(referencePoints_));
    for (int i = 0; i < referencePoints_; ++i) {
        int at = offset(ParameterField::kReferencePath, i);
        params.reference.push_back({z[at], z[at + 1], z[at + 2]});
    }

    params.impatience  = z[offset(ParameterField::kImpatience)];
    params.targetSpeed = z[offset(ParameterField::kTargetSpeed)];
    return params;
}

}  // namespace recede
