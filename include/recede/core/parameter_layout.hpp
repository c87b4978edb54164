// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Layout of the flat parameter vector shared by the observation encoder and
// the problem formulation:
//
//   [gain(8), ego(4), sv_1..sv_SV_N(4 each), ref_1..ref_WP_N(3 each),
//    impatience(1), target_speed(1)]
//
// Field widths are fixed at compile time by the record types; only the
// entry counts of the social-vehicle and reference blocks vary per layout.

#pragma once

#include <array>
#include <span>
#include <string_view>
#include <vector>

#include "recede/core/gain.hpp"
#include "recede/core/reference_point.hpp"
#include "recede/core/types.hpp"
#include "recede/core/vehicle_state.hpp"

namespace recede {

enum class ParameterField : int {
    kGain = 0,
    kEgo,
    kSocialVehicles,
    kReferencePath,
    kImpatience,
    kTargetSpeed,
};

inline constexpr std::size_t kNumParameterFields = 6;

struct FieldSpec {
    ParameterField field;
    std::string_view name;
    int width;        // scalars per entry
    int count;        // number of entries
    int offset;       // index of the first scalar

    [[nodiscard]] constexpr int size() const noexcept { return width * count; }
};

namespace layout {
    inline constexpr int kGainWidth       = static_cast<int>(Gain::kDof);
    inline constexpr int kVehicleWidth    = VehicleState::kDof;
    inline constexpr int kReferenceWidth  = ReferencePoint::kDof;
    inline constexpr int kNumberWidth     = 1;

    static_assert(kGainWidth == 8);
    static_assert(kVehicleWidth == 4);
    static_assert(kReferenceWidth == 3);
}  // namespace layout

/// Decoded contents of a parameter vector.
struct ParameterSet {
    Gain gain;
    VehicleState ego;
    std::vector<VehicleState> socialVehicles;
    std::vector<ReferencePoint> reference;
    Scalar impatience{0};
    Scalar targetSpeed{0};
};

class ParameterLayout {
public:
    ParameterLayout(int socialVehicles, int referencePoints);

    /// 8 + 4 + 4·SV_N + 3·WP_N + 2
    [[nodiscard]] static constexpr int dimension(int socialVehicles,
                                                 int referencePoints) noexcept {
        return layout::kGainWidth + layout::kVehicleWidth
             + layout::kVehicleWidth * socialVehicles
             + layout::kReferenceWidth * referencePoints
             + 2 * layout::kNumberWidth;
    }

    [[nodiscard]] int size() const noexcept { return size_; }
    [[nodiscard]] int socialVehicles() const noexcept { return socialVehicles_; }
    [[nodiscard]] int referencePoints() const noexcept { return referencePoints_; }

    [[nodiscard]] const FieldSpec& field(ParameterField f) const noexcept {
        return fields_[static_cast<std::size_t>(f)];
    }

    /// Index of the first scalar of entry `entry` within field `f`.
    [[nodiscard]] int offset(ParameterField f, int entry = 0) const noexcept {
        const auto& spec = field(f);
        return spec.offset + entry * spec.width;
    }

    [[nodiscard]] std::span<const FieldSpec> fields() const noexcept { return fields_; }

    /// Flatten a ParameterSet. Entry counts must match the layout.
    [[nodiscard]] VecX encode(const ParameterSet& params) const;

    /// Parse a parameter vector. Its length must equal size().
    [[nodiscard]] ParameterSet decode(const VecX& z) const;

private:
    int socialVehicles_;
    int referencePoints_;
    int size_{0};
    std::array<FieldSpec, kNumParameterFields> fields_;
};

}  // namespace recede
