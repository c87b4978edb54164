// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Receding-horizon trajectory cost over a control sequence, parameterised by
// one encoded world snapshot (see ParameterLayout).
//
// Decision variables:  u = [a_0, w_0, ..., a_{N-1}, w_{N-1}]
//   a_t ∈ [-1, 1]           normalised acceleration
//   w_t ∈ [-0.3π, 0.3π]     yaw rate
//
// Cost (ego rolled forward with the bicycle model, SVs at constant velocity):
//   J = Σ_t  min_k d_w(ref_k, ego_t)                         tracking
//     + Σ_{t≥1} Q_speed · v_target / t                        speed shaping
//     + Σ_t Σ_j Q_obstacle · max(-1, L² - |ego_t - sv_j,t|²)  obstacle
//     + Q_terminal · d_w(ref_last, ego_{N-1})                 terminal
//     + Σ_{t≥1} Q_u_accel·Δa² + Q_u_yaw_rate·Δw²              smoothness
//     - Q_impatience · (a_0 - 1) · impatience²                impatience
//
// The cost is written once as a template over the scalar type; the gradient
// comes from forward-mode autodiff over the same code.

#pragma once

#include <vector>

#include "recede/core/control_sequence.hpp"
#include "recede/core/parameter_layout.hpp"
#include "recede/core/types.hpp"
#include "recede/core/vehicle_state.hpp"

namespace recede {

struct FormulationConfig {
    int horizon{11};                 // N
    int socialVehicles{4};           // SV_N
    int referencePoints{15};         // WP_N
    Scalar ts{static_cast<Scalar>(0.1)};
    Scalar maxAccelCommand{1};
    Scalar maxYawRateCommand{static_cast<Scalar>(0.3) * constants::kPi};

    friend bool operator==(const FormulationConfig&, const FormulationConfig&) = default;
};

/// Individual cost contributions; total() is the optimised objective.
template <typename T>
struct CostBreakdownT {
    T tracking{0};
    T speedShaping{0};
    T obstacle{0};
    T terminal{0};
    T smoothness{0};
    T impatience{0};

    [[nodiscard]] T total() const {
        T sum = tracking + speedShaping;
        sum += obstacle;
        sum += terminal;
        sum += smoothness;
        sum += impatience;
        return sum;
    }
};

using CostBreakdown = CostBreakdownT<Scalar>;

class ProblemFormulation {
public:
    /// Throws std::invalid_argument when N < 2, SV_N < 0, WP_N < 1, ts <= 0
    /// or a command bound is not positive.
    explicit ProblemFormulation(FormulationConfig config = {});

    [[nodiscard]] const FormulationConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ParameterLayout& layout() const noexcept { return layout_; }
    [[nodiscard]] int horizon() const noexcept { return config_.horizon; }

    /// 2·N
    [[nodiscard]] int numDecisionVariables() const noexcept {
        return config_.horizon * ControlSequence::kControlDim;
    }

    /// Length of the parameter vector this formulation consumes.
    [[nodiscard]] int numParameters() const noexcept { return layout_.size(); }

    // ── Cost ─────────────────────────────────────────────────────────────────

    /// Cost contributions for any scalar type (Scalar or ADScalar).
    template <typename T>
    [[nodiscard]] CostBreakdownT<T> costTerms(const VecXT<T>& u,
                                              const ParameterSet& params) const;

    [[nodiscard]] Scalar cost(const VecX& u, const ParameterSet& params) const;

    /// ∂J/∂u by forward-mode autodiff.
    [[nodiscard]] VecX gradient(const VecX& u, const ParameterSet& params) const;

    /// Cost and gradient from a single autodiff pass.
    Scalar costAndGradient(const VecX& u, const ParameterSet& params, VecX& grad) const;

    /// Breakdown for a raw parameter vector; z must have numParameters() entries.
    [[nodiscard]] CostBreakdown breakdown(const VecX& u, const VecX& z) const;

    // ── Constraints ──────────────────────────────────────────────────────────

    /// Interleaved box bounds [-a_max, -w_max, -a_max, -w_max, ...]
    [[nodiscard]] VecX lowerBounds() const;
    [[nodiscard]] VecX upperBounds() const;

    // ── Rollout ──────────────────────────────────────────────────────────────

    /// Ego states after each of the N steps, using the same dynamics the
    /// cost evaluates.
    [[nodiscard]] std::vector<VehicleState> rollout(const VecX& u,
                                                    const VehicleState& ego) const;

private:
    FormulationConfig config_;
    ParameterLayout layout_;
};

}  // namespace recede

// Template implementation
#include "recede/formulation/problem_formulation_impl.hpp"
