// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Core type definitions for the Recede receding-horizon planner.

#pragma once

#include <Eigen/Core>
#include <Eigen/SparseCore>
#include <chrono>
#include <cstddef>
#include <limits>
#include <unsupported/Eigen/AutoDiff>

namespace recede {

// ─── Scalar Type ─────────────────────────────────────────────────────────────
#ifdef RECEDE_SCALAR_FLOAT
using Scalar = float;
#else
using Scalar = double;
#endif

// ─── Common Eigen Types ─────────────────────────────────────────────────────
using Vec2 = Eigen::Matrix<Scalar, 2, 1>;
using VecX = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;
using MatX = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;
using SpMatX = Eigen::SparseMatrix<Scalar>;  // CSC sparse matrix
using Triplet = Eigen::Triplet<Scalar>;

template <typename T>
using VecXT = Eigen::Matrix<T, Eigen::Dynamic, 1>;

// Forward-mode autodiff scalar; derivative length = number of decision variables
using ADScalar = Eigen::AutoDiffScalar<VecX>;

// ─── Index Type ──────────────────────────────────────────────────────────────
using Index = Eigen::Index;

// ─── Time ────────────────────────────────────────────────────────────────────
using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// ─── Constants ───────────────────────────────────────────────────────────────
namespace constants {
    inline constexpr Scalar kPi        = static_cast<Scalar>(3.14159265358979323846);
    inline constexpr Scalar kTwoPi     = static_cast<Scalar>(2.0) * kPi;
    inline constexpr Scalar kHalfPi    = kPi / static_cast<Scalar>(2.0);
    inline constexpr Scalar kEpsilon   = std::numeric_limits<Scalar>::epsilon();
    inline constexpr Scalar kInfinity  = std::numeric_limits<Scalar>::infinity();
}  // namespace constants

// ─── Utility Functions ───────────────────────────────────────────────────────

/// Clamp value to [lo, hi]
constexpr Scalar clamp(Scalar v, Scalar lo, Scalar hi) noexcept {
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

/// Squared value
constexpr Scalar sq(Scalar v) noexcept { return v * v; }

/// Value of a plain or autodiff scalar.
inline Scalar valueOf(Scalar v) noexcept { return v; }
inline Scalar valueOf(const ADScalar& v) { return v.value(); }

/// Constant with the same derivative length as `like` (zero derivatives).
/// Autodiff values built this way never mix derivative sizes.
inline Scalar constantLike(Scalar v, Scalar /*like*/) noexcept { return v; }
inline ADScalar constantLike(Scalar v, const ADScalar& like) {
    return ADScalar(v, VecX::Zero(like.derivatives().size()));
}

/// Branch-selecting min/max usable with both Scalar and ADScalar.
/// The derivative follows the selected branch.
template <typename T>
T minOf(const T& a, const T& b) {
    return (valueOf(b) < valueOf(a)) ? b : a;
}

template <typename T>
T maxOf(const T& a, const T& b) {
    return (valueOf(a) < valueOf(b)) ? b : a;
}

/// Clamp to [lo, hi]; a saturated result has zero derivative.
template <typename T>
T clampLike(const T& v, Scalar lo, Scalar hi) {
    if (valueOf(v) < lo) return constantLike(lo, v);
    if (valueOf(v) > hi) return constantLike(hi, v);
    return v;
}

}  // namespace recede
