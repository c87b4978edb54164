// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Solve outcome types shared by the solver program, its clients and the
// planning loop.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "recede/core/types.hpp"

namespace recede {

// ─── Exit Status (successful responses) ──────────────────────────────────────
enum class ExitStatus {
    kConverged,               // Tolerances met
    kNotConvergedIterations,  // Iteration budget exhausted, solution usable
    kNotConvergedOutOfTime,   // Time budget exhausted, solution usable
};

[[nodiscard]] constexpr std::string_view toString(ExitStatus s) noexcept {
    switch (s) {
        case ExitStatus::kConverged:              return "Converged";
        case ExitStatus::kNotConvergedIterations: return "NotConvergedIterations";
        case ExitStatus::kNotConvergedOutOfTime:  return "NotConvergedOutOfTime";
    }
    return "Unknown";
}

[[nodiscard]] std::optional<ExitStatus> exitStatusFromString(std::string_view s) noexcept;

// ─── Error Codes (failed responses) ──────────────────────────────────────────
enum class SolverErrorCode : int {
    kInvalidRequest        = 1000,  // Request could not be parsed
    kWrongInitialGuessSize = 1600,  // Warm start length != 2·N
    kSolveFailed           = 2000,  // Non-finite cost or solution
    kWrongParameterCount   = 3003,  // Parameter vector length != layout size
    kTransportFailure      = 4000,  // Connection or framing failure
    kSessionNotRunning     = 4001,  // No live solver behind the session
};

[[nodiscard]] constexpr std::string_view toString(SolverErrorCode c) noexcept {
    switch (c) {
        case SolverErrorCode::kInvalidRequest:        return "InvalidRequest";
        case SolverErrorCode::kWrongInitialGuessSize: return "WrongInitialGuessSize";
        case SolverErrorCode::kSolveFailed:           return "SolveFailed";
        case SolverErrorCode::kWrongParameterCount:   return "WrongParameterCount";
        case SolverErrorCode::kTransportFailure:      return "TransportFailure";
        case SolverErrorCode::kSessionNotRunning:     return "SessionNotRunning";
    }
    return "Unknown";
}

struct SolverError {
    SolverErrorCode code{SolverErrorCode::kSolveFailed};
    std::string message;
};

struct SolverSolution {
    VecX controls;                  // 2·N interleaved (accel, yaw_rate)
    ExitStatus exitStatus{ExitStatus::kConverged};
    int outerIterations{0};         // SQP iterations
    int innerIterations{0};         // Sum of QP iterations
    Scalar cost{0};
    double solveTimeMs{0};
};

// ─── SolveResponse ───────────────────────────────────────────────────────────
class SolveResponse {
public:
    [[nodiscard]] static SolveResponse ok(SolverSolution solution) {
        return SolveResponse(std::move(solution));
    }
    [[nodiscard]] static SolveResponse failure(SolverErrorCode code,
                                               std::string message) {
        return SolveResponse(SolverError{code, std::move(message)});
    }

    [[nodiscard]] bool isOk() const noexcept {
        return std::holds_alternative<SolverSolution>(data_);
    }

    /// Valid only when isOk().
    [[nodiscard]] const SolverSolution& solution() const {
        return std::get<SolverSolution>(data_);
    }

    /// Valid only when !isOk().
    [[nodiscard]] const SolverError& error() const {
        return std::get<SolverError>(data_);
    }

private:
    explicit SolveResponse(SolverSolution s) : data_(std::move(s)) {}
    explicit SolveResponse(SolverError e) : data_(std::move(e)) {}

    std::variant<SolverSolution, SolverError> data_;
};

}  // namespace recede
