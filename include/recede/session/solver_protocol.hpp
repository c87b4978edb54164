// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// JSON messages exchanged with the solver program, one request and one
// response per TCP connection.
//
// Requests:
//   {"Run":{"parameter":[...],"initial_guess":[...]}}   initial_guess optional
//   {"Ping":1}
//   {"Kill":1}
// Responses:
//   {"exit_status":"Converged","num_outer_iterations":7,"num_inner_iterations":412,
//    "cost":12.5,"solve_time_ms":3.1,"solution":[...]}
//   {"type":"Error","code":3003,"message":"..."}
//   {"Pong":1}

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "recede/core/result.hpp"
#include "recede/core/types.hpp"

namespace recede::session {

struct RunRequest {
    VecX parameters;
    std::optional<VecX> initialGuess;
};

struct PingRequest {};
struct KillRequest {};

using SolverRequest = std::variant<RunRequest, PingRequest, KillRequest>;

[[nodiscard]] std::string encodeRequest(const SolverRequest& request);

/// Throws std::runtime_error on malformed or unknown requests.
[[nodiscard]] SolverRequest decodeRequest(std::string_view text);

[[nodiscard]] std::string encodeResponse(const SolveResponse& response);
[[nodiscard]] std::string encodePong();

/// Throws std::runtime_error when `text` is not a solve response.
[[nodiscard]] SolveResponse decodeResponse(std::string_view text);

/// True when `text` is a well-formed pong.
[[nodiscard]] bool isPong(std::string_view text) noexcept;

}  // namespace recede::session
