// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// The solver program: serves one TrajectoryOptimizer over the JSON/TCP
// protocol until it receives a Kill request.

#pragma once

#include <string>
#include <string_view>

#include "recede/session/tcp.hpp"
#include "recede/solvers/trajectory_optimizer.hpp"

namespace recede::server {

class SolverServer {
public:
    /// Binds immediately; throws std::system_error when the port is taken.
    SolverServer(solvers::TrajectoryOptimizer optimizer, const std::string& host, int port);

    [[nodiscard]] int port() const noexcept { return listener_.port(); }

    /// Accept and answer connections until a Kill request arrives.
    void serve();

    /// Response text for one request; empty for Kill. Never throws on bad input.
    [[nodiscard]] std::string handle(std::string_view request);

    [[nodiscard]] bool stopRequested() const noexcept { return stop_requested_; }

private:
    solvers::TrajectoryOptimizer optimizer_;
    session::tcp::Listener listener_;
    bool stop_requested_{false};
};

}  // namespace recede::server
