// SPDX-License-Identifier: BSD-3-Clause
#include "recede/server/solver_server.hpp"

#include <spdlog/spdlog.h>
#include <system_error>

#include "recede/session/solver_protocol.hpp"

namespace recede::server {

SolverServer::SolverServer(solvers::TrajectoryOptimizer optimizer, const std::string& host,
                           int port)
    : optimizer_(std::move(optimizer)), listener_(host, port) {}

std::string SolverServer::handle(std::string_view request) {
    session::SolverRequest decoded;
    try {
        decoded = session::decodeRequest(request);
    } catch (const std::runtime_error& e) {
        spdlog::warn("Rejected request: {}", e.what());
        return session::encodeResponse(
            SolveResponse::failure(SolverErrorCode::kInvalidRequest, e.what()));
    }

    if (std::holds_alternative<session::PingRequest>(decoded)) {
        return session::encodePong();
    }
    if (std::holds_alternative<session::KillRequest>(decoded)) {
        stop_requested_ = true;
        return {};
    }

    const auto& run = std::get<session::RunRequest>(decoded);
    SolveResponse response = optimizer_.solve(run.parameters, run.initialGuess);
    if (!response.isOk()) {
        spdlog::warn("Solve failed with code {}: {}", static_cast<int>(response.error().code),
                     response.error().message);
    } else {
        spdlog::debug("Solved in {:.2f} ms ({} outer / {} inner iterations)",
                      response.solution().solveTimeMs, response.solution().outerIterations,
                      response.solution().innerIterations);
    }
    return session::encodeResponse(response);
}

void SolverServer::serve() {
    spdlog::info("Solver listening on port {}", port());
    while (!stop_requested_) {
        session::tcp::Socket conn = listener_.accept();
        try {
            std::string reply = handle(conn.readToEnd());
            if (!reply.empty()) conn.writeAll(reply);
        } catch (const std::system_error& e) {
            spdlog::warn("Connection dropped: {}", e.what());
        }
    }
    spdlog::info("Solver on port {} shutting down", port());
}

}  // namespace recede::server
