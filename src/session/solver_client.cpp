// SPDX-License-Identifier: BSD-3-Clause
#include "recede/session/solver_client.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "recede/session/solver_protocol.hpp"
#include "recede/session/tcp.hpp"

namespace recede::session {

// ─── TcpSolverClient ─────────────────────────────────────────────────────────

TcpSolverClient::TcpSolverClient(TcpClientOptions options)
    : options_(std::move(options)) {}

void TcpSolverClient::start() {
    port_ = tcp::findFreePort(options_.host);
    process_ = ChildProcess::spawn(options_.executable,
                                   {"--artifact", options_.artifactDirectory.string(),
                                    "--host", options_.host,
                                    "--port", std::to_string(port_)});

    const auto deadline = Clock::now() + options_.startupTimeout;
    while (Clock::now() < deadline) {
        if (!process_.isRunning()) {
            throw std::runtime_error(
                "solver program exited during startup (code " +
                std::to_string(process_.exitCode().value_or(-1)) + ")");
        }
        if (ping()) return;
        std::this_thread::sleep_for(options_.startupPollInterval);
    }

    process_.kill();
    throw std::runtime_error("solver program did not answer on " + endpoint() +
                             " within the startup timeout");
}

bool TcpSolverClient::isRunning() {
    return process_.isRunning();
}

bool TcpSolverClient::ping() {
    try {
        return isPong(tcp::exchange(options_.host, port_, encodeRequest(PingRequest{}),
                                    options_.startupPollInterval * 10));
    } catch (const std::system_error&) {
        return false;
    }
}

void TcpSolverClient::requestStop() {
    if (!process_.isRunning()) return;
    try {
        (void)tcp::exchange(options_.host, port_, encodeRequest(KillRequest{}),
                            options_.requestTimeout);
    } catch (const std::system_error& e) {
        spdlog::debug("Kill request to {} failed ({}), sending SIGTERM", endpoint(), e.what());
        process_.terminate();
    }
}

void TcpSolverClient::forceKill() {
    process_.kill();
}

SolveResponse TcpSolverClient::call(const VecX& parameters,
                                    const std::optional<VecX>& initialGuess) {
    std::string reply;
    try {
        reply = tcp::exchange(options_.host, port_,
                              encodeRequest(RunRequest{parameters, initialGuess}),
                              options_.requestTimeout);
    } catch (const std::system_error& e) {
        return SolveResponse::failure(SolverErrorCode::kTransportFailure, e.what());
    }

    try {
        return decodeResponse(reply);
    } catch (const std::runtime_error& e) {
        return SolveResponse::failure(SolverErrorCode::kTransportFailure,
                                      std::string("malformed response: ") + e.what());
    }
}

std::string TcpSolverClient::endpoint() const {
    return options_.host + ":" + std::to_string(port_);
}

// ─── InProcessSolverClient ───────────────────────────────────────────────────

InProcessSolverClient::InProcessSolverClient(FormulationConfig formulation,
                                             solvers::SQPSettings settings)
    : formulation_(formulation), settings_(std::move(settings)) {}

void InProcessSolverClient::start() {
    optimizer_.emplace(formulation_, settings_);
}

SolveResponse InProcessSolverClient::call(const VecX& parameters,
                                          const std::optional<VecX>& initialGuess) {
    if (!optimizer_) {
        return SolveResponse::failure(SolverErrorCode::kSessionNotRunning,
                                      "in-process solver is not started");
    }
    return optimizer_->solve(parameters, initialGuess);
}

}  // namespace recede::session
