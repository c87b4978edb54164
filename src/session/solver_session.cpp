// SPDX-License-Identifier: BSD-3-Clause
#include "recede/session/solver_session.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace recede::session {

SolverSession::SolverSession(ClientFactory factory, SessionOptions options)
    : factory_(std::move(factory)), options_(std::move(options)) {}

SolverSession SolverSession::create(const FormulationConfig& formulation,
                                    SessionOptions options) {
    if (options.backend == SolverBackend::kInProcess) {
        const auto settings = options.solverSettings;
        auto factory = [formulation, settings]() -> SolverClient::Ptr {
            return std::make_unique<InProcessSolverClient>(formulation, settings);
        };
        return SolverSession(std::move(factory), std::move(options));
    }

    const ArtifactStore store(options.buildDirectory, options.solverName);
    ArtifactKey key;
    key.formulation = formulation;
    Artifact artifact = store.buildOrReuse(key, options.buildMode, options.solverSettings);

    TcpClientOptions tcp;
    tcp.executable = options.serverExecutable;
    tcp.artifactDirectory = artifact.directory;
    tcp.requestTimeout = options.requestTimeout;
    tcp.startupTimeout = options.startupTimeout;

    SolverSession session([tcp]() -> SolverClient::Ptr {
        return std::make_unique<TcpSolverClient>(tcp);
    }, std::move(options));
    session.artifact_ = std::move(artifact);
    return session;
}

SolverSession::~SolverSession() {
    stop();
}

void SolverSession::start() {
    if (state_ == SessionState::kRunning && client_) return;

    state_ = SessionState::kStarting;
    const int retries = std::max(1, options_.startRetries);

    for (int attempt = 1; attempt <= retries; ++attempt) {
        last_start_attempts_ = attempt;
        try {
            SolverClient::Ptr client = factory_();
            client->start();
            client_ = std::move(client);
            state_ = SessionState::kRunning;
            spdlog::info("Solver session running at {} (attempt {}/{})",
                         client_->endpoint(), attempt, retries);
            return;
        } catch (const std::runtime_error& e) {
            spdlog::warn("Solver start attempt {}/{} failed: {}", attempt, retries, e.what());
        }
    }

    state_ = SessionState::kStopped;
    throw SessionStartError("solver did not start after " + std::to_string(retries) +
                                " attempts",
                            retries);
}

void SolverSession::stop() {
    if (!client_) return;

    if (client_->isRunning()) {
        client_->requestStop();

        int polls = 0;
        while (client_->isRunning() && polls < options_.stopMaxPolls) {
            std::this_thread::sleep_for(options_.stopPollInterval);
            ++polls;
        }

        if (client_->isRunning()) {
            spdlog::warn("Solver at {} still alive after {} polls, killing it",
                         client_->endpoint(), options_.stopMaxPolls);
            client_->forceKill();
        }
    }

    spdlog::info("Solver session at {} stopped", client_->endpoint());
    client_.reset();
    state_ = SessionState::kStopped;
}

void SolverSession::reinitialize() {
    stop();
    start();
}

bool SolverSession::healthCheck() {
    return state_ == SessionState::kRunning && client_ && client_->isRunning() &&
           client_->ping();
}

SolveResponse SolverSession::solve(const VecX& parameters,
                                   const std::optional<VecX>& warmStart) {
    if (state_ != SessionState::kRunning || !client_) {
        return SolveResponse::failure(SolverErrorCode::kSessionNotRunning,
                                      std::string("solver session is ") +
                                          std::string(toString(state_)));
    }
    return client_->call(parameters, warmStart);
}

std::string SolverSession::endpoint() const {
    return client_ ? client_->endpoint() : std::string{};
}

}  // namespace recede::session
