// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Lifecycle of the external solver:
//
//   Uninitialized ──start──▶ Starting ──▶ Running ──stop──▶ Stopped
//                               ▲            │
//                               └─reinitialize┘
//
// start() retries up to SessionOptions::startRetries times with a fresh
// client per attempt; exhausting them raises SessionStartError. stop()
// polls liveness for at most stopMaxPolls × stopPollInterval and then
// force-kills. A session is owned and driven by a single thread.

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "recede/core/result.hpp"
#include "recede/formulation/problem_formulation.hpp"
#include "recede/session/artifact_store.hpp"
#include "recede/session/solver_client.hpp"
#include "recede/solvers/sqp.hpp"

namespace recede::session {

enum class SessionState { kUninitialized, kStarting, kRunning, kStopped };

[[nodiscard]] constexpr std::string_view toString(SessionState s) noexcept {
    switch (s) {
        case SessionState::kUninitialized: return "Uninitialized";
        case SessionState::kStarting:      return "Starting";
        case SessionState::kRunning:       return "Running";
        case SessionState::kStopped:       return "Stopped";
    }
    return "Unknown";
}

enum class SolverBackend {
    kProcess,    // Solver program in a child process, reached over TCP
    kInProcess,  // Solver core called directly
};

struct SessionOptions {
    int startRetries{5};
    std::chrono::milliseconds stopPollInterval{100};
    int stopMaxPolls{50};
    SolverBackend backend{SolverBackend::kProcess};
    std::filesystem::path buildDirectory{"recede_build"};
    std::string solverName{"trajectory_optimizer"};
    BuildMode buildMode{BuildMode::kRelease};
    std::string serverExecutable{"recede_solver_server"};
    std::chrono::milliseconds requestTimeout{10000};
    std::chrono::milliseconds startupTimeout{5000};
    solvers::SQPSettings solverSettings;
};

/// The solver could not be brought up within the retry budget.
class SessionStartError : public std::runtime_error {
public:
    SessionStartError(const std::string& what, int attempts)
        : std::runtime_error(what), attempts_(attempts) {}

    [[nodiscard]] int attempts() const noexcept { return attempts_; }

private:
    int attempts_;
};

class SolverSession {
public:
    using ClientFactory = std::function<SolverClient::Ptr()>;

    SolverSession(ClientFactory factory, SessionOptions options = {});

    /// Session for `formulation` with the backend selected in `options`.
    /// The process backend builds or reuses the solver artifact first.
    [[nodiscard]] static SolverSession create(const FormulationConfig& formulation,
                                              SessionOptions options = {});

    /// Stops the solver if it is still running.
    ~SolverSession();

    SolverSession(const SolverSession&) = delete;
    SolverSession& operator=(const SolverSession&) = delete;
    SolverSession(SolverSession&& other) noexcept = default;
    SolverSession& operator=(SolverSession&& other) = delete;

    /// Throws SessionStartError when every attempt fails. No-op when running.
    void start();

    /// Orderly shutdown; no-op unless a client is live.
    void stop();

    /// stop() then start().
    void reinitialize();

    /// Running and responsive.
    [[nodiscard]] bool healthCheck();

    /// Blocking solve; kSessionNotRunning when the session is not Running.
    [[nodiscard]] SolveResponse solve(const VecX& parameters,
                                      const std::optional<VecX>& warmStart);

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] const SessionOptions& options() const noexcept { return options_; }

    /// Endpoint of the live client, empty when none.
    [[nodiscard]] std::string endpoint() const;

    /// Attempts used by the most recent start().
    [[nodiscard]] int lastStartAttempts() const noexcept { return last_start_attempts_; }

    /// Artifact the process backend was created from.
    [[nodiscard]] const std::optional<Artifact>& artifact() const noexcept { return artifact_; }

private:
    ClientFactory factory_;
    SessionOptions options_;
    SolverClient::Ptr client_;
    SessionState state_{SessionState::kUninitialized};
    int last_start_attempts_{0};
    std::optional<Artifact> artifact_;
};

}  // namespace recede::session
