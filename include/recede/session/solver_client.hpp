// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Connection to one running solver. SolverSession drives the lifecycle;
// implementations only know how to start, probe, stop and call a solver.

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "recede/core/result.hpp"
#include "recede/core/types.hpp"
#include "recede/session/artifact_store.hpp"
#include "recede/session/process.hpp"
#include "recede/solvers/trajectory_optimizer.hpp"

namespace recede::session {

class SolverClient {
public:
    using Ptr = std::unique_ptr<SolverClient>;

    virtual ~SolverClient() = default;

    /// Bring the solver up. Throws std::runtime_error (or a subclass) when it
    /// does not become responsive.
    virtual void start() = 0;

    /// Whether the solver process/service is still alive.
    [[nodiscard]] virtual bool isRunning() = 0;

    /// Synchronous responsiveness probe.
    [[nodiscard]] virtual bool ping() = 0;

    /// Ask the solver to terminate; returns without waiting.
    virtual void requestStop() = 0;

    /// Terminate immediately.
    virtual void forceKill() = 0;

    /// Blocking solve. Transport problems come back as kTransportFailure.
    [[nodiscard]] virtual SolveResponse call(const VecX& parameters,
                                             const std::optional<VecX>& initialGuess) = 0;

    /// Human-readable location, e.g. "127.0.0.1:40123"
    [[nodiscard]] virtual std::string endpoint() const = 0;
};

// ─── TCP client for the solver program ──────────────────────────────────────
struct TcpClientOptions {
    std::string executable{"recede_solver_server"};
    std::filesystem::path artifactDirectory;
    std::string host{"127.0.0.1"};
    std::chrono::milliseconds requestTimeout{10000};
    std::chrono::milliseconds startupTimeout{5000};
    std::chrono::milliseconds startupPollInterval{20};
};

/// Spawns the solver program on a free port and talks the JSON protocol.
class TcpSolverClient : public SolverClient {
public:
    explicit TcpSolverClient(TcpClientOptions options);

    void start() override;
    [[nodiscard]] bool isRunning() override;
    [[nodiscard]] bool ping() override;
    void requestStop() override;
    void forceKill() override;
    [[nodiscard]] SolveResponse call(const VecX& parameters,
                                     const std::optional<VecX>& initialGuess) override;
    [[nodiscard]] std::string endpoint() const override;

    [[nodiscard]] int port() const noexcept { return port_; }

private:
    TcpClientOptions options_;
    ChildProcess process_;
    int port_{0};
};

// ─── In-process client ──────────────────────────────────────────────────────
/// Runs the solver program core inside the calling process.
class InProcessSolverClient : public SolverClient {
public:
    InProcessSolverClient(FormulationConfig formulation, solvers::SQPSettings settings = {});

    void start() override;
    [[nodiscard]] bool isRunning() override { return optimizer_.has_value(); }
    [[nodiscard]] bool ping() override { return optimizer_.has_value(); }
    void requestStop() override { optimizer_.reset(); }
    void forceKill() override { optimizer_.reset(); }
    [[nodiscard]] SolveResponse call(const VecX& parameters,
                                     const std::optional<VecX>& initialGuess) override;
    [[nodiscard]] std::string endpoint() const override { return "in-process"; }

private:
    FormulationConfig formulation_;
    solvers::SQPSettings settings_;
    std::optional<solvers::TrajectoryOptimizer> optimizer_;
};

}  // namespace recede::session
