// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// recede_solver_server --artifact <dir> --port <port> [--host <ipv4>]
//
// Launched by SolverSession; serves the formulation recorded in the
// artifact manifest.

#include <cstdlib>
#include <exception>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

#include "recede/server/solver_server.hpp"
#include "recede/session/artifact_store.hpp"

namespace {

struct Arguments {
    std::string artifact;
    std::string host{"127.0.0.1"};
    int port{-1};
};

[[noreturn]] void usage(const char* argv0) {
    spdlog::error("usage: {} --artifact <dir> --port <port> [--host <ipv4>]", argv0);
    std::exit(2);
}

Arguments parseArguments(int argc, char** argv) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string_view flag = argv[i];
        if (i + 1 >= argc) usage(argv[0]);
        std::string value = argv[++i];
        if (flag == "--artifact") {
            args.artifact = value;
        } else if (flag == "--host") {
            args.host = value;
        } else if (flag == "--port") {
            args.port = std::stoi(value);
        } else {
            usage(argv[0]);
        }
    }
    if (args.artifact.empty() || args.port < 0) usage(argv[0]);
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const Arguments args = parseArguments(argc, argv);
        const auto manifest = recede::session::ArtifactStore::readManifest(args.artifact);
        if (manifest.buildMode == recede::session::BuildMode::kDebug) {
            spdlog::set_level(spdlog::level::debug);
        }

        spdlog::info("Loaded {} ({})", manifest.solverName, manifest.key.paramsString());
        recede::server::SolverServer server(
            recede::solvers::TrajectoryOptimizer(manifest.key.formulation, manifest.settings),
            args.host, args.port);
        server.serve();
    } catch (const std::exception& e) {
        spdlog::error("Solver server failed: {}", e.what());
        return 1;
    }
    return 0;
}
