// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Build-or-reuse cache of solver artifacts. An artifact lives at
//   <root>/<N>_<SV_N>_<WP_N>_<ts>/<name>_v<version>/manifest.json
// and records everything the solver program needs to rebuild the exact
// formulation it was built for.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "recede/formulation/problem_formulation.hpp"
#include "recede/solvers/sqp.hpp"

namespace recede::session {

/// Bumped whenever the formulation changes shape or meaning.
inline constexpr int kSolverVersion = 175;

enum class BuildMode { kRelease, kDebug };

[[nodiscard]] constexpr std::string_view toString(BuildMode m) noexcept {
    return m == BuildMode::kDebug ? "debug" : "release";
}

struct ArtifactKey {
    int version{kSolverVersion};
    FormulationConfig formulation;

    /// "<N>_<SV_N>_<WP_N>_<ts>", ts in shortest round-trip form, e.g. "11_4_15_0.1"
    [[nodiscard]] std::string paramsString() const;

    friend bool operator==(const ArtifactKey&, const ArtifactKey&) = default;
};

struct SolverManifest {
    ArtifactKey key;
    std::string solverName;          // e.g. "trajectory_optimizer_v175"
    BuildMode buildMode{BuildMode::kRelease};
    solvers::SQPSettings settings;
    int numParameters{0};
    int numDecisionVariables{0};
};

struct Artifact {
    std::filesystem::path directory;
    SolverManifest manifest;
    bool reused{false};
};

class ArtifactStore {
public:
    ArtifactStore(std::filesystem::path root, std::string baseName);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// "<baseName>_v<version>"
    [[nodiscard]] std::string solverName(const ArtifactKey& key) const;

    [[nodiscard]] std::filesystem::path artifactDirectory(const ArtifactKey& key) const;

    [[nodiscard]] bool contains(const ArtifactKey& key) const;

    /// Reuse the artifact for `key` unchanged when present, build it
    /// otherwise. A reused artifact keeps its recorded solver settings; a
    /// warning is logged when they differ from `settings`. Throws std::invalid_argument for an invalid formulation
    /// and std::runtime_error on I/O failure or a corrupt cached manifest.
    [[nodiscard]] Artifact buildOrReuse(const ArtifactKey& key, BuildMode mode,
                                        const solvers::SQPSettings& settings) const;

    /// Throws std::runtime_error when the manifest is missing or malformed.
    [[nodiscard]] static SolverManifest readManifest(const std::filesystem::path& directory);

    static constexpr const char* kManifestFile = "manifest.json";

private:
    std::filesystem::path root_;
    std::string base_name_;
};

}  // namespace recede::session
