// SPDX-License-Identifier: BSD-3-Clause
#include "recede/session/artifact_store.hpp"

#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "recede/io/json.hpp"

namespace recede::session {

namespace fs = std::filesystem;
using io::JsonObject;
using io::JsonValue;

namespace {

JsonValue num(double v) { return JsonValue{v}; }

JsonValue manifestToJson(const SolverManifest& m) {
    const auto& f = m.key.formulation;
    const auto& s = m.settings;

    JsonObject formulation{
        {"N", num(f.horizon)},
        {"SV_N", num(f.socialVehicles)},
        {"WP_N", num(f.referencePoints)},
        {"ts", num(f.ts)},
        {"max_accel_command", num(f.maxAccelCommand)},
        {"max_yaw_rate_command", num(f.maxYawRateCommand)},
    };
    JsonObject settings{
        {"max_iterations", num(s.maxIterations)},
        {"tolerance", num(s.tolerance)},
        {"stagnation_tolerance", num(s.stagnationTolerance)},
        {"line_search_alpha", num(s.lineSearchAlpha)},
        {"line_search_beta", num(s.lineSearchBeta)},
        {"line_search_max_trials", num(s.lineSearchMaxTrials)},
        {"qp_max_iterations", num(s.qpMaxIterations)},
        {"time_limit_ms", num(s.timeLimitMs)},
    };
    JsonObject root{
        {"version", num(m.key.version)},
        {"solver_name", JsonValue{m.solverName}},
        {"build_mode", JsonValue{std::string(toString(m.buildMode))}},
        {"num_parameters", num(m.numParameters)},
        {"num_decision_variables", num(m.numDecisionVariables)},
        {"formulation", JsonValue{std::move(formulation)}},
        {"solver_settings", JsonValue{std::move(settings)}},
    };
    return JsonValue{std::move(root)};
}

int asInt(const JsonValue& v) { return static_cast<int>(v.asNumber()); }

SolverManifest manifestFromJson(const JsonValue& root) {
    SolverManifest m;
    m.key.version = asInt(root["version"]);
    m.solverName = root["solver_name"].asString();

    const auto& mode = root["build_mode"].asString();
    if (mode == "release") {
        m.buildMode = BuildMode::kRelease;
    } else if (mode == "debug") {
        m.buildMode = BuildMode::kDebug;
    } else {
        throw std::runtime_error("unknown build mode '" + mode + "'");
    }

    const auto& f = root["formulation"];
    m.key.formulation.horizon = asInt(f["N"]);
    m.key.formulation.socialVehicles = asInt(f["SV_N"]);
    m.key.formulation.referencePoints = asInt(f["WP_N"]);
    m.key.formulation.ts = static_cast<Scalar>(f["ts"].asNumber());
    m.key.formulation.maxAccelCommand = static_cast<Scalar>(f["max_accel_command"].asNumber());
    m.key.formulation.maxYawRateCommand =
        static_cast<Scalar>(f["max_yaw_rate_command"].asNumber());

    const auto& s = root["solver_settings"];
    m.settings.maxIterations = asInt(s["max_iterations"]);
    m.settings.tolerance = static_cast<Scalar>(s["tolerance"].asNumber());
    m.settings.stagnationTolerance = static_cast<Scalar>(s["stagnation_tolerance"].asNumber());
    m.settings.lineSearchAlpha = static_cast<Scalar>(s["line_search_alpha"].asNumber());
    m.settings.lineSearchBeta = static_cast<Scalar>(s["line_search_beta"].asNumber());
    m.settings.lineSearchMaxTrials = asInt(s["line_search_max_trials"]);
    m.settings.qpMaxIterations = asInt(s["qp_max_iterations"]);
    m.settings.timeLimitMs = s["time_limit_ms"].asNumber();

    m.numParameters = asInt(root["num_parameters"]);
    m.numDecisionVariables = asInt(root["num_decision_variables"]);
    return m;
}

}  // namespace

std::string ArtifactKey::paramsString() const {
    return std::to_string(formulation.horizon) + "_" +
           std::to_string(formulation.socialVehicles) + "_" +
           std::to_string(formulation.referencePoints) + "_" +
           io::formatNumber(static_cast<double>(formulation.ts));
}

ArtifactStore::ArtifactStore(fs::path root, std::string baseName)
    : root_(std::move(root)), base_name_(std::move(baseName)) {}

std::string ArtifactStore::solverName(const ArtifactKey& key) const {
    return base_name_ + "_v" + std::to_string(key.version);
}

fs::path ArtifactStore::artifactDirectory(const ArtifactKey& key) const {
    return root_ / key.paramsString() / solverName(key);
}

bool ArtifactStore::contains(const ArtifactKey& key) const {
    std::error_code ec;
    return fs::is_regular_file(artifactDirectory(key) / kManifestFile, ec);
}

Artifact ArtifactStore::buildOrReuse(const ArtifactKey& key, BuildMode mode,
                                     const solvers::SQPSettings& settings) const {
    Artifact artifact;
    artifact.directory = artifactDirectory(key);

    if (contains(key)) {
        artifact.manifest = readManifest(artifact.directory);
        if (!(artifact.manifest.key == key)) {
            throw std::runtime_error("cached artifact " + artifact.directory.string() +
                                     " was built for a different formulation");
        }
        artifact.reused = true;
        spdlog::info("Reusing solver artifact {}", artifact.directory.string());
        if (!(artifact.manifest.settings == settings)) {
            spdlog::warn("Solver artifact {} keeps the settings it was built with; "
                         "the requested solver settings are ignored",
                         artifact.directory.string());
        }
        return artifact;
    }

    // Validates the structure before anything is written
    const ProblemFormulation formulation(key.formulation);

    SolverManifest& m = artifact.manifest;
    m.key = key;
    m.solverName = solverName(key);
    m.buildMode = mode;
    m.settings = settings;
    m.numParameters = formulation.numParameters();
    m.numDecisionVariables = formulation.numDecisionVariables();

    std::error_code ec;
    fs::create_directories(artifact.directory, ec);
    if (ec) {
        throw std::runtime_error("cannot create " + artifact.directory.string() + ": " +
                                 ec.message());
    }

    // Write then rename so a crashed build never leaves a partial manifest
    const fs::path target = artifact.directory / kManifestFile;
    const fs::path staging = artifact.directory / (std::string(kManifestFile) + ".tmp");
    {
        std::ofstream ofs(staging);
        if (!ofs) throw std::runtime_error("cannot write " + staging.string());
        io::writeJson(ofs, manifestToJson(m));
        ofs << '\n';
        if (!ofs) throw std::runtime_error("cannot write " + staging.string());
    }
    fs::rename(staging, target, ec);
    if (ec) {
        throw std::runtime_error("cannot install " + target.string() + ": " + ec.message());
    }

    spdlog::info("Built solver artifact {} ({} mode)", artifact.directory.string(),
                 toString(mode));
    return artifact;
}

SolverManifest ArtifactStore::readManifest(const fs::path& directory) {
    const fs::path path = directory / kManifestFile;
    try {
        return manifestFromJson(io::parseJson(io::readTextFile(path)));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("invalid solver manifest " + path.string() + ": " + e.what());
    }
}

}  // namespace recede::session
