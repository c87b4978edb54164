// SPDX-License-Identifier: BSD-3-Clause
#include "recede/planning/planner.hpp"

#include <spdlog/spdlog.h>

#include "recede/io/gain_file.hpp"
#include "recede/planning/parameter_encoder.hpp"

namespace recede::planning {

namespace {

PlannerOptions withGainFile(PlannerOptions options) {
    if (options.gainFile.empty()) return options;
    if (auto gain = io::loadGainIfPresent(options.gainFile)) {
        spdlog::info("Loaded gains from {}", options.gainFile.string());
        options.gain = *gain;
    }
    return options;
}

}  // namespace

Planner::Planner(PlannerOptions options)
    : options_(withGainFile(std::move(options))),
      formulation_(options_.formulation),
      session_(session::SolverSession::create(options_.formulation, options_.session)) {
    session_.start();
}

Planner::Planner(PlannerOptions options, session::SolverSession session)
    : options_(withGainFile(std::move(options))),
      formulation_(options_.formulation),
      session_(std::move(session)) {
    session_.start();
}

std::optional<Trajectory2D> Planner::plan(const Observation& obs) {
    const Vec2 position = obs.ego.position;
    const bool stationary =
        last_position_ && (position - *last_position_).norm() < options_.stationaryEpsilon;
    const int steps = stationary ? steps_without_moving_ + 1 : 0;

    // Loop state only advances once the observation has been encoded
    last_parameters_ = encodeObservation(obs, options_.gain, formulation_, steps);
    steps_without_moving_ = steps;
    last_position_ = position;

    SolveResponse response = session_.solve(last_parameters_, warm_start_);

    if (response.isOk() &&
        response.solution().controls.size() != formulation_.numDecisionVariables()) {
        response = SolveResponse::failure(
            SolverErrorCode::kTransportFailure,
            "solution has " + std::to_string(response.solution().controls.size()) +
                " entries");
    }

    std::optional<Trajectory2D> trajectory;
    if (response.isOk()) {
        const auto& solution = response.solution();
        trajectory = decodeTrajectory(formulation_, solution.controls, toModelState(obs.ego));
        warm_start_ = solution.controls;
        spdlog::debug("Tick solved: {} cost={:.4f} outer={} inner={} {:.2f} ms",
                      toString(solution.exitStatus), solution.cost, solution.outerIterations,
                      solution.innerIterations, solution.solveTimeMs);
    } else {
        const auto& error = response.error();
        spdlog::warn("Bad response from solver: code {} ({}): {}",
                     static_cast<int>(error.code), toString(error.code), error.message);
        warm_start_.reset();
        session_.reinitialize();
    }

    return trajectory;
}

}  // namespace recede::planning
