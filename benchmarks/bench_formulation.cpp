// SPDX-License-Identifier: BSD-3-Clause
#include <benchmark/benchmark.h>
#include "recede/recede.hpp"

using namespace recede;

namespace {

planning::Observation busyRoad(int neighbors) {
    planning::Observation obs;
    obs.ego = {Vec2(0, 0), 0, 6};
    for (int i = 0; i < neighbors; ++i) {
        obs.neighbors.push_back({Vec2((i % 2 == 0) ? 0 : 3.5, 6.0 + 4.0 * i), 0, 4});
    }
    planning::WaypointPath road;
    for (int i = 1; i <= 40; ++i) road.push_back({Vec2(0, static_cast<Scalar>(i)), 0, 10});
    obs.waypointPaths.push_back(road);
    return obs;
}

}  // namespace

static void BM_Cost(benchmark::State& state) {
    ProblemFormulation formulation;
    ParameterSet p = planning::buildParameterSet(busyRoad(4), Gain{}, formulation.config(), 0);
    VecX u = VecX::Constant(formulation.numDecisionVariables(), 0.1);

    for (auto _ : state) {
        benchmark::DoNotOptimize(formulation.cost(u, p));
    }
}
BENCHMARK(BM_Cost);

static void BM_CostAndGradient(benchmark::State& state) {
    FormulationConfig cfg;
    cfg.horizon = static_cast<int>(state.range(0));
    ProblemFormulation formulation(cfg);
    ParameterSet p = planning::buildParameterSet(busyRoad(4), Gain{}, cfg, 0);
    VecX u = VecX::Constant(formulation.numDecisionVariables(), 0.1);
    VecX grad;

    for (auto _ : state) {
        benchmark::DoNotOptimize(formulation.costAndGradient(u, p, grad));
    }
    state.SetComplexityN(cfg.horizon);
}
BENCHMARK(BM_CostAndGradient)->DenseRange(5, 25, 5)->Complexity();

static void BM_SolveColdStart(benchmark::State& state) {
    solvers::TrajectoryOptimizer optimizer(FormulationConfig{});
    VecX z = planning::encodeObservation(busyRoad(static_cast<int>(state.range(0))), Gain{},
                                         optimizer.formulation(), 0);

    for (auto _ : state) {
        auto response = optimizer.solve(z);
        benchmark::DoNotOptimize(response);
    }
}
BENCHMARK(BM_SolveColdStart)->Arg(0)->Arg(4)->Unit(benchmark::kMillisecond);

static void BM_SolveWarmStart(benchmark::State& state) {
    solvers::TrajectoryOptimizer optimizer(FormulationConfig{});
    VecX z = planning::encodeObservation(busyRoad(4), Gain{}, optimizer.formulation(), 0);
    auto first = optimizer.solve(z);
    if (!first.isOk()) {
        state.SkipWithError("cold solve failed");
        return;
    }
    const VecX warm = first.solution().controls;

    for (auto _ : state) {
        auto response = optimizer.solve(z, warm);
        benchmark::DoNotOptimize(response);
    }
}
BENCHMARK(BM_SolveWarmStart)->Unit(benchmark::kMillisecond);
