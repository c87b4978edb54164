// SPDX-License-Identifier: BSD-3-Clause
#include <benchmark/benchmark.h>
#include <Eigen/Eigenvalues>
#include "recede/recede.hpp"

using namespace recede;
using namespace recede::solvers;

namespace {

/// The step sub-problem the SQP solves around a control sequence `u`:
///   min g'd + ½ d'Hd   s.t.  xl - u ≤ d ≤ xu - u
struct StepQP {
    MatX H;
    VecX g;
    SpMatX A;
    VecX lb;
    VecX ub;
};

planning::Observation merge(int neighbors) {
    planning::Observation obs;
    obs.ego = {Vec2(0, 0), 0, 5};
    for (int i = 0; i < neighbors; ++i) {
        obs.neighbors.push_back({Vec2(3.5, 4.0 + 5.0 * i), -0.1, 6});
    }
    planning::WaypointPath lane;
    for (int i = 1; i <= 30; ++i) {
        lane.push_back({Vec2(0.1 * i, static_cast<Scalar>(i)), 0, 10});
    }
    obs.waypointPaths.push_back(lane);
    return obs;
}

/// H is a central-difference Hessian of the planner cost, symmetrised and
/// shifted to be positive definite.
StepQP buildStepQP(const ProblemFormulation& formulation, const ParameterSet& p,
                   const VecX& u) {
    const Index n = formulation.numDecisionVariables();
    const Scalar h = static_cast<Scalar>(1e-4);

    StepQP qp;
    formulation.costAndGradient(u, p, qp.g);
    qp.H.resize(n, n);
    VecX gp, gm;
    for (Index i = 0; i < n; ++i) {
        VecX up = u, um = u;
        up[i] += h;
        um[i] -= h;
        formulation.costAndGradient(up, p, gp);
        formulation.costAndGradient(um, p, gm);
        qp.H.col(i) = (gp - gm) / (2 * h);
    }
    qp.H = static_cast<Scalar>(0.5) * (qp.H + qp.H.transpose());
    const Scalar minEig = Eigen::SelfAdjointEigenSolver<MatX>(qp.H).eigenvalues().minCoeff();
    if (minEig < static_cast<Scalar>(1e-3)) {
        qp.H += MatX::Identity(n, n) * (static_cast<Scalar>(1e-3) - minEig);
    }

    qp.A = MatX::Identity(n, n).sparseView();
    qp.lb = formulation.lowerBounds() - u;
    qp.ub = formulation.upperBounds() - u;
    return qp;
}

}  // namespace

static void BM_PlannerStepQP(benchmark::State& state) {
    FormulationConfig cfg;
    cfg.horizon = static_cast<int>(state.range(0));
    ProblemFormulation formulation(cfg);
    ParameterSet p = planning::buildParameterSet(merge(4), Gain{}, cfg, 2);
    StepQP qp = buildStepQP(formulation, p, VecX::Zero(formulation.numDecisionVariables()));

    for (auto _ : state) {
        QPSolverADMM solver;
        solver.setup(qp.H, qp.g, qp.A, qp.lb, qp.ub);
        auto result = solver.solve();
        benchmark::DoNotOptimize(result);
    }
    state.SetComplexityN(formulation.numDecisionVariables());
}
BENCHMARK(BM_PlannerStepQP)->DenseRange(5, 25, 5)->Complexity();

// Next tick: same structure, the gradient moved by the ego's progress
static void BM_PlannerStepQPWarmStart(benchmark::State& state) {
    ProblemFormulation formulation;
    ParameterSet p = planning::buildParameterSet(merge(4), Gain{}, formulation.config(), 0);
    const VecX u = VecX::Constant(formulation.numDecisionVariables(), 0.2);
    StepQP qp = buildStepQP(formulation, p, u);

    QPSolverADMM cold;
    cold.setup(qp.H, qp.g, qp.A, qp.lb, qp.ub);
    const QPResult previous = cold.solve();

    p.ego.y += static_cast<Scalar>(0.5);
    StepQP next = buildStepQP(formulation, p, u);

    for (auto _ : state) {
        QPSolverADMM solver;
        solver.setup(next.H, next.g, next.A, next.lb, next.ub);
        solver.warmStart(previous.x, previous.y);
        auto result = solver.solve();
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_PlannerStepQPWarmStart);
