#include "stages/solver_stage.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace routeopt {

namespace {

// 从搜索时限里预留给建模和结果交接的时间
constexpr std::chrono::milliseconds kSetupAllowance{250};

std::chrono::milliseconds SearchLimitFor(std::chrono::milliseconds timeout) {
  return std::max(timeout - kSetupAllowance, timeout / 2);
}

} // namespace

SolverStage::SolverStage(std::shared_ptr<solver::RoutingSolver> solver, OptimizerConfig cfg)
    : solver_(std::move(solver)), cfg_(cfg) {}

void SolverStage::Run(OptimizationContext& ctx) const {
  if (!available()) {
    ctx.warnings.push_back(kUnavailableWarning);
    return;
  }

  solver::SolverProblem problem = solver::BuildSolverProblem(ctx.request.depot, ctx.route_stops, ctx.vehicle);
  problem.search_time_limit = SearchLimitFor(cfg_.solver_time_limit);
  problem.max_iterations_without_improvement = cfg_.max_iterations_without_improvement;

  solver::SolverOutcome outcome =
      solver::SolveBounded(solver_, std::move(problem), ctx.route_stops.size(), cfg_.solver_time_limit);

  if (!outcome.solved()) {
    std::cerr << "[SolverStage] " << solver_->Name() << " failed (" << outcome.reason
              << "), falling back to nearest neighbor\n";
    ctx.warnings.push_back(kFailedWarning);
    return;
  }

  ctx.visit_order = std::move(outcome.visit_order);
  ctx.method = RouteMethod::kSolver;
  ctx.ordered = true;
}

} // namespace routeopt
