#include "pipeline/route_optimizer.hpp"

#include <cmath>
#include <utility>

#include "common/errors.hpp"

#include "stages/constraint_filter_stage.hpp"
#include "stages/nearest_neighbor_stage.hpp"
#include "stages/route_assembly_stage.hpp"
#include "stages/simple_route_stage.hpp"
#include "stages/solver_stage.hpp"

namespace routeopt {

namespace {

constexpr std::size_t kFilter    = 0;
constexpr std::size_t kSimple    = 1;
constexpr std::size_t kSolver    = 2;
constexpr std::size_t kHeuristic = 3;
constexpr std::size_t kAssembly  = 4;

OptimizerConfig Sanitize(OptimizerConfig cfg) {
  if (cfg.solver_time_limit <= std::chrono::milliseconds::zero() ||
      cfg.solver_time_limit > kMaxSolverTimeLimit) {
    cfg.solver_time_limit = kMaxSolverTimeLimit;
  }
  if (cfg.max_iterations_without_improvement <= 0) {
    cfg.max_iterations_without_improvement = OptimizerConfig{}.max_iterations_without_improvement;
  }
  return cfg;
}

} // namespace

RouteOptimizer::RouteOptimizer(std::shared_ptr<solver::RoutingSolver> solver, OptimizerConfig cfg)
    : cfg_(Sanitize(cfg)) {
  stages_.emplace_back(std::make_unique<ConstraintFilterStage>());
  stages_.emplace_back(std::make_unique<SimpleRouteStage>());
  stages_.emplace_back(std::make_unique<SolverStage>(std::move(solver), cfg_));
  stages_.emplace_back(std::make_unique<NearestNeighborStage>());
  stages_.emplace_back(std::make_unique<RouteAssemblyStage>());
}

VehicleConstraints RouteOptimizer::ValidateRequest(const OptimizationRequest& request) {
  if (!request.vehicle) {
    throw UsageError("vehicle constraints are required");
  }
  const VehicleConstraints& v = *request.vehicle;
  if (!std::isfinite(v.capacity_kg) || v.capacity_kg < 0.0) {
    throw UsageError("vehicle.capacity_kg must be a finite, non-negative number");
  }
  if (v.max_stops < 0) {
    throw UsageError("vehicle.max_stops must be non-negative");
  }
  if (!std::isfinite(v.average_speed_kmh) || v.average_speed_kmh <= 0.0) {
    throw UsageError("vehicle.average_speed_kmh must be a positive number");
  }
  if (!std::isfinite(v.stop_duration_minutes) || v.stop_duration_minutes < 0.0) {
    throw UsageError("vehicle.stop_duration_minutes must be a finite, non-negative number");
  }
  if (!std::isfinite(request.depot.lat_deg) || !std::isfinite(request.depot.lng_deg)) {
    throw UsageError("depot coordinates must be finite numbers");
  }
  return v;
}

OptimizedRoute RouteOptimizer::Optimize(const OptimizationRequest& request) const {
  OptimizationContext ctx;
  ctx.vehicle = ValidateRequest(request);
  ctx.request = request;

  // 完全没有 stop：返回空路线，只带一条提示
  if (request.stops.empty()) {
    OptimizedRoute empty;
    empty.warnings.push_back("No stops provided");
    empty.method = RouteMethod::kAsProvided;
    return empty;
  }

  stages_[kFilter]->Run(ctx);

  if (ctx.route_stops.size() <= SimpleRouteStage::kMaxStops) {
    stages_[kSimple]->Run(ctx);
  } else {
    stages_[kSolver]->Run(ctx);
    if (!ctx.ordered) {
      stages_[kHeuristic]->Run(ctx);
    }
  }

  stages_[kAssembly]->Run(ctx);

  return std::move(ctx.route);
}

} // namespace routeopt
