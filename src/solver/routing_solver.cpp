#include "solver/routing_solver.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <system_error>
#include <thread>
#include <utility>

namespace routeopt::solver {

namespace {

// 需求和容量换算成 0.01 kg 的整数给求解器
constexpr double kDemandScale = 100.0;

inline int64_t ScaleKg(double kg) {
  return static_cast<int64_t>(std::llround(kg * kDemandScale));
}

} // namespace

SolverProblem BuildSolverProblem(const GeoPoint& depot,
                                 const std::vector<Stop>& stops,
                                 const VehicleConstraints& vehicle) {
  SolverProblem p;
  p.distance_m = geo::BuildDistanceMatrixMeters(depot, stops);
  p.travel_time_s = geo::BuildTravelTimeMatrixSeconds(p.distance_m, vehicle.average_speed_kmh);

  p.demand.reserve(stops.size() + 1);
  p.demand.push_back(0);
  int64_t total_demand = 0;
  for (const auto& s : stops) {
    p.demand.push_back(ScaleKg(EffectiveDemand(s)));
    total_demand += p.demand.back();
  }

  // stops 已经过容量过滤，实际总量不超过 capacity_kg；逐项取整后的和可能略大，
  // 容量取两者较大值，避免求解器因舍入误差判成无解。
  p.vehicle_capacity = std::max(ScaleKg(vehicle.capacity_kg), total_demand);
  p.service_time_s = static_cast<int64_t>(std::llround(vehicle.stop_duration_minutes * 60.0));
  return p;
}

SolverOutcome SolverOutcome::Solution(std::vector<std::size_t> order) {
  SolverOutcome o;
  o.kind = Kind::kSolution;
  o.visit_order = std::move(order);
  return o;
}

SolverOutcome SolverOutcome::Fallback(std::string reason) {
  SolverOutcome o;
  o.kind = Kind::kFallback;
  o.reason = std::move(reason);
  return o;
}

SolverOutcome ToOutcome(const std::vector<int>& node_route, std::size_t num_stops) {
  std::vector<std::size_t> order;
  std::vector<bool> seen(num_stops, false);

  for (const int node : node_route) {
    if (node == 0) continue; // depot 跳过
    if (node < 0 || static_cast<std::size_t>(node) > num_stops) {
      return SolverOutcome::Fallback("solution references unknown node " + std::to_string(node));
    }
    const std::size_t idx = static_cast<std::size_t>(node - 1);
    if (seen[idx]) {
      return SolverOutcome::Fallback("solution visits node " + std::to_string(node) + " twice");
    }
    seen[idx] = true;
    order.push_back(idx);
  }

  if (order.empty()) return SolverOutcome::Fallback("solver returned no solution");
  if (order.size() != num_stops) {
    return SolverOutcome::Fallback("solution visits " + std::to_string(order.size()) +
                                   " of " + std::to_string(num_stops) + " stops");
  }
  return SolverOutcome::Solution(std::move(order));
}

SolverOutcome SolveBounded(const std::shared_ptr<RoutingSolver>& solver,
                           SolverProblem problem,
                           std::size_t num_stops,
                           std::chrono::milliseconds timeout) {
  if (!solver) return SolverOutcome::Fallback("no solver available");

  CancellationToken cancel;
  auto done = std::make_shared<std::promise<std::vector<int>>>();
  std::future<std::vector<int>> result = done->get_future();

  // 工作线程持有它用到的所有数据的拷贝，超时后放任不管也安全
  try {
    std::thread worker([solver, problem = std::move(problem), cancel, done]() {
      try {
        done->set_value(solver->Solve(problem, cancel));
      } catch (...) {
        done->set_exception(std::current_exception());
      }
    });
    worker.detach();
  } catch (const std::system_error& e) {
    return SolverOutcome::Fallback(std::string("could not start solver thread: ") + e.what());
  }

  if (result.wait_for(timeout) != std::future_status::ready) {
    cancel.Cancel();
    return SolverOutcome::Fallback("solver timed out after " + std::to_string(timeout.count()) + " ms");
  }

  std::vector<int> node_route;
  try {
    node_route = result.get();
  } catch (const std::exception& e) {
    return SolverOutcome::Fallback(std::string("solver error: ") + e.what());
  } catch (...) {
    return SolverOutcome::Fallback("solver error: unknown exception");
  }

  return ToOutcome(node_route, num_stops);
}

} // namespace routeopt::solver
