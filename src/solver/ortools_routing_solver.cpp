#include "solver/ortools_routing_solver.hpp"

#include <cstdint>
#include <limits>
#include <vector>

#include "ortools/constraint_solver/constraint_solver.h"
#include "ortools/constraint_solver/routing.h"
#include "ortools/constraint_solver/routing_enums.pb.h"
#include "ortools/constraint_solver/routing_index_manager.h"
#include "ortools/constraint_solver/routing_parameters.h"

namespace routeopt::solver {

using operations_research::Assignment;
using operations_research::DefaultRoutingSearchParameters;
using operations_research::FirstSolutionStrategy;
using operations_research::LocalSearchMetaheuristic;
using operations_research::RoutingIndexManager;
using operations_research::RoutingModel;
using operations_research::RoutingSearchParameters;

std::vector<int> OrToolsRoutingSolver::Solve(const SolverProblem& problem, const CancellationToken& cancel) {
  const int num_nodes = static_cast<int>(problem.distance_m.size());
  if (num_nodes <= 1) return {};

  RoutingIndexManager manager(num_nodes, problem.num_vehicles,
                              RoutingIndexManager::NodeIndex{problem.depot});
  RoutingModel routing(manager);

  // 弧成本：米
  const int distance_cb = routing.RegisterTransitCallback(
      [&problem, &manager](const int64_t from_index, const int64_t to_index) -> int64_t {
        const int from = manager.IndexToNode(from_index).value();
        const int to = manager.IndexToNode(to_index).value();
        return problem.distance_m[from][to];
      });
  routing.SetArcCostEvaluatorOfAllVehicles(distance_cb);

  // 容量维度
  const int demand_cb = routing.RegisterUnaryTransitCallback(
      [&problem, &manager](const int64_t from_index) -> int64_t {
        return problem.demand[manager.IndexToNode(from_index).value()];
      });
  routing.AddDimensionWithVehicleCapacity(
      demand_cb,
      0,  // 无松弛
      std::vector<int64_t>(problem.num_vehicles, problem.vehicle_capacity),
      true,  // 起点累计量为 0
      "Capacity");

  // 时间维度：行驶时间 + 出发节点的服务时间（depot 不计）
  const int time_cb = routing.RegisterTransitCallback(
      [&problem, &manager](const int64_t from_index, const int64_t to_index) -> int64_t {
        const int from = manager.IndexToNode(from_index).value();
        const int to = manager.IndexToNode(to_index).value();
        const int64_t service = (from == problem.depot) ? 0 : problem.service_time_s;
        return problem.travel_time_s[from][to] + service;
      });
  routing.AddDimension(time_cb,
                       0,  // 不允许等待
                       problem.time_horizon_s,
                       true,
                       "Time");

  // 搜索过程中检查等待方的取消标志
  routing.AddSearchMonitor(routing.solver()->MakeCustomLimit(
      [&cancel]() { return cancel.IsCancelled(); }));

  // 连续 N 个解没有改进就结束搜索
  int64_t best_objective = std::numeric_limits<int64_t>::max();
  int stale = 0;
  routing.AddAtSolutionCallback([&]() {
    const int64_t objective = routing.CostVar()->Value();
    if (objective < best_objective) {
      best_objective = objective;
      stale = 0;
    } else {
      ++stale;
    }
    if (stale >= problem.max_iterations_without_improvement || cancel.IsCancelled()) {
      routing.solver()->FinishCurrentSearch();
    }
  });

  RoutingSearchParameters params = DefaultRoutingSearchParameters();
  params.set_first_solution_strategy(FirstSolutionStrategy::PATH_CHEAPEST_ARC);
  params.set_local_search_metaheuristic(LocalSearchMetaheuristic::GUIDED_LOCAL_SEARCH);
  const int64_t limit_ms = problem.search_time_limit.count();
  params.mutable_time_limit()->set_seconds(limit_ms / 1000);
  params.mutable_time_limit()->set_nanos(static_cast<int32_t>((limit_ms % 1000) * 1000000));

  const Assignment* solution = routing.SolveWithParameters(params);
  if (solution == nullptr) return {};

  std::vector<int> route;
  int64_t index = routing.Start(0);
  while (!routing.IsEnd(index)) {
    route.push_back(manager.IndexToNode(index).value());
    index = solution->Value(routing.NextVar(index));
  }
  route.push_back(manager.IndexToNode(index).value());
  return route;
}

} // namespace routeopt::solver
