#pragma once
#include "solver/routing_solver.hpp"

namespace routeopt::solver {

// 基于 Google OR-Tools 路由库的实现：单车，带容量和时间两个维度。
// 只有构建时找到 OR-Tools 才会编译。
class OrToolsRoutingSolver final : public RoutingSolver {
public:
  std::string Name() const override { return "OR-Tools"; }
  std::vector<int> Solve(const SolverProblem& problem, const CancellationToken& cancel) override;
};

} // namespace routeopt::solver
