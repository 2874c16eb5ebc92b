#pragma once
#include <memory>
#include "common/config.hpp"
#include "solver/routing_solver.hpp"
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// 环节：外部 VRP 求解器（可选）
//
// 输入：
//   ctx.route_stops（已满足容量 / max_stops），ctx.vehicle
//
// 输出（成功）：
//   ctx.visit_order, ctx.method = SOLVER, ctx.ordered = true
// 输出（其它情况）：
//   ctx.ordered 保持 false，追加一条提示性 warning，原因打到 stderr；
//   随后由 RouteOptimizer 跑最近邻。
//
// 备注：
//   - 整个调用受 config.solver_time_limit 约束；求解器自身的搜索时限设得略小，
//     正常求解能在超时前返回。
// ======================
class SolverStage final : public IStage {
public:
  SolverStage(std::shared_ptr<solver::RoutingSolver> solver, OptimizerConfig cfg);

  void Run(OptimizationContext& ctx) const override;

  bool available() const { return solver_ != nullptr && cfg_.enable_solver; }

  static constexpr const char* kUnavailableWarning = "Route solver unavailable, using heuristic fallback";
  static constexpr const char* kFailedWarning = "Route solver failed, using heuristic fallback";

private:
  std::shared_ptr<solver::RoutingSolver> solver_;
  OptimizerConfig cfg_;
};

} // namespace routeopt
