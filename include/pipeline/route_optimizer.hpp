#pragma once
#include <memory>
#include <vector>
#include "common/config.hpp"
#include "common/types.hpp"
#include "solver/routing_solver.hpp"
#include "stages/stage_base.hpp"

namespace routeopt {

// RouteOptimizer：按顺序串起各 Stage 处理一次请求
//   约束过滤 -> (<= 2 个 stop) 保持原顺序
//            -> (>  2 个 stop) 求解器 -> 失败/不可用时最近邻
//            -> 组装路线
//
// 求解器由外部注入：正式运行传 DetectRoutingSolver()，传 nullptr 则总是走启发式，
// 测试里可以传任意 RoutingSolver。
// Optimize() 不修改任何成员，可以并发调用。
class RouteOptimizer {
public:
  explicit RouteOptimizer(std::shared_ptr<solver::RoutingSolver> solver,
                          OptimizerConfig cfg = OptimizerConfig{});

  // 车辆约束或 depot 不合法时抛 UsageError；
  // 其余问题（坏坐标、超容量、求解器失败）都只写进返回的 warnings。
  OptimizedRoute Optimize(const OptimizationRequest& request) const;

  const OptimizerConfig& config() const { return cfg_; }

private:
  static VehicleConstraints ValidateRequest(const OptimizationRequest& request);

  OptimizerConfig cfg_;
  // 顺序必须和 route_optimizer.cpp 里的下标常量一致
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace routeopt
