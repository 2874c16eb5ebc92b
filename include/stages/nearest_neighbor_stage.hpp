#pragma once
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// 环节：最近邻路线（始终可用的兜底方案）
//
// 从 depot 出发，每次走到 haversine 距离最近的未访问 stop。
// 距离完全相同时取 ctx.route_stops 中靠前的那个，保证同样输入得到同样路线。
//
// 输出：
//   ctx.visit_order, ctx.method = HEURISTIC
// ======================
class NearestNeighborStage final : public IStage {
public:
  void Run(OptimizationContext& ctx) const override;

  static std::vector<std::size_t> BuildTour(const GeoPoint& depot, const std::vector<Stop>& stops);
};

} // namespace routeopt
