#pragma once
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// 环节：把访问顺序组装成带时间的最终路线
//
// 输入：
//   ctx.route_stops, ctx.visit_order, ctx.method, ctx.vehicle
//   ctx.request.depot / return_to_depot
//   ctx.warnings / ctx.stops_skipped（原样带到结果里）
//
// 输出：
//   ctx.route
//
// 每个 stop：
//   distance_from_previous_km = round2(leg)
//   cumulative += leg / speed * 60 + stop_duration
//   estimated_arrival_minutes = round(cumulative)
// 回程（可选）只加距离和行驶时间，不加服务时间。
// 总距离/总时长按未取整的累计值取整，不是各段取整后相加。
// ======================
class RouteAssemblyStage final : public IStage {
public:
  void Run(OptimizationContext& ctx) const override;
};

} // namespace routeopt
