#pragma once
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// 环节：校验并裁剪 stop 集合
//
// 输入：
//   ctx.request.stops, ctx.vehicle
//
// 输出：
//   ctx.route_stops      保留下来的 stop，顺序即后续 Stage 看到的顺序
//   ctx.warnings         每剔除一个记一条（另加定位质量提示）
//   ctx.stops_skipped    被剔除的 stop id
//
// 步骤：
//   1) 去掉 lat/lng 非有限值的 stop
//   2) 超过 max_stops：按 priority 降序稳定排序，保留前 max_stops 个
//   3) 容量：按当前顺序贪心累加，放不下的跳过
//   4) 保留的 stop 中有 APPROXIMATE 时加一条提示
//
// 备注：
//   - 容量规则就是贪心、依赖顺序的，不求最优子集。
// ======================
class ConstraintFilterStage final : public IStage {
public:
  void Run(OptimizationContext& ctx) const override;
};

} // namespace routeopt
