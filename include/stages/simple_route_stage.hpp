#pragma once
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// 环节：保持原顺序（0-2 个 stop，没什么可优化的）
//
// 输出：
//   ctx.visit_order = 0..n-1, ctx.method = AS_PROVIDED
//   n == 0 时 ctx.warnings 追加 "No stops provided"
// ======================
class SimpleRouteStage final : public IStage {
public:
  void Run(OptimizationContext& ctx) const override;

  static constexpr std::size_t kMaxStops = 2;
};

} // namespace routeopt
