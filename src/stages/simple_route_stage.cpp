#include "stages/simple_route_stage.hpp"

#include <numeric>

namespace routeopt {

void SimpleRouteStage::Run(OptimizationContext& ctx) const {
  if (ctx.route_stops.empty()) {
    ctx.warnings.push_back("No stops provided");
  }

  ctx.visit_order.resize(ctx.route_stops.size());
  std::iota(ctx.visit_order.begin(), ctx.visit_order.end(), std::size_t{0});
  ctx.method = RouteMethod::kAsProvided;
  ctx.ordered = true;
}

} // namespace routeopt
