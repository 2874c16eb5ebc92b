#include "stages/constraint_filter_stage.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace routeopt {

namespace {

inline bool HasValidCoordinates(const Stop& s) {
  return std::isfinite(s.lat_deg) && std::isfinite(s.lng_deg);
}

} // namespace

void ConstraintFilterStage::Run(OptimizationContext& ctx) const {
  ctx.route_stops.clear();

  // 1) 坐标
  std::vector<Stop> valid;
  valid.reserve(ctx.request.stops.size());
  for (const auto& s : ctx.request.stops) {
    if (!HasValidCoordinates(s)) {
      ctx.warnings.push_back("Stop " + s.id + " skipped: invalid coordinates");
      ctx.stops_skipped.push_back(s.id);
      continue;
    }
    valid.push_back(s);
  }

  // 2) 最大站数
  const std::size_t max_stops = static_cast<std::size_t>(std::max(0, ctx.vehicle.max_stops));
  if (valid.size() > max_stops) {
    ctx.warnings.push_back("Max stops (" + std::to_string(ctx.vehicle.max_stops) +
                           ") exceeded, optimizing subset");

    std::vector<std::size_t> order(valid.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
      return EffectivePriority(valid[a]) > EffectivePriority(valid[b]);
    });

    std::vector<bool> kept(valid.size(), false);
    std::vector<Stop> subset;
    subset.reserve(max_stops);
    for (std::size_t k = 0; k < max_stops; ++k) {
      kept[order[k]] = true;
      subset.push_back(valid[order[k]]);
    }
    // 被丢弃的 id 按原始输入顺序记录
    for (std::size_t i = 0; i < valid.size(); ++i) {
      if (!kept[i]) ctx.stops_skipped.push_back(valid[i].id);
    }
    valid = std::move(subset);
  }

  // 3) 容量
  double total_demand = 0.0;
  for (auto& s : valid) {
    const double demand = EffectiveDemand(s);
    if (total_demand + demand <= ctx.vehicle.capacity_kg) {
      total_demand += demand;
      ctx.route_stops.push_back(std::move(s));
    } else {
      ctx.warnings.push_back("Stop " + s.id + " skipped: exceeds vehicle capacity");
      ctx.stops_skipped.push_back(s.id);
    }
  }

  // 4) 定位质量
  const auto approximate = std::count_if(ctx.route_stops.begin(), ctx.route_stops.end(), [](const Stop& s) {
    return s.location_quality == LocationQuality::kApproximate;
  });
  if (approximate > 0) {
    ctx.warnings.push_back(std::to_string(approximate) + " stops have approximate locations");
  }
}

} // namespace routeopt
