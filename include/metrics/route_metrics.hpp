#pragma once
#include <vector>
#include "common/types.hpp"

namespace routeopt::metrics {

struct RouteMetrics {
  double total_distance_km{0.0};
  long estimated_duration_minutes{0};
};

// 给定访问顺序的快速估算，不做优化。总是包含回 depot 的一段。
RouteMetrics EstimateRouteMetrics(const GeoPoint& depot,
                                  const std::vector<GeoPoint>& stops,
                                  double speed_kmh = kDefaultSpeedKmh,
                                  double stop_duration_min = kDefaultStopDurationMin);

} // namespace routeopt::metrics
