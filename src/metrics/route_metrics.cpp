#include "metrics/route_metrics.hpp"

#include <cmath>

#include "geo/distance.hpp"

namespace routeopt::metrics {

RouteMetrics EstimateRouteMetrics(const GeoPoint& depot,
                                  const std::vector<GeoPoint>& stops,
                                  double speed_kmh,
                                  double stop_duration_min) {
  double total_km = 0.0;
  GeoPoint prev = depot;
  for (const auto& p : stops) {
    total_km += geo::HaversineKm(prev, p);
    prev = p;
  }
  total_km += geo::HaversineKm(prev, depot);

  const double travel_min = total_km / speed_kmh * 60.0;
  const double service_min = static_cast<double>(stops.size()) * stop_duration_min;

  RouteMetrics m;
  m.total_distance_km = geo::RoundKm2(total_km);
  m.estimated_duration_minutes = std::lround(travel_min + service_min);
  return m;
}

} // namespace routeopt::metrics
