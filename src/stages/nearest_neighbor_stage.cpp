#include "stages/nearest_neighbor_stage.hpp"

#include <limits>

#include "geo/distance.hpp"

namespace routeopt {

std::vector<std::size_t> NearestNeighborStage::BuildTour(const GeoPoint& depot, const std::vector<Stop>& stops) {
  const std::size_t n = stops.size();
  std::vector<std::size_t> tour;
  tour.reserve(n);
  std::vector<bool> visited(n, false);

  GeoPoint current = depot;
  for (std::size_t step = 0; step < n; ++step) {
    std::size_t nearest = n;
    double nearest_km = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < n; ++i) {
      if (visited[i]) continue;
      const double km = geo::HaversineKm(current, geo::PointOf(stops[i]));
      // 严格小于：距离相同时先找到的胜出
      if (nearest == n || km < nearest_km) {
        nearest = i;
        nearest_km = km;
      }
    }
    visited[nearest] = true;
    tour.push_back(nearest);
    current = geo::PointOf(stops[nearest]);
  }
  return tour;
}

void NearestNeighborStage::Run(OptimizationContext& ctx) const {
  ctx.visit_order = BuildTour(ctx.request.depot, ctx.route_stops);
  ctx.method = RouteMethod::kHeuristic;
  ctx.ordered = true;
}

} // namespace routeopt
