#include "stages/route_assembly_stage.hpp"

#include <cmath>

#include "geo/distance.hpp"

namespace routeopt {

void RouteAssemblyStage::Run(OptimizationContext& ctx) const {
  OptimizedRoute route;
  route.method = ctx.method;
  route.ordered_stops.reserve(ctx.visit_order.size());

  const double speed_kmh = ctx.vehicle.average_speed_kmh;
  const double stop_min = ctx.vehicle.stop_duration_minutes;

  GeoPoint prev = ctx.request.depot;
  double total_km = 0.0;
  double elapsed_min = 0.0;

  for (const std::size_t idx : ctx.visit_order) {
    const Stop& s = ctx.route_stops.at(idx);
    const double leg_km = geo::HaversineKm(prev, geo::PointOf(s));
    total_km += leg_km;
    elapsed_min += leg_km / speed_kmh * 60.0 + stop_min;

    OptimizedStop out;
    out.id = s.id;
    out.name = s.name;
    out.sequence = static_cast<int>(route.ordered_stops.size());
    out.lat_deg = s.lat_deg;
    out.lng_deg = s.lng_deg;
    out.distance_from_previous_km = geo::RoundKm2(leg_km);
    out.estimated_arrival_minutes = std::lround(elapsed_min);
    out.demand_kg = s.demand_kg;
    out.location_quality = s.location_quality;
    route.ordered_stops.push_back(std::move(out));

    prev = geo::PointOf(s);
  }

  if (ctx.request.return_to_depot) {
    const double back_km = geo::HaversineKm(prev, ctx.request.depot);
    total_km += back_km;
    elapsed_min += back_km / speed_kmh * 60.0;
  }

  route.total_distance_km = geo::RoundKm2(total_km);
  route.estimated_duration_minutes = std::lround(elapsed_min);
  route.warnings = ctx.warnings;
  route.stops_skipped = ctx.stops_skipped;

  ctx.route = std::move(route);
}

} // namespace routeopt
