#include "collab/delivery_stops.hpp"

#include <chrono>
#include <cstdint>

namespace routeopt::collab {

namespace {

inline std::mt19937_64 MakeRng() {
  std::random_device rd;
  const uint64_t t = static_cast<uint64_t>(
      std::chrono::high_resolution_clock::now().time_since_epoch().count());
  const uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ t;
  return std::mt19937_64(seed);
}

inline double OrFallback(const std::optional<double>& v, double fallback) {
  // 库里 hub 坐标为 0 视为未设置
  if (!v || *v == 0.0) return fallback;
  return *v;
}

} // namespace

GeoPoint ResolveHub(const HubLocation& hub) {
  return GeoPoint{OrFallback(hub.lat_deg, kFallbackHubLat), OrFallback(hub.lng_deg, kFallbackHubLng)};
}

std::vector<Stop> BuildPlaceholderStops(const HubLocation& hub,
                                        const std::vector<DeliveryRecord>& deliveries,
                                        std::mt19937_64& rng) {
  const GeoPoint center = ResolveHub(hub);
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  std::vector<Stop> stops;
  stops.reserve(deliveries.size());
  for (const auto& d : deliveries) {
    Stop s;
    s.id = d.shipment_id;
    s.name = d.address_line.value_or("Unknown");
    s.lat_deg = center.lat_deg + (unit(rng) - 0.5) * kPlaceholderJitterDeg;
    s.lng_deg = center.lng_deg + (unit(rng) - 0.5) * kPlaceholderJitterDeg;
    s.demand_kg = d.declared_weight_kg.value_or(0.0);
    s.location_quality = LocationQuality::kApproximate;
    stops.push_back(std::move(s));
  }
  return stops;
}

std::vector<Stop> BuildPlaceholderStops(const HubLocation& hub,
                                        const std::vector<DeliveryRecord>& deliveries) {
  auto rng = MakeRng();
  return BuildPlaceholderStops(hub, deliveries, rng);
}

OptimizationRequest BuildRoutePlanRequest(const HubLocation& hub,
                                          const std::vector<DeliveryRecord>& deliveries,
                                          double vehicle_capacity_kg,
                                          std::mt19937_64& rng) {
  OptimizationRequest req;
  req.depot = ResolveHub(hub);
  req.stops = BuildPlaceholderStops(hub, deliveries, rng);

  VehicleConstraints v;
  v.capacity_kg = vehicle_capacity_kg;
  v.max_stops = kRoutePlanMaxStops;
  req.vehicle = v;
  req.return_to_depot = true;
  return req;
}

} // namespace routeopt::collab
