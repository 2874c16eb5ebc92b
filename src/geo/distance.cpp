#include "geo/distance.hpp"

#include <cmath>

namespace routeopt::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }

} // namespace

double HaversineKm(double lat1_deg, double lng1_deg, double lat2_deg, double lng2_deg) {
  const double d_lat = Deg2Rad(lat2_deg - lat1_deg);
  const double d_lng = Deg2Rad(lng2_deg - lng1_deg);
  const double s_lat = std::sin(d_lat / 2.0);
  const double s_lng = std::sin(d_lng / 2.0);
  const double a = s_lat * s_lat +
                   std::cos(Deg2Rad(lat1_deg)) * std::cos(Deg2Rad(lat2_deg)) * s_lng * s_lng;
  const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return kEarthRadiusKm * c;
}

IntMatrix BuildDistanceMatrixMeters(const GeoPoint& depot, const std::vector<Stop>& stops) {
  std::vector<GeoPoint> locations;
  locations.reserve(stops.size() + 1);
  locations.push_back(depot);
  for (const auto& s : stops) locations.push_back(PointOf(s));

  const std::size_t n = locations.size();
  IntMatrix m(n, std::vector<int64_t>(n, 0));
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < n; ++j) {
      if (i == j) continue;
      const double km = HaversineKm(locations[i], locations[j]);
      m[i][j] = static_cast<int64_t>(std::llround(km * 1000.0));
    }
  }
  return m;
}

IntMatrix BuildTravelTimeMatrixSeconds(const IntMatrix& distance_m, double speed_kmh) {
  IntMatrix t(distance_m.size());
  for (std::size_t i = 0; i < distance_m.size(); ++i) {
    t[i].resize(distance_m[i].size(), 0);
    for (std::size_t j = 0; j < distance_m[i].size(); ++j) {
      const double hours = static_cast<double>(distance_m[i][j]) / 1000.0 / speed_kmh;
      t[i][j] = static_cast<int64_t>(std::llround(hours * 3600.0));
    }
  }
  return t;
}

double RoundKm2(double km) {
  return std::round(km * 100.0) / 100.0;
}

} // namespace routeopt::geo
