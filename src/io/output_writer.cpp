#include "io/output_writer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "nav/navigation_links.hpp"

namespace fs = std::filesystem;

namespace routeopt::io {

using json = nlohmann::json;

namespace {

void EnsureParentDir(const fs::path& p) {
  const fs::path dir = p.parent_path();
  if (!dir.empty() && !fs::exists(dir)) {
    fs::create_directories(dir);
  }
}

json LinkOrNull(const std::string& url) {
  return url.empty() ? json(nullptr) : json(url);
}

json StopToJson(const OptimizedStop& s) {
  json js = {
      {"id", s.id},
      {"name", s.name},
      {"sequence", s.sequence},
      {"lat", s.lat_deg},
      {"lng", s.lng_deg},
      {"distance_from_previous_km", s.distance_from_previous_km},
      {"estimated_arrival_minutes", s.estimated_arrival_minutes},
  };
  if (s.demand_kg) js["demand_kg"] = *s.demand_kg;
  if (s.location_quality) js["location_quality"] = ToString(*s.location_quality);

  nav::LocationInput loc;
  loc.lat_deg = s.lat_deg;
  loc.lng_deg = s.lng_deg;
  loc.address = s.name;
  const nav::NavigationLinks links = nav::BuildNavigationLinks(loc);
  js["navigation"] = {
      {"google_maps", LinkOrNull(links.google_maps)},
      {"waze", LinkOrNull(links.waze)},
      {"apple_maps", LinkOrNull(links.apple_maps)},
  };
  return js;
}

} // namespace

json OutputWriter::ToJson(const OptimizedRoute& route) {
  json stops = json::array();
  for (const auto& s : route.ordered_stops) stops.push_back(StopToJson(s));

  return json{
      {"method", ToString(route.method)},
      {"total_distance_km", route.total_distance_km},
      {"estimated_duration_minutes", route.estimated_duration_minutes},
      {"warnings", route.warnings},
      {"stops_skipped", route.stops_skipped},
      {"ordered_stops", std::move(stops)},
  };
}

void OutputWriter::Write(const OptimizedRoute& route, std::ostream& os) {
  os << ToJson(route).dump(2) << "\n";
}

void OutputWriter::WriteFile(const OptimizedRoute& route, const std::string& output_path) {
  const fs::path p(output_path);
  EnsureParentDir(p);
  std::ofstream ofs(p);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  Write(route, ofs);
}

} // namespace routeopt::io
