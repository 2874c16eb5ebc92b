#pragma once
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace routeopt::io {

// OutputWriter：把 OptimizedRoute 写成调度端使用的 JSON，
// 每个 stop 附带导航深链接。
//
//   {
//     "method": "SOLVER" | "HEURISTIC" | "AS_PROVIDED",
//     "total_distance_km": .., "estimated_duration_minutes": ..,
//     "warnings": [..], "stops_skipped": [..],
//     "ordered_stops": [{ "id", "name", "sequence", "lat", "lng",
//                         "distance_from_previous_km",
//                         "estimated_arrival_minutes",
//                         "demand_kg"?, "location_quality"?,
//                         "navigation": {"google_maps", "waze", "apple_maps"} }]
//   }
class OutputWriter {
public:
  static nlohmann::json ToJson(const OptimizedRoute& route);

  static void Write(const OptimizedRoute& route, std::ostream& os);
  static void WriteFile(const OptimizedRoute& route, const std::string& output_path);
};

} // namespace routeopt::io
