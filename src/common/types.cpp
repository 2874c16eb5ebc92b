#include "common/types.hpp"

namespace routeopt {

const char* ToString(LocationQuality q) {
  switch (q) {
    case LocationQuality::kPrecise:     return "PRECISE";
    case LocationQuality::kApproximate: return "APPROXIMATE";
    case LocationQuality::kLandmark:    return "LANDMARK";
  }
  return "PRECISE";
}

const char* ToString(RouteMethod m) {
  switch (m) {
    case RouteMethod::kSolver:     return "SOLVER";
    case RouteMethod::kHeuristic:  return "HEURISTIC";
    case RouteMethod::kAsProvided: return "AS_PROVIDED";
  }
  return "AS_PROVIDED";
}

std::optional<LocationQuality> ParseLocationQuality(const std::string& s) {
  if (s == "PRECISE") return LocationQuality::kPrecise;
  if (s == "APPROXIMATE") return LocationQuality::kApproximate;
  if (s == "LANDMARK") return LocationQuality::kLandmark;
  return std::nullopt;
}

} // namespace routeopt
