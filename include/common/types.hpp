#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace routeopt {

// ========================
// 1) 默认值 / 常量
// ========================

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kDefaultSpeedKmh = 25.0;          // 城市配送路况
constexpr double kDefaultStopDurationMin = 10.0;   // 每站服务时间
constexpr int    kDefaultPriority = 5;

// ========================
// 2) 基础几何
// ========================

struct GeoPoint {
  double lat_deg{0.0};
  double lng_deg{0.0};
};

// ========================
// 3) 请求（输入）
// ========================

enum class LocationQuality {
  kPrecise,
  kApproximate,
  kLandmark,
};

// 相对出发时刻的分钟数。只透传，不参与约束。
struct TimeWindow {
  double start_min{0.0};
  double end_min{0.0};
};

struct Stop {
  std::string id;
  std::string name;
  double lat_deg{0.0};
  double lng_deg{0.0};

  std::optional<double> demand_kg;
  std::optional<TimeWindow> time_window;
  std::optional<int> priority;                 // 1-10，越大越重要
  std::optional<LocationQuality> location_quality;
};

struct VehicleConstraints {
  double capacity_kg{0.0};
  int    max_stops{0};
  double average_speed_kmh{kDefaultSpeedKmh};
  double stop_duration_minutes{kDefaultStopDurationMin};
};

struct OptimizationRequest {
  GeoPoint depot;
  std::vector<Stop> stops;
  // 必填；只有加载时没找到才为空
  std::optional<VehicleConstraints> vehicle;
  bool return_to_depot{true};
};

// ========================
// 4) 结果（输出）
// ========================

enum class RouteMethod {
  kSolver,
  kHeuristic,
  kAsProvided,
};

struct OptimizedStop {
  std::string id;
  std::string name;
  int sequence{0};
  double lat_deg{0.0};
  double lng_deg{0.0};
  double distance_from_previous_km{0.0};
  long estimated_arrival_minutes{0};

  std::optional<double> demand_kg;
  std::optional<LocationQuality> location_quality;
};

struct OptimizedRoute {
  std::vector<OptimizedStop> ordered_stops;
  double total_distance_km{0.0};
  long estimated_duration_minutes{0};
  std::vector<std::string> warnings;
  std::vector<std::string> stops_skipped;
  RouteMethod method{RouteMethod::kAsProvided};
};

// ========================
// 5) 单次调用的上下文，在各 Stage 之间传递
// ========================

struct OptimizationContext {
  // === 输入 ===
  OptimizationRequest request;
  VehicleConstraints vehicle;   // 校验过的 *request.vehicle 副本

  // === ConstraintFilterStage ===
  std::vector<Stop> route_stops;

  // === 排序（SimpleRoute / Solver / NearestNeighbor）===
  // visit_order[i] = route_stops 的下标
  std::vector<std::size_t> visit_order;
  bool ordered{false};
  RouteMethod method{RouteMethod::kAsProvided};

  // === 各 Stage 累积，只追加不覆盖 ===
  std::vector<std::string> warnings;
  std::vector<std::string> stops_skipped;

  // === RouteAssemblyStage ===
  OptimizedRoute route;
};

// ========================
// 6) 辅助函数
// ========================

const char* ToString(LocationQuality q);
const char* ToString(RouteMethod m);

// "PRECISE" / "APPROXIMATE" / "LANDMARK"，其它返回 nullopt
std::optional<LocationQuality> ParseLocationQuality(const std::string& s);

inline int EffectivePriority(const Stop& s) {
  return s.priority.value_or(kDefaultPriority);
}

inline double EffectiveDemand(const Stop& s) {
  return s.demand_kg.value_or(0.0);
}

} // namespace routeopt
