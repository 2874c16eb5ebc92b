#pragma once
#include <cstdint>
#include <vector>
#include "common/types.hpp"

namespace routeopt::geo {

// 大圆距离（haversine，R = 6371 km），单位 km
double HaversineKm(double lat1_deg, double lng1_deg, double lat2_deg, double lng2_deg);

inline double HaversineKm(const GeoPoint& a, const GeoPoint& b) {
  return HaversineKm(a.lat_deg, a.lng_deg, b.lat_deg, b.lng_deg);
}

inline GeoPoint PointOf(const Stop& s) { return GeoPoint{s.lat_deg, s.lng_deg}; }

// 给外部求解器的整数矩阵。
// 下标 0 是 depot，1..n 按传入顺序对应各 stop。
using IntMatrix = std::vector<std::vector<int64_t>>;

// 米，四舍五入
IntMatrix BuildDistanceMatrixMeters(const GeoPoint& depot, const std::vector<Stop>& stops);

// 按平均速度换算的秒数，四舍五入
IntMatrix BuildTravelTimeMatrixSeconds(const IntMatrix& distance_m, double speed_kmh);

// 对外输出的 km 一律保留两位小数
double RoundKm2(double km);

} // namespace routeopt::geo
