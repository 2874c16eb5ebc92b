#pragma once
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace routeopt::collab {

// ======================
// 调用方：把配送记录转成优化器的 Stop
//
// 占位实现（v1 的已知限制，保留不改）：
//   配送单还没有地理编码坐标。每个 stop 取 hub 坐标，经纬度各加 +/-0.01 度的
//   均匀抖动，并标记为 APPROXIMATE。
//   用默认随机源时每次调用结果都不同；传入固定种子的 rng 可以复现坐标。
//   下游是否依赖其中某一种行为还没定，所以两种入口都留着。
// ======================

// 库里存的 hub 坐标；缺失或为 0 时退回阿比让。
struct HubLocation {
  std::optional<double> lat_deg;
  std::optional<double> lng_deg;
};

struct DeliveryRecord {
  std::string shipment_id;
  std::optional<std::string> address_line;
  std::optional<double> declared_weight_kg;
};

constexpr double kFallbackHubLat = 5.56;   // 阿比让
constexpr double kFallbackHubLng = -4.01;
constexpr double kPlaceholderJitterDeg = 0.02;
constexpr int kRoutePlanMaxStops = 20;

GeoPoint ResolveHub(const HubLocation& hub);

std::vector<Stop> BuildPlaceholderStops(const HubLocation& hub,
                                        const std::vector<DeliveryRecord>& deliveries,
                                        std::mt19937_64& rng);

// 同上，随机源用 random_device 和时钟做种子。
std::vector<Stop> BuildPlaceholderStops(const HubLocation& hub,
                                        const std::vector<DeliveryRecord>& deliveries);

// 路线计划流程用的请求：depot = hub，最多 20 个 stop，回到 depot。
OptimizationRequest BuildRoutePlanRequest(const HubLocation& hub,
                                          const std::vector<DeliveryRecord>& deliveries,
                                          double vehicle_capacity_kg,
                                          std::mt19937_64& rng);

} // namespace routeopt::collab
