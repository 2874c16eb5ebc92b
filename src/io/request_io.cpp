#include "io/request_io.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace routeopt::io {

using json = nlohmann::json;

namespace {

std::string ReadAllText(const fs::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

// 数值字段，否则 NaN。字符串、null、布尔、缺失都算“不是数字”，由过滤环节决定怎么处理。
double NumberOrNaN(const json& obj, const char* key) {
  if (obj.is_object() && obj.contains(key) && obj[key].is_number()) {
    return obj[key].get<double>();
  }
  return std::numeric_limits<double>::quiet_NaN();
}

std::optional<double> OptionalNumber(const json& obj, const char* key) {
  if (obj.contains(key) && obj[key].is_number()) return obj[key].get<double>();
  return std::nullopt;
}

// 缺省字段用默认值；字段存在但不是数字时给 NaN，由 RouteOptimizer 报 UsageError。
double NumberOr(const json& obj, const char* key, double fallback) {
  if (!obj.contains(key)) return fallback;
  return NumberOrNaN(obj, key);
}

bool BoolOr(const json& obj, const char* key, bool fallback) {
  if (obj.contains(key) && obj[key].is_boolean()) return obj[key].get<bool>();
  return fallback;
}

// 整数字段一律先按 double 读，再做范围检查后收窄，
// 避免 1e20 这类值直接转 int（未定义行为）。
// 不存在、类型不对、超出 int 范围：nullopt。
std::optional<int> IntInRange(const json& obj, const char* key) {
  const auto v = OptionalNumber(obj, key);
  if (!v || !std::isfinite(*v)) return std::nullopt;
  if (*v < static_cast<double>(std::numeric_limits<int>::min()) ||
      *v > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(*v);
}

// 同上，但超范围时夹到 int 的边界（只用于排序/上限类字段）。
std::optional<int> ClampedInt(const json& obj, const char* key) {
  const auto v = OptionalNumber(obj, key);
  if (!v || std::isnan(*v)) return std::nullopt;
  const double lo = static_cast<double>(std::numeric_limits<int>::min());
  const double hi = static_cast<double>(std::numeric_limits<int>::max());
  return static_cast<int>(std::clamp(*v, lo, hi));
}

// 有的调用方 id 传的是数字
std::string IdString(const json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_null()) return {};
  return v.dump();
}

Stop ParseStop(const json& js) {
  Stop s;
  if (!js.is_object()) {
    s.lat_deg = std::numeric_limits<double>::quiet_NaN();
    s.lng_deg = std::numeric_limits<double>::quiet_NaN();
    return s;
  }

  s.id = js.contains("id") ? IdString(js["id"]) : std::string();
  s.name = js.contains("name") && js["name"].is_string() ? js["name"].get<std::string>() : s.id;
  s.lat_deg = NumberOrNaN(js, "lat");
  s.lng_deg = NumberOrNaN(js, "lng");

  s.demand_kg = OptionalNumber(js, "demand_kg");
  // 优先级只参与排序，超出 int 的值夹到边界即可
  s.priority = ClampedInt(js, "priority");
  if (js.contains("location_quality") && js["location_quality"].is_string()) {
    s.location_quality = ParseLocationQuality(js["location_quality"].get<std::string>());
  }
  if (js.contains("time_window") && js["time_window"].is_object()) {
    const json& tw = js["time_window"];
    s.time_window = TimeWindow{NumberOr(tw, "start_min", 0.0), NumberOr(tw, "end_min", 0.0)};
  }
  return s;
}

// 车辆字段缺失、类型错误、超范围都落到哨兵值（capacity=NaN, max_stops=-1,
// speed/duration=NaN），由 RouteOptimizer::ValidateRequest 统一抛 UsageError。
VehicleConstraints ParseVehicle(const json& js) {
  VehicleConstraints v;
  v.capacity_kg = NumberOrNaN(js, "capacity_kg");
  v.max_stops = IntInRange(js, "max_stops").value_or(-1);
  v.average_speed_kmh = NumberOr(js, "average_speed_kmh", v.average_speed_kmh);
  v.stop_duration_minutes = NumberOr(js, "stop_duration_minutes", v.stop_duration_minutes);
  return v;
}

void ParseOptimizer(const json& js, Job& job) {
  auto& cfg = job.optimizer;
  cfg.enable_solver = BoolOr(js, "enable_solver", cfg.enable_solver);
  // 超出 (0, 5000] 的时限由 RouteOptimizer 统一修正，这里只保证收窄安全
  if (const auto ms = ClampedInt(js, "solver_time_limit_ms")) {
    cfg.solver_time_limit = std::chrono::milliseconds(*ms);
  }
  if (const auto n = ClampedInt(js, "max_iterations_without_improvement")) {
    cfg.max_iterations_without_improvement = *n;
  }
}

} // namespace

Job RequestIO::ParseJob(const std::string& text, const std::string& hint) {
  const json root = ParseJson(text, hint);
  if (!root.is_object()) {
    throw std::runtime_error("Job " + hint + " must be a JSON object");
  }

  Job job;
  auto& req = job.request;

  const json depot = root.value("depot", json::object());
  req.depot = GeoPoint{NumberOrNaN(depot, "lat"), NumberOrNaN(depot, "lng")};

  if (root.contains("stops") && root["stops"].is_array()) {
    req.stops.reserve(root["stops"].size());
    for (const auto& js : root["stops"]) req.stops.push_back(ParseStop(js));
  }

  if (root.contains("vehicle") && root["vehicle"].is_object()) {
    req.vehicle = ParseVehicle(root["vehicle"]);
  }

  req.return_to_depot = BoolOr(root, "return_to_depot", req.return_to_depot);

  if (root.contains("optimizer") && root["optimizer"].is_object()) {
    ParseOptimizer(root["optimizer"], job);
  }
  return job;
}

Job RequestIO::LoadJob(const std::string& path) {
  const fs::path p(path);
  return ParseJob(ReadAllText(p), p.filename().string());
}

} // namespace routeopt::io
