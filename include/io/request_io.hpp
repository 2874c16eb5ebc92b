#pragma once
#include <string>
#include "common/config.hpp"
#include "common/types.hpp"

namespace routeopt::io {

// 任务文件描述的一次优化
struct Job {
  OptimizationRequest request;
  OptimizerConfig optimizer;
};

// RequestIO：读任务文件（JSON），得到 Job。
//
// 格式：
//   {
//     "depot":   {"lat": .., "lng": ..},
//     "stops":   [{"id", "name", "lat", "lng",
//                  "demand_kg"?, "priority"?, "location_quality"?,
//                  "time_window"? {"start_min", "end_min"}}],
//     "vehicle": {"capacity_kg", "max_stops",
//                 "average_speed_kmh"?, "stop_duration_minutes"?},
//     "return_to_depot"?: true,
//     "optimizer"?: {"enable_solver", "solver_time_limit_ms",
//                    "max_iterations_without_improvement"}
//   }
//
// 数据问题留给优化器处理：stop 的 lat/lng 不是数字就记为 NaN；
// 缺 vehicle 则 request.vehicle 为空；车辆字段类型错误或超出 int 范围记为哨兵值。
// 文件读不到、JSON 语法错误抛 std::runtime_error。
class RequestIO {
public:
  static Job LoadJob(const std::string& path);
  static Job ParseJob(const std::string& text, const std::string& hint = "job");
};

} // namespace routeopt::io
