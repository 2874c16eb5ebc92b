#pragma once
#include <chrono>

namespace routeopt {

// 优化器参数，对应任务文件里的 "optimizer" 段。
struct OptimizerConfig {
  bool enable_solver{true};
  // 求解器调用的显式超时，最多 5 s
  std::chrono::milliseconds solver_time_limit{5000};
  int max_iterations_without_improvement{100};
};

constexpr std::chrono::milliseconds kMaxSolverTimeLimit{5000};

} // namespace routeopt
