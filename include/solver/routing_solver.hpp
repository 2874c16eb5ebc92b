#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "geo/distance.hpp"

namespace routeopt::solver {

// 等待方和求解线程共享的取消标志，拷贝之间共享同一个 flag。
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() const { flag_->store(true); }
  bool IsCancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// 交给外部求解器的全部数据，均为整数：
//   distance_m       : 米，下标 0 为 depot
//   travel_time_s    : 按平均车速换算的秒数
//   demand           : 每个节点 kg * 100（depot = 0）
//   vehicle_capacity : kg * 100，不小于各 demand 之和（过滤后的 stop 一定装得下）
struct SolverProblem {
  geo::IntMatrix distance_m;
  geo::IntMatrix travel_time_s;
  std::vector<int64_t> demand;
  int64_t vehicle_capacity{0};
  int64_t service_time_s{0};

  int num_vehicles{1};
  int depot{0};
  int64_t time_horizon_s{24 * 60 * 60};

  std::chrono::milliseconds search_time_limit{5000};
  int max_iterations_without_improvement{100};
};

// 用过滤后的 stop 构造单车问题
SolverProblem BuildSolverProblem(const GeoPoint& depot,
                                 const std::vector<Stop>& stops,
                                 const VehicleConstraints& vehicle);

// 外部组合优化 VRP 求解器接口。
//
// Solve() 返回 0 号车的节点序列（depot = 0，stop 为 1..n），两端可带可不带 depot。
// 返回空 vector 表示无解；出错直接抛异常。
// 实现方应轮询 cancel，一旦置位尽快返回。
class RoutingSolver {
public:
  virtual ~RoutingSolver() = default;
  virtual std::string Name() const = 0;
  virtual std::vector<int> Solve(const SolverProblem& problem, const CancellationToken& cancel) = 0;
};

// 有界求解的结果：要么是 stop 顺序，要么是回退信号，不会抛异常。
struct SolverOutcome {
  enum class Kind { kSolution, kFallback };

  Kind kind{Kind::kFallback};
  std::vector<std::size_t> visit_order;  // 从 0 开始的 stop 下标（已去掉 depot）
  std::string reason;                    // kFallback 时填写

  bool solved() const { return kind == Kind::kSolution; }

  static SolverOutcome Solution(std::vector<std::size_t> order);
  static SolverOutcome Fallback(std::string reason);
};

// 在工作线程上跑 solver->Solve，最多等 timeout。
// 超时则置取消标志，工作线程自行退出（它只访问自己持有的数据）。
// num_stops 用于校验返回的节点序列（每个 stop 恰好一次）。
SolverOutcome SolveBounded(const std::shared_ptr<RoutingSolver>& solver,
                           SolverProblem problem,
                           std::size_t num_stops,
                           std::chrono::milliseconds timeout);

// 把节点序列转成 stop 顺序；有遗漏、重复、越界或为空时返回 Fallback。
SolverOutcome ToOutcome(const std::vector<int>& node_route, std::size_t num_stops);

// 每个进程只探测一次可用的求解器后端并缓存；nullptr 表示没有，调用方走启发式。
const std::shared_ptr<RoutingSolver>& DetectRoutingSolver();

} // namespace routeopt::solver
