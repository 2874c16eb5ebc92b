#include <iostream>
#include <string>

#include "common/errors.hpp"
#include "io/output_writer.hpp"
#include "io/request_io.hpp"
#include "pipeline/route_optimizer.hpp"
#include "solver/routing_solver.hpp"

int main(int argc, char** argv) {
  // 用法：
  //   ./routeopt_cli                          （读 demo/job.json，结果打到 stdout）
  //   ./routeopt_cli /path/to/job.json        （结果打到 stdout）
  //   ./routeopt_cli /path/to/job.json out.json
  std::string job_path = "demo/job.json";
  std::string output_path;

  if (argc >= 2) job_path = argv[1];
  if (argc >= 3) output_path = argv[2];

  try {
    // 1) 读任务文件：请求 + 优化器参数
    routeopt::io::Job job = routeopt::io::RequestIO::LoadJob(job_path);

    // 2) 求解器只探测一次，注入 RouteOptimizer
    routeopt::RouteOptimizer optimizer(routeopt::solver::DetectRoutingSolver(), job.optimizer);
    const routeopt::OptimizedRoute route = optimizer.Optimize(job.request);

    // 3) 输出
    if (output_path.empty()) {
      routeopt::io::OutputWriter::Write(route, std::cout);
    } else {
      routeopt::io::OutputWriter::WriteFile(route, output_path);
      std::cerr << "Done. Route written to: " << output_path << "\n";
    }
    return 0;
  } catch (const routeopt::UsageError& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
