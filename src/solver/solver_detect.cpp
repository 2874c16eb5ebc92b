#include "solver/routing_solver.hpp"

#ifdef ROUTEOPT_HAVE_ORTOOLS
#include "solver/ortools_routing_solver.hpp"
#endif

namespace routeopt::solver {

namespace {

std::shared_ptr<RoutingSolver> DetectBackend() {
#ifdef ROUTEOPT_HAVE_ORTOOLS
  return std::make_shared<OrToolsRoutingSolver>();
#else
  return nullptr;
#endif
}

} // namespace

const std::shared_ptr<RoutingSolver>& DetectRoutingSolver() {
  static const std::shared_ptr<RoutingSolver> solver = DetectBackend();
  return solver;
}

} // namespace routeopt::solver
