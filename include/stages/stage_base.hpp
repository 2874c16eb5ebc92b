#pragma once
#include "common/types.hpp"

namespace routeopt {

// 优化流程的每个环节都实现一个 Stage，输入输出都通过 OptimizationContext 传递。
// Stage 只持有只读配置，所以 Run 是 const，同一组 Stage 可以服务并发调用。
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(OptimizationContext& ctx) const = 0;
};

} // namespace routeopt
