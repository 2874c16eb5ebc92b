#pragma once
#include <stdexcept>
#include <string>

namespace routeopt {

// 调用方违反约定（车辆约束缺失/非法，或 depot 坐标非法）。
// 数据质量问题不抛异常，只进 warnings。
class UsageError : public std::invalid_argument {
public:
  explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace routeopt
