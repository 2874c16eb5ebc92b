#pragma once
#include <optional>
#include <string>

namespace routeopt::nav {

// 司机的目的地；有坐标时优先用坐标，其次用地址
struct LocationInput {
  std::optional<double> lat_deg;
  std::optional<double> lng_deg;
  std::optional<std::string> address;
};

// 外部导航 App 的深链接，空串表示没有
struct NavigationLinks {
  std::string google_maps;
  std::string waze;
  std::string apple_maps;
};

// 坐标和地址都没有时，全部为空
NavigationLinks BuildNavigationLinks(const LocationInput& location);

// 百分号编码，保留 A-Z a-z 0-9 - _ . ! ~ * ' ( )（与 JS encodeURIComponent 一致）
std::string EncodeUriComponent(const std::string& s);

// 能读回同一个 double 的最短文本（"5.56"、"-4.01"、"3"）
std::string FormatCoordinate(double v);

} // namespace routeopt::nav
