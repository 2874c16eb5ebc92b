#include "nav/navigation_links.hpp"

#include <charconv>
#include <cstring>

namespace routeopt::nav {

namespace {

inline bool IsUnreserved(unsigned char c) {
  if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) return true;
  return c != '\0' && std::strchr("-_.!~*'()", c) != nullptr;
}

std::string GoogleMapsUrl(const std::string& destination) {
  return "https://www.google.com/maps/dir/?api=1&destination=" + EncodeUriComponent(destination);
}

std::string WazeUrl(const LocationInput& loc) {
  if (loc.lat_deg && loc.lng_deg) {
    return "https://waze.com/ul?ll=" + FormatCoordinate(*loc.lat_deg) + "," +
           FormatCoordinate(*loc.lng_deg) + "&navigate=yes";
  }
  if (loc.address && !loc.address->empty()) {
    return "https://waze.com/ul?q=" + EncodeUriComponent(*loc.address) + "&navigate=yes";
  }
  return {};
}

std::string AppleMapsUrl(const std::string& destination) {
  return "https://maps.apple.com/?daddr=" + EncodeUriComponent(destination);
}

} // namespace

std::string EncodeUriComponent(const std::string& s) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    if (IsUnreserved(c)) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string FormatCoordinate(double v) {
  char buf[32];
  const auto res = std::to_chars(buf, buf + sizeof(buf), v);
  return std::string(buf, res.ptr);
}

NavigationLinks BuildNavigationLinks(const LocationInput& location) {
  std::string destination;
  if (location.lat_deg && location.lng_deg) {
    destination = FormatCoordinate(*location.lat_deg) + "," + FormatCoordinate(*location.lng_deg);
  } else if (location.address && !location.address->empty()) {
    destination = *location.address;
  }

  if (destination.empty()) return {};

  NavigationLinks links;
  links.google_maps = GoogleMapsUrl(destination);
  links.waze = WazeUrl(location);
  links.apple_maps = AppleMapsUrl(destination);
  return links;
}

} // namespace routeopt::nav
