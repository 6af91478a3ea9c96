#include "RouteFileName.hpp"

#include <filesystem>

namespace frl {

std::optional<RouteFileName> parseRouteFileName(const std::string& fileName) {
  static const std::string kExt = ".mp4";
  const std::string name = std::filesystem::path(fileName).filename().string();

  if (name.size() <= kExt.size() ||
      name.compare(name.size() - kExt.size(), kExt.size(), kExt) != 0)
    return std::nullopt;
  const std::string stem = name.substr(0, name.size() - kExt.size());

  const auto dash = stem.rfind('-');
  if (dash == std::string::npos || dash + 1 >= stem.size()) return std::nullopt;
  const std::string camera = stem.substr(dash + 1);
  const std::string rest = stem.substr(0, dash);

  const auto sep = rest.rfind("--");
  if (sep == std::string::npos || sep == 0) return std::nullopt;

  RouteFileName out;
  out.routeId = rest.substr(0, sep);
  out.segment = rest.substr(sep + 2);
  out.camera  = camera;
  return out;
}

std::optional<std::string> uploadRouteId(const std::string& fleetRouteId) {
  if (fleetRouteId.empty()) return std::nullopt;
  auto name = parseRouteFileName(fleetRouteId + "-camera.mp4");
  if (!name) return std::nullopt;
  return name->routeId;
}

} // namespace frl
