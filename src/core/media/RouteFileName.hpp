#pragma once
#include <optional>
#include <string>

namespace frl {

struct RouteFileName {
  std::string routeId;
  std::string segment;
  std::string camera;
};

// Parses "<routeId>--<segment>-<camera>.mp4" (directory part ignored).
// The camera is everything after the last '-', the route id everything before
// the last "--" that precedes it. nullopt when the name does not match or the
// route id / camera would be empty.
std::optional<RouteFileName> parseRouteFileName(const std::string& fileName);

// Ledger route id the upload side uses for a video downloaded from fleet
// route `fleetRouteId` (saved as "<fleetRouteId>-<camera>.mp4"). nullopt when
// such a file would not parse.
std::optional<std::string> uploadRouteId(const std::string& fleetRouteId);

} // namespace frl
