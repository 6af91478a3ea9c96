#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace frl {

// What the prober reports about a file.
struct MediaInfo {
  std::uint64_t byteSize = 0;
  double        durationSeconds = 0;  // unrounded; use for all planning math
  int           width = 0;
  int           height = 0;
};

// One file to transfer. Immutable once probed.
struct SourceMedia {
  std::string routeId;
  std::string camera;
  std::string path;
  MediaInfo   info;
  std::time_t modifiedAt = 0;
};

} // namespace frl
