#pragma once
#include <string>

#include "SourceMedia.hpp"

namespace frl {

class MediaProber {
public:
  virtual ~MediaProber() = default;

  // Throws ProbeError when the file is unreadable, has no duration or no video stream.
  virtual MediaInfo probe(const std::string& path) = 0;
};

// Runs `ffprobe -print_format json -show_format -show_streams`.
class FfprobeProber : public MediaProber {
public:
  explicit FfprobeProber(std::string ffprobePath = "ffprobe")
    : ffprobePath_(std::move(ffprobePath)) {}

  MediaInfo probe(const std::string& path) override;

private:
  std::string ffprobePath_;
};

// Parses ffprobe's JSON document. Exposed for tests.
MediaInfo parseProbeOutput(const std::string& json_text);

// Whole seconds, rounded up. Display only.
int displayDuration(double seconds);

} // namespace frl
