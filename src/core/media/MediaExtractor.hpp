#pragma once
#include <string>

namespace frl {

// Writes [start, end) of `source` to `output` without re-encoding.
class MediaExtractor {
public:
  virtual ~MediaExtractor() = default;

  // Returns the path written. Throws ExtractionError on failure; a partial
  // output file may remain and is the caller's to delete.
  virtual std::string extractRange(const std::string& source,
                                   double start,
                                   double end,
                                   const std::string& output) = 0;
};

// ffmpeg -ss <start> -i <source> -t <len> -c copy
class FfmpegExtractor : public MediaExtractor {
public:
  explicit FfmpegExtractor(std::string ffmpegPath = "ffmpeg")
    : ffmpegPath_(std::move(ffmpegPath)) {}

  std::string extractRange(const std::string& source,
                           double start,
                           double end,
                           const std::string& output) override;

private:
  std::string ffmpegPath_;
};

} // namespace frl
