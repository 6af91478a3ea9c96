#include "MediaExtractor.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/process/Subprocess.hpp"

namespace frl {

static std::string seconds_arg(double s) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", s);
  return buf;
}

std::string FfmpegExtractor::extractRange(const std::string& source,
                                          double start,
                                          double end,
                                          const std::string& output) {
  if (!(end > start))
    throw ExtractionError("empty range " + seconds_arg(start) + "-" + seconds_arg(end));

  const std::vector<std::string> argv = {
    ffmpegPath_, "-y", "-hide_banner", "-loglevel", "error",
    "-ss", seconds_arg(start),
    "-i", source,
    "-t", seconds_arg(end - start),
    "-c", "copy",
    "-avoid_negative_ts", "make_zero",
    "-movflags", "+faststart",
    output
  };

  ProcessResult r;
  try {
    r = runProcess(argv);
  } catch (const std::runtime_error& e) {
    throw ExtractionError(std::string("cannot run ffmpeg: ") + e.what());
  }
  if (r.exitCode != 0)
    throw ExtractionError("ffmpeg exited with " + std::to_string(r.exitCode) + " for " + output);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(output, ec))
    throw ExtractionError("ffmpeg produced no output: " + output);

  spdlog::debug("Extracted {} [{}-{}] -> {}", source, seconds_arg(start), seconds_arg(end), output);
  return output;
}

} // namespace frl
