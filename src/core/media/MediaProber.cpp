#include "MediaProber.hpp"

#include <cmath>
#include <filesystem>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/process/Subprocess.hpp"

using nlohmann::json;

namespace frl {

namespace {

// ffprobe prints most numeric format fields as strings
double number_field(const json& obj, const char* key, double def) {
  if (!obj.contains(key)) return def;
  const auto& v = obj[key];
  if (v.is_number()) return v.get<double>();
  if (v.is_string()) {
    try { return std::stod(v.get<std::string>()); }
    catch (const std::exception&) { return def; }
  }
  return def;
}

} // namespace

MediaInfo parseProbeOutput(const std::string& json_text) {
  json doc;
  try {
    doc = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw ProbeError(std::string("invalid ffprobe output: ") + e.what());
  }

  if (!doc.contains("format") || !doc["format"].is_object())
    throw ProbeError("ffprobe output has no format section");
  const auto& format = doc["format"];

  MediaInfo info;
  info.durationSeconds = number_field(format, "duration", 0.0);
  if (!(info.durationSeconds > 0))
    throw ProbeError("media has no duration");
  info.byteSize = static_cast<std::uint64_t>(number_field(format, "size", 0.0));

  bool haveVideo = false;
  if (doc.contains("streams") && doc["streams"].is_array()) {
    for (const auto& s : doc["streams"]) {
      if (s.value("codec_type", std::string()) != "video") continue;
      info.width  = s.value("width", 0);
      info.height = s.value("height", 0);
      haveVideo = true;
      break;
    }
  }
  if (!haveVideo) throw ProbeError("media has no video stream");
  return info;
}

int displayDuration(double seconds) {
  return static_cast<int>(std::ceil(seconds));
}

MediaInfo FfprobeProber::probe(const std::string& path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    throw ProbeError("not a readable file: " + path);

  ProcessResult r;
  try {
    r = runProcess({ffprobePath_, "-v", "quiet", "-print_format", "json",
                    "-show_format", "-show_streams", path});
  } catch (const std::runtime_error& e) {
    throw ProbeError(std::string("cannot run ffprobe: ") + e.what());
  }
  if (r.exitCode != 0)
    throw ProbeError("ffprobe exited with " + std::to_string(r.exitCode) + " for " + path);

  MediaInfo info = parseProbeOutput(r.stdoutText);
  if (info.byteSize == 0) {
    auto sz = fs::file_size(path, ec);
    if (!ec) info.byteSize = sz;
  }

  spdlog::debug("Probed {}: {:.2f}s, {} bytes, {}x{}",
                path, info.durationSeconds, info.byteSize, info.width, info.height);
  return info;
}

} // namespace frl
