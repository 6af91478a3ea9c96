#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <spdlog/spdlog.h>

namespace frl {

namespace {

constexpr double kMaxChunkMb = 1024.0 * 1024;  // 1 TB
constexpr double kMaxTmpGb   = 1024.0 * 1024;  // 1 PB
constexpr double kMaxSeconds = 365.0 * 24 * 3600;

std::string trim(const std::string& s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// Values outside [0, maxval] are rejected like malformed ones, so the casts
// done by the caller stay in range.
double env_number_or(const char* key, double defval, double maxval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    double v = std::stod(raw, &used);
    if (used == raw.size() && std::isfinite(v) && v >= 0 && v <= maxval) return v;
  } catch (const std::exception&) {
  }
  spdlog::warn("Ignoring malformed {}='{}', using {}", key, raw, defval);
  return defval;
}

} // namespace

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

std::vector<std::string> splitList(const std::string& csv) {
  std::vector<std::string> out;
  std::stringstream ss(csv);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

bool parseBool(const std::string& s, bool defval) {
  std::string v = trim(s);
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (v == "true" || v == "1" || v == "yes") return true;
  if (v == "false" || v == "0" || v == "no") return false;
  return defval;
}

Config loadConfigFromEnv() {
  namespace fs = std::filesystem;
  Config c;

  c.dataPath   = get_env_or("FRL_DATA_PATH", (fs::current_path() / "data").string());
  c.dbPath     = get_env_or("FRL_DB_PATH", (fs::path(c.dataPath) / "fleet-relay.db").string());
  c.videosPath = (fs::path(c.dataPath) / "videos").string();
  c.tmpPath    = (fs::path(c.dataPath) / "tmp").string();

  c.fleetUrl   = get_env_or("FRL_FLEET_URL", "");
  c.fleetToken = get_env_or("FRL_FLEET_TOKEN", "");
  c.cameras    = splitList(get_env_or("FRL_CAMERAS", "ecamera,dcamera"));
  if (c.cameras.empty()) c.cameras = {"ecamera", "dcamera"};

  c.telegramBotToken = get_env_or("FRL_TELEGRAM_BOT_TOKEN", "");
  c.telegramChatId   = get_env_or("FRL_TELEGRAM_CHAT_ID", "");
  c.telegramApiUrl   = get_env_or("FRL_TELEGRAM_API_URL", "https://api.telegram.org");

  c.chunkSizeBytes     = static_cast<std::uint64_t>(env_number_or("FRL_CHUNK_MB", 2000, kMaxChunkMb) * 1024 * 1024);
  c.chunkWindowSeconds = env_number_or("FRL_CHUNK_WINDOW_SECONDS", 30 * 60, kMaxSeconds);
  c.chunkShrinkSeconds = env_number_or("FRL_CHUNK_SHRINK_SECONDS", 120, kMaxSeconds);
  if (c.chunkWindowSeconds <= 0) c.chunkWindowSeconds = 30 * 60;
  if (c.chunkShrinkSeconds <= 0) c.chunkShrinkSeconds = 120;

  // unset or 0 = unbounded scratch
  const double maxTmpGb = env_number_or("FRL_MAX_TMP_GB", 0, kMaxTmpGb);
  if (maxTmpGb > 0)
    c.maxTmpBytes = static_cast<std::uint64_t>(maxTmpGb * 1024 * 1024 * 1024);

  c.deleteUploadedVideos = parseBool(get_env_or("FRL_DELETE_UPLOADED_VIDEOS", "false"), false);

  c.pollInterval = std::chrono::seconds(static_cast<long long>(env_number_or("FRL_POLL_SECONDS", 5, kMaxSeconds)));
  c.ffmpegPath   = get_env_or("FRL_FFMPEG", "ffmpeg");
  c.ffprobePath  = get_env_or("FRL_FFPROBE", "ffprobe");

  c.port     = static_cast<int>(env_number_or("FRL_PORT", 8080, 65535));
  c.apiKey   = get_env_or("FRL_API_KEY", ""); // empty = auth disabled
  c.logLevel = get_env_or("FRL_LOG_LEVEL", "info");
  return c;
}

} // namespace frl
