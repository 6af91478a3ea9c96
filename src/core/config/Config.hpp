#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace frl {

struct Config {
  // Paths
  std::string dataPath;
  std::string dbPath;
  std::string videosPath;
  std::string tmpPath;

  // Fleet (download side). Empty URL disables downloads.
  std::string fleetUrl;
  std::string fleetToken;
  std::vector<std::string> cameras;

  // Telegram (upload side). Token + chat id enable uploads.
  std::string telegramBotToken;
  std::string telegramChatId;
  std::string telegramApiUrl;

  // Chunking
  std::uint64_t chunkSizeBytes = 0;
  double chunkWindowSeconds = 0;
  double chunkShrinkSeconds = 0;
  std::optional<std::uint64_t> maxTmpBytes;
  bool deleteUploadedVideos = false;

  std::chrono::seconds pollInterval{5};
  std::string ffmpegPath;
  std::string ffprobePath;

  // Operator API
  int port = 8080;
  std::string apiKey;

  std::string logLevel;

  bool uploadEnabled() const { return !telegramBotToken.empty() && !telegramChatId.empty(); }
  bool downloadEnabled() const { return !fleetUrl.empty(); }
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads every FRL_* variable, applying defaults for missing or malformed values.
Config loadConfigFromEnv();

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> splitList(const std::string& csv);

bool parseBool(const std::string& s, bool defval);

} // namespace frl
