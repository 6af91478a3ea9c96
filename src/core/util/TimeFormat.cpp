#include "TimeFormat.hpp"

#include <cmath>
#include <cstdio>

namespace frl {

std::string utc_iso8601(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0)
    return std::string();
  return std::string(buf);
}

std::string utc_iso8601_now() {
  return utc_iso8601(std::time(nullptr));
}

std::string local_timestamp(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
    return std::string();
  return std::string(buf);
}

std::string clock_duration(double seconds) {
  if (!(seconds > 0)) seconds = 0;
  auto total = static_cast<long long>(std::ceil(seconds));
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld",
                total / 3600, (total / 60) % 60, total % 60);
  return std::string(buf);
}

std::string human_bytes(std::uint64_t bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double v = static_cast<double>(bytes);
  int u = 0;
  while (v >= 1024.0 && u < 4) { v /= 1024.0; ++u; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
  return std::string(buf);
}

} // namespace frl
