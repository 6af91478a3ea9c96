#include "ScratchStore.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace frl {

namespace fs = std::filesystem;

void ScratchStore::ensureDirs() const {
  fs::create_directories(videosRoot_);
  fs::create_directories(tmpRoot_);
}

std::string ScratchStore::chunkPath(const std::string& routeId,
                                    const std::string& camera,
                                    double start) const {
  char startBuf[32];
  std::snprintf(startBuf, sizeof(startBuf), "%.3f", start);
  return (fs::path(tmpRoot_) / (routeId + "-" + camera + "--" + startBuf + ".mp4")).string();
}

std::string ScratchStore::videoPath(const std::string& routeId, const std::string& camera) const {
  return (fs::path(videosRoot_) / (routeId + "-" + camera + ".mp4")).string();
}

std::vector<std::string> ScratchStore::listSourceVideos() const {
  std::vector<std::string> out;
  std::error_code ec;
  for (fs::directory_iterator it(videosRoot_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code fe;
    if (!it->is_regular_file(fe)) continue;
    if (it->path().extension() == ".mp4") out.push_back(it->path().string());
  }
  if (ec) spdlog::warn("Listing {} failed: {}", videosRoot_, ec.message());
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t ScratchStore::removeOrphanedChunks() const {
  std::size_t removed = 0;
  std::error_code ec;
  for (fs::directory_iterator it(tmpRoot_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code rm;
    if (fs::remove_all(it->path(), rm) > 0 && !rm) {
      spdlog::info("Removed orphaned scratch file: {}", it->path().filename().string());
      ++removed;
    } else if (rm) {
      spdlog::warn("Cannot remove {}: {}", it->path().string(), rm.message());
    }
  }
  return removed;
}

std::size_t ScratchStore::removePartialDownloads() const {
  std::size_t removed = 0;
  std::error_code ec;
  for (fs::directory_iterator it(videosRoot_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() != ".tmp") continue;
    std::error_code rm;
    if (fs::remove(it->path(), rm)) {
      spdlog::info("Removed partial download: {}", it->path().filename().string());
      ++removed;
    } else if (rm) {
      spdlog::warn("Cannot remove {}: {}", it->path().string(), rm.message());
    }
  }
  return removed;
}

std::uint64_t ScratchStore::directorySize(const std::string& dir) {
  std::uint64_t total = 0;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code fe;
    if (!it->is_regular_file(fe)) continue;
    auto sz = it->file_size(fe);
    if (!fe) total += sz;
  }
  return total;
}

} // namespace frl
