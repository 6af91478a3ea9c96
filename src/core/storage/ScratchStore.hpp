#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace frl {

// Owns the two on-disk areas: the videos directory (downloaded sources) and
// the scratch directory (chunks waiting for upload).
class ScratchStore {
public:
  ScratchStore(std::string videosRoot, std::string tmpRoot)
    : videosRoot_(std::move(videosRoot)), tmpRoot_(std::move(tmpRoot)) {}

  void ensureDirs() const;

  const std::string& videosRoot() const { return videosRoot_; }
  const std::string& tmpRoot() const { return tmpRoot_; }

  // tmp/<routeId>-<camera>--<start>.mp4
  std::string chunkPath(const std::string& routeId, const std::string& camera, double start) const;

  // videos/<routeId>-<camera>.mp4; downloads are written to "<that>.tmp" first.
  std::string videoPath(const std::string& routeId, const std::string& camera) const;

  // Sorted full paths of videos/*.mp4.
  std::vector<std::string> listSourceVideos() const;

  // Everything in scratch is unreferenced after a restart. Returns files removed.
  std::size_t removeOrphanedChunks() const;

  // videos/*.tmp left by an interrupted download.
  std::size_t removePartialDownloads() const;

  // Sum of regular file sizes below `dir`; files vanishing mid-walk are skipped.
  static std::uint64_t directorySize(const std::string& dir);

private:
  std::string videosRoot_;
  std::string tmpRoot_;
};

} // namespace frl
