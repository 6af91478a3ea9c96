#include "DownloadPoller.hpp"

#include <spdlog/spdlog.h>

#include "core/ledger/ProgressLedger.hpp"
#include "core/storage/ScratchStore.hpp"
#include "core/util/ShutdownSignal.hpp"
#include "core/util/TimeFormat.hpp"
#include "services/fleet/FleetClient.hpp"

namespace frl {

DownloadPoller::DownloadPoller(FleetSource& fleet,
                               const ScratchStore& scratch,
                               ProgressLedger& ledger,
                               std::vector<std::string> cameras,
                               ShutdownSignal& shutdown,
                               std::chrono::milliseconds interval)
  : fleet_(fleet),
    scratch_(scratch),
    ledger_(ledger),
    cameras_(std::move(cameras)),
    shutdown_(shutdown),
    interval_(interval) {}

std::size_t DownloadPoller::runOnce() {
  std::size_t downloaded = 0;
  for (const auto& routeId : fleet_.listRoutes()) {
    for (const auto& camera : cameras_) {
      if (shutdown_.requested()) return downloaded;
      if (ledger_.isDownloaded(routeId, camera)) continue;

      spdlog::info("Downloading {} {}", routeId, camera);
      fleet_.download(routeId, camera, scratch_.videoPath(routeId, camera));
      ledger_.markDownloaded(routeId, camera, utc_iso8601_now());
      ++downloaded;
    }
  }
  return downloaded;
}

void DownloadPoller::run() {
  spdlog::info("Download poller started (every {} ms)", interval_.count());
  while (!shutdown_.requested()) {
    try {
      runOnce();
    } catch (const std::exception& e) {
      spdlog::error("Download cycle failed: {}", e.what());
    }
    if (!shutdown_.waitFor(interval_)) break;
  }
  spdlog::info("Download poller stopped");
}

} // namespace frl
