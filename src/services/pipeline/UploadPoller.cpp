#include "UploadPoller.hpp"

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/ledger/ProgressLedger.hpp"
#include "core/media/RouteFileName.hpp"
#include "core/storage/ScratchStore.hpp"
#include "core/upload/TransferOrchestrator.hpp"
#include "core/util/ShutdownSignal.hpp"

namespace frl {

UploadPoller::UploadPoller(const ScratchStore& scratch,
                           ProgressLedger& ledger,
                           TransferOrchestrator& orchestrator,
                           ShutdownSignal& shutdown,
                           std::chrono::milliseconds interval)
  : scratch_(scratch),
    ledger_(ledger),
    orchestrator_(orchestrator),
    shutdown_(shutdown),
    interval_(interval) {}

std::vector<std::string> UploadPoller::discover() {
  std::vector<std::string> out;
  for (const auto& path : scratch_.listSourceVideos()) {
    const auto name = parseRouteFileName(path);
    if (!name) {
      spdlog::debug("Ignoring {}: unrecognized name", path);
      continue;
    }
    try {
      if (ledger_.isProcessed(name->routeId, name->camera)) continue;
    } catch (const LedgerIOError& e) {
      spdlog::warn("Ledger unavailable, treating {} as unprocessed: {}", path, e.what());
    }
    out.push_back(path);
  }
  if (!out.empty()) spdlog::info("Found {} videos to upload", out.size());
  return out;
}

std::size_t UploadPoller::runOnce() {
  std::size_t attempted = 0;
  for (const auto& path : discover()) {
    if (shutdown_.requested()) break;
    ++attempted;
    try {
      const auto outcome = orchestrator_.transfer(path);
      spdlog::info("{}: {}", path, toString(outcome));
    } catch (const std::exception& e) {
      spdlog::error("Uploading {} failed: {}", path, e.what());
    }
  }
  return attempted;
}

void UploadPoller::run() {
  spdlog::info("Upload poller started (every {} ms)", interval_.count());
  while (!shutdown_.requested()) {
    try {
      runOnce();
    } catch (const std::exception& e) {
      spdlog::error("Upload cycle failed: {}", e.what());
    }
    if (!shutdown_.waitFor(interval_)) break;
  }
  spdlog::info("Upload poller stopped");
}

} // namespace frl
