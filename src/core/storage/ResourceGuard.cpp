#include "ResourceGuard.hpp"

#include <spdlog/spdlog.h>

#include "ScratchStore.hpp"
#include "core/util/ShutdownSignal.hpp"
#include "core/util/TimeFormat.hpp"

namespace frl {

ResourceGuard::ResourceGuard(std::string scratchDir,
                             std::optional<std::uint64_t> maxBytes,
                             ShutdownSignal& shutdown,
                             std::chrono::milliseconds pollInterval)
  : scratchDir_(std::move(scratchDir)),
    maxBytes_(maxBytes),
    shutdown_(shutdown),
    pollInterval_(pollInterval) {}

bool ResourceGuard::hasCapacity() const {
  if (!maxBytes_) return true;
  return ScratchStore::directorySize(scratchDir_) < *maxBytes_;
}

bool ResourceGuard::awaitCapacity() {
  if (!maxBytes_) return true;

  bool logged = false;
  while (!hasCapacity()) {
    if (!logged) {
      spdlog::info("Scratch {} over budget ({} >= {}), waiting for uploads",
                   scratchDir_, human_bytes(ScratchStore::directorySize(scratchDir_)),
                   human_bytes(*maxBytes_));
      logged = true;
    }
    if (!shutdown_.waitFor(pollInterval_)) return false;
  }
  return !shutdown_.requested();
}

} // namespace frl
