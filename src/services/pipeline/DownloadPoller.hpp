#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace frl {

class FleetSource;
class ScratchStore;
class ProgressLedger;
class ShutdownSignal;

// Download direction outer loop: list fleet routes and fetch every configured
// camera that the ledger has not seen downloaded.
class DownloadPoller {
public:
  DownloadPoller(FleetSource& fleet,
                 const ScratchStore& scratch,
                 ProgressLedger& ledger,
                 std::vector<std::string> cameras,
                 ShutdownSignal& shutdown,
                 std::chrono::milliseconds interval);

  // One cycle; the first error ends it. Returns videos downloaded.
  std::size_t runOnce();

  void run();

private:
  FleetSource&              fleet_;
  const ScratchStore&       scratch_;
  ProgressLedger&           ledger_;
  std::vector<std::string>  cameras_;
  ShutdownSignal&           shutdown_;
  std::chrono::milliseconds interval_;
};

} // namespace frl
