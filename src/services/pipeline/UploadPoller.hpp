#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace frl {

class ScratchStore;
class ProgressLedger;
class TransferOrchestrator;
class ShutdownSignal;

// Upload direction outer loop: find unfinished videos, hand each to the
// orchestrator, sleep, repeat. Per-file failures never end the loop.
class UploadPoller {
public:
  UploadPoller(const ScratchStore& scratch,
               ProgressLedger& ledger,
               TransferOrchestrator& orchestrator,
               ShutdownSignal& shutdown,
               std::chrono::milliseconds interval);

  // Videos with a valid route name whose ledger entry is not processed.
  std::vector<std::string> discover();

  // One discovery cycle. Returns the number of files handed to the orchestrator.
  std::size_t runOnce();

  // Blocks until shutdown is requested.
  void run();

private:
  const ScratchStore&       scratch_;
  ProgressLedger&           ledger_;
  TransferOrchestrator&     orchestrator_;
  ShutdownSignal&           shutdown_;
  std::chrono::milliseconds interval_;
};

} // namespace frl
