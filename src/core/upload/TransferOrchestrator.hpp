#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "core/media/ChunkPlanner.hpp"

namespace frl {

class MediaProber;
class MediaExtractor;
class ProgressLedger;
class UploadQueue;
class ResourceGuard;
class ScratchStore;

enum class TransferOutcome {
  InvalidName,      // not "<routeId>--<segment>-<camera>.mp4"
  ProbeFailed,
  AlreadyComplete,  // ledger already covered the whole duration
  Completed,        // every chunk delivered
  Failed,           // oversized range, extraction or delivery failure
  Interrupted       // shutdown while waiting for scratch capacity
};

const char* toString(TransferOutcome o);

struct OrchestratorOptions {
  std::uint64_t             capBytes = 2000ull * 1024 * 1024;
  PlannerOptions            planner;
  bool                      deleteSourceWhenDone = false;
  int                       ledgerAttempts = 3;
  std::chrono::milliseconds ledgerRetryDelay{500};
};

// Drives one source file through probe -> plan -> guard -> enqueue -> await,
// one chunk at a time, and does the final housekeeping once the ledger covers
// the file. Errors are contained to the file and reported as an outcome.
class TransferOrchestrator {
public:
  TransferOrchestrator(MediaProber& prober,
                       MediaExtractor& extractor,
                       ProgressLedger& ledger,
                       UploadQueue& queue,
                       ResourceGuard& guard,
                       const ScratchStore& scratch,
                       OrchestratorOptions options);

  TransferOutcome transfer(const std::string& videoPath);

private:
  double resumePoint(const SourceMedia& src);
  void finish(const SourceMedia& src);
  std::string caption(const SourceMedia& src, const Chunk& chunk) const;

  MediaProber&        prober_;
  MediaExtractor&     extractor_;
  ProgressLedger&     ledger_;
  UploadQueue&        queue_;
  ResourceGuard&      guard_;
  const ScratchStore& scratch_;
  OrchestratorOptions options_;
};

} // namespace frl
