#include "TransferOrchestrator.hpp"

#include <filesystem>
#include <optional>
#include <sys/stat.h>
#include <system_error>

#include <spdlog/spdlog.h>

#include "UploadQueue.hpp"
#include "core/errors/Errors.hpp"
#include "core/ledger/ProgressLedger.hpp"
#include "core/media/MediaProber.hpp"
#include "core/media/RouteFileName.hpp"
#include "core/storage/ResourceGuard.hpp"
#include "core/storage/ScratchStore.hpp"
#include "core/util/Retry.hpp"
#include "core/util/TimeFormat.hpp"

namespace frl {

const char* toString(TransferOutcome o) {
  switch (o) {
    case TransferOutcome::InvalidName:     return "invalid-name";
    case TransferOutcome::ProbeFailed:     return "probe-failed";
    case TransferOutcome::AlreadyComplete: return "already-complete";
    case TransferOutcome::Completed:       return "completed";
    case TransferOutcome::Failed:          return "failed";
    case TransferOutcome::Interrupted:     return "interrupted";
  }
  return "unknown";
}

static std::time_t modified_at(const std::string& path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) return 0;
  return st.st_mtime;
}

TransferOrchestrator::TransferOrchestrator(MediaProber& prober,
                                           MediaExtractor& extractor,
                                           ProgressLedger& ledger,
                                           UploadQueue& queue,
                                           ResourceGuard& guard,
                                           const ScratchStore& scratch,
                                           OrchestratorOptions options)
  : prober_(prober),
    extractor_(extractor),
    ledger_(ledger),
    queue_(queue),
    guard_(guard),
    scratch_(scratch),
    options_(options) {}

TransferOutcome TransferOrchestrator::transfer(const std::string& videoPath) {
  const auto name = parseRouteFileName(videoPath);
  if (!name) {
    spdlog::warn("Skipping {}: not <route>--<segment>-<camera>.mp4", videoPath);
    return TransferOutcome::InvalidName;
  }

  SourceMedia src;
  src.routeId = name->routeId;
  src.camera  = name->camera;
  src.path    = videoPath;
  try {
    src.info = prober_.probe(videoPath);
  } catch (const ProbeError& e) {
    spdlog::error("Probe failed for {}: {}", videoPath, e.what());
    return TransferOutcome::ProbeFailed;
  }
  src.modifiedAt = modified_at(videoPath);

  const double resumeFrom = resumePoint(src);
  if (resumeFrom >= src.info.durationSeconds) {
    spdlog::info("{} already uploaded ({} of {})", videoPath,
                 clock_duration(resumeFrom), clock_duration(src.info.durationSeconds));
    finish(src);
    return TransferOutcome::AlreadyComplete;
  }

  spdlog::info("Uploading {} from {} of {} ({})", videoPath, clock_duration(resumeFrom),
               clock_duration(src.info.durationSeconds), human_bytes(src.info.byteSize));

  ChunkPlanner planner(extractor_, scratch_, src, options_.capBytes, resumeFrom, options_.planner);
  for (;;) {
    if (!guard_.awaitCapacity()) {
      spdlog::info("Shutdown while waiting for scratch space, leaving {}", videoPath);
      return TransferOutcome::Interrupted;
    }

    std::optional<Chunk> chunk;
    try {
      chunk = planner.next();
    } catch (const ChunkTooLargeError& e) {
      spdlog::error("Giving up on {}: {}", videoPath, e.what());
      return TransferOutcome::Failed;
    } catch (const ExtractionError& e) {
      spdlog::error("Extraction failed for {}: {}", videoPath, e.what());
      return TransferOutcome::Failed;
    }
    if (!chunk) break;

    QueueItem item;
    item.message.filePath          = chunk->path;
    item.message.fileName          = std::filesystem::path(videoPath).filename().string();
    item.message.caption           = caption(src, *chunk);
    item.message.width             = src.info.width;
    item.message.height            = src.info.height;
    item.message.durationSeconds   = displayDuration(chunk->end - chunk->start);
    item.message.supportsStreaming = true;
    item.routeId  = src.routeId;
    item.camera   = src.camera;
    item.rangeEnd = chunk->end;

    try {
      queue_.enqueue(std::move(item)).get();
    } catch (const std::exception& e) {
      // the chunk is ours again once the queue gives up on it
      std::error_code ec;
      std::filesystem::remove(chunk->path, ec);
      spdlog::error("Upload of {} [{} - {}] failed: {}", videoPath,
                    clock_duration(chunk->start), clock_duration(chunk->end), e.what());
      return TransferOutcome::Failed;
    }
  }

  finish(src);
  return TransferOutcome::Completed;
}

double TransferOrchestrator::resumePoint(const SourceMedia& src) {
  try {
    return retryWithBackoff<LedgerIOError>(
      "ledger read", options_.ledgerAttempts, options_.ledgerRetryDelay,
      [&] { return ledger_.read(src.routeId, src.camera); });
  } catch (const LedgerIOError& e) {
    spdlog::warn("Ledger unavailable for {} {}, starting from 0: {}", src.routeId, src.camera, e.what());
    return 0.0;
  }
}

void TransferOrchestrator::finish(const SourceMedia& src) {
  try {
    retryWithBackoff<LedgerIOError>(
      "ledger mark processed", options_.ledgerAttempts, options_.ledgerRetryDelay,
      [&] { ledger_.markProcessed(src.routeId, src.camera, utc_iso8601_now()); });
  } catch (const LedgerIOError& e) {
    // next discovery pass lands in ALREADY_COMPLETE and tries again
    spdlog::warn("Could not mark {} processed: {}", src.path, e.what());
    return;
  }

  if (options_.deleteSourceWhenDone) {
    std::error_code ec;
    if (std::filesystem::remove(src.path, ec))
      spdlog::info("Deleted uploaded source {}", src.path);
    else if (ec)
      spdlog::warn("Cannot delete {}: {}", src.path, ec.message());
  }
  spdlog::info("Done with {} ({} {})", src.path, src.routeId, src.camera);
}

std::string TransferOrchestrator::caption(const SourceMedia& src, const Chunk& chunk) const {
  return "\xF0\x9F\x9A\x97 Route: " + local_timestamp(src.modifiedAt) + "\n" +
         "\xF0\x9F\x93\xB7 Camera: " + src.camera + " (" + src.routeId + ")\n" +
         "\xE2\x8F\xB1 Time: " + clock_duration(chunk.start) + " - " + clock_duration(chunk.end);
}

} // namespace frl
