#include "ChunkPlanner.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/storage/ScratchStore.hpp"
#include "core/util/TimeFormat.hpp"

namespace frl {

ChunkPlanner::ChunkPlanner(MediaExtractor& extractor,
                           const ScratchStore& scratch,
                           const SourceMedia& source,
                           std::uint64_t capBytes,
                           double resumeFrom,
                           PlannerOptions options)
  : extractor_(extractor),
    scratch_(scratch),
    source_(source),
    capBytes_(capBytes),
    options_(options),
    start_(std::max(0.0, resumeFrom)),
    finished_(start_ >= source.info.durationSeconds) {}

std::optional<Chunk> ChunkPlanner::next() {
  namespace fs = std::filesystem;
  if (finished_) return std::nullopt;

  const double duration = source_.info.durationSeconds;
  double end = std::min(start_ + options_.windowSeconds, duration);
  // a tail shorter than epsilon joins this range instead of becoming its own
  if (end >= duration - options_.endEpsilonSeconds) end = duration;
  if (!(end > start_)) {
    finished_ = true;
    return std::nullopt;
  }

  const std::string output = scratch_.chunkPath(source_.routeId, source_.camera, start_);
  std::error_code ec;
  std::uint64_t size = 0;

  for (;;) {
    fs::remove(output, ec);
    try {
      extractor_.extractRange(source_.path, start_, end, output);
    } catch (const ExtractionError&) {
      fs::remove(output, ec);
      finished_ = true;
      throw;
    }

    size = fs::file_size(output, ec);
    if (ec) {
      finished_ = true;
      throw ExtractionError("cannot stat chunk " + output + ": " + ec.message());
    }
    if (size <= capBytes_) break;

    fs::remove(output, ec);
    const double shrunk = end - options_.shrinkSeconds;
    if (!(shrunk > start_)) {
      finished_ = true;
      throw ChunkTooLargeError("range starting at " + clock_duration(start_) +
                               " is still " + human_bytes(size) + " at its shortest",
                               start_, end);
    }
    spdlog::info("Chunk too big ({} > {}), shrinking {} -> {}",
                 human_bytes(size), human_bytes(capBytes_),
                 clock_duration(end), clock_duration(shrunk));
    end = shrunk;
  }

  Chunk chunk{output, start_, end, size};
  spdlog::info("Chunk created {} [{} - {}] ({})",
               output, clock_duration(start_), clock_duration(end), human_bytes(size));

  // a shrunk end near the duration still leaves a tail to send
  if (end >= duration) finished_ = true;
  start_ = end;
  return chunk;
}

} // namespace frl
