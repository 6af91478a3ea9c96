#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "MediaExtractor.hpp"
#include "SourceMedia.hpp"

namespace frl {

class ScratchStore;

struct PlannerOptions {
  double windowSeconds = 30 * 60;  // nominal range width
  double shrinkSeconds = 120;      // end-time decrement when a range is oversized
  double endEpsilonSeconds = 2;    // absorbs container rounding at the tail
};

// An accepted extract on disk. The caller owns the file from here on.
struct Chunk {
  std::string   path;
  double        start = 0;
  double        end = 0;
  std::uint64_t bytes = 0;
};

// Lazily splits one source into contiguous ranges covering
// [resumeFrom, duration], each realized at most capBytes.
//
// A fixed nominal window is tried first (stretched to the end of the file when
// less than endEpsilonSeconds would remain); while the extract is over the cap the
// end is pulled in by shrinkSeconds and the same start is re-extracted. When
// the end can no longer move past the start, next() throws ChunkTooLargeError
// and the plan is over.
class ChunkPlanner {
public:
  ChunkPlanner(MediaExtractor& extractor,
               const ScratchStore& scratch,
               const SourceMedia& source,
               std::uint64_t capBytes,
               double resumeFrom,
               PlannerOptions options = {});

  // nullopt once the plan is exhausted.
  // Throws ChunkTooLargeError or ExtractionError; the plan is then finished.
  std::optional<Chunk> next();

  bool finished() const { return finished_; }
  double position() const { return start_; }

private:
  MediaExtractor&     extractor_;
  const ScratchStore& scratch_;
  SourceMedia         source_;
  std::uint64_t       capBytes_;
  PlannerOptions      options_;
  double              start_;
  bool                finished_;
};

} // namespace frl
