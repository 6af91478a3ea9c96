#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace frl {

class ShutdownSignal;

// Backpressure on chunk production: holds the caller while the scratch
// directory is at or over its byte budget.
class ResourceGuard {
public:
  ResourceGuard(std::string scratchDir,
                std::optional<std::uint64_t> maxBytes,
                ShutdownSignal& shutdown,
                std::chrono::milliseconds pollInterval = std::chrono::seconds(5));

  // Returns true once usage is below the budget (immediately when unbounded),
  // false if shutdown was requested while waiting.
  bool awaitCapacity();

  bool hasCapacity() const;

private:
  std::string scratchDir_;
  std::optional<std::uint64_t> maxBytes_;
  ShutdownSignal& shutdown_;
  std::chrono::milliseconds pollInterval_;
};

} // namespace frl
