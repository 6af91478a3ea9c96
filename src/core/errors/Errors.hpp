#pragma once
#include <stdexcept>
#include <string>

namespace frl {

// Source file is unreadable or lacks duration / a video stream. Fatal for that file.
class ProbeError : public std::runtime_error {
public:
  explicit ProbeError(const std::string& what) : std::runtime_error(what) {}
};

// A range could not be shrunk under the byte cap.
class ChunkTooLargeError : public std::runtime_error {
public:
  ChunkTooLargeError(const std::string& what, double start, double end)
    : std::runtime_error(what), start_(start), end_(end) {}

  double start() const { return start_; }
  double end() const { return end_; }

private:
  double start_;
  double end_;
};

// The encoder process failed to produce a chunk.
class ExtractionError : public std::runtime_error {
public:
  explicit ExtractionError(const std::string& what) : std::runtime_error(what) {}
};

// Remote send failed. Always treated as transient for the item.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Ledger database unavailable or a statement failed.
class LedgerIOError : public std::runtime_error {
public:
  explicit LedgerIOError(const std::string& what) : std::runtime_error(what) {}
};

// Fleet listing or footage download failed.
class FleetError : public std::runtime_error {
public:
  explicit FleetError(const std::string& what) : std::runtime_error(what) {}
};

// Queue shut down before the item reached the transport.
class QueueClosedError : public std::runtime_error {
public:
  explicit QueueClosedError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace frl
