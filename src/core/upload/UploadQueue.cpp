#include "UploadQueue.hpp"

#include <exception>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/ledger/ProgressLedger.hpp"
#include "core/util/Retry.hpp"
#include "core/util/TimeFormat.hpp"

namespace frl {

UploadQueue::UploadQueue(Transport& transport, ProgressLedger& ledger, UploadQueueOptions options)
  : transport_(transport), ledger_(ledger), options_(options) {}

UploadQueue::~UploadQueue() {
  shutdown();
}

void UploadQueue::start() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (worker_.joinable() || stopping_) return;
  worker_ = std::thread([this] { workerLoop(); });
}

void UploadQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();

  // Never started, or items raced in while the worker was exiting.
  std::deque<Entry> left;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    left.swap(items_);
  }
  for (auto& e : left)
    e.done.set_exception(std::make_exception_ptr(QueueClosedError("upload queue shut down")));
}

std::future<void> UploadQueue::enqueue(QueueItem item) {
  Entry entry{std::move(item), std::promise<void>()};
  auto fut = entry.done.get_future();
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (stopping_) {
      entry.done.set_exception(std::make_exception_ptr(QueueClosedError("upload queue shut down")));
      return fut;
    }
    spdlog::info("Queued {} ({} {}), position {}",
                 entry.item.message.filePath, entry.item.routeId, entry.item.camera, items_.size() + 1);
    items_.push_back(std::move(entry));
  }
  cv_.notify_all();
  return fut;
}

std::size_t UploadQueue::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return items_.size();
}

std::vector<QueueItemView> UploadQueue::snapshot() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<QueueItemView> out;
  out.reserve(items_.size());
  bool first = true;
  for (const auto& e : items_) {
    out.push_back({e.item.routeId, e.item.camera, e.item.message.filePath,
                   e.item.rangeEnd, first && inFlight_});
    first = false;
  }
  return out;
}

void UploadQueue::workerLoop() {
  for (;;) {
    Entry* head = nullptr;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      if (stopping_) break;
      if (items_.empty()) {
        cv_.wait_for(lk, options_.idleInterval);
        continue;
      }
      // push_back on a deque keeps references to existing elements valid
      head = &items_.front();
      inFlight_ = true;
    }

    process(*head);

    {
      std::lock_guard<std::mutex> lk(mtx_);
      inFlight_ = false;
      items_.pop_front();
    }
  }
  spdlog::debug("Upload worker stopped");
}

void UploadQueue::process(Entry& entry) {
  const QueueItem& item = entry.item;
  const std::string& path = item.message.filePath;

  spdlog::info("Sending {} ({} {}, until {})",
               path, item.routeId, item.camera, clock_duration(item.rangeEnd));
  try {
    transport_.sendVideo(item.message);
  } catch (const std::exception& e) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(path, ec);
    spdlog::error("Sending {} failed ({}): {}", path, ec ? std::string("size unknown") : human_bytes(sz), e.what());
    entry.done.set_exception(std::make_exception_ptr(TransportError(e.what())));
    return;
  }

  try {
    const double stored = retryWithBackoff<LedgerIOError>(
      "ledger advance", options_.ledgerAttempts, options_.ledgerRetryDelay,
      [&] { return ledger_.advance(item.routeId, item.camera, item.rangeEnd); });
    spdlog::debug("Ledger {} {} now at {}", item.routeId, item.camera, clock_duration(stored));
  } catch (const LedgerIOError& e) {
    spdlog::error("Sent {} but could not record progress: {}", path, e.what());
    entry.done.set_exception(std::current_exception());
    return;
  }

  std::error_code ec;
  if (!std::filesystem::remove(path, ec) && ec)
    spdlog::warn("Cannot remove sent chunk {}: {}", path, ec.message());
  else
    spdlog::info("Sent and removed {}", path);

  entry.done.set_value();
}

} // namespace frl
