#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Transport.hpp"

namespace frl {

class ProgressLedger;

struct QueueItem {
  VideoMessage message;   // message.filePath is the chunk file
  std::string  routeId;
  std::string  camera;
  double       rangeEnd = 0;   // ledger candidate once delivered
};

// Observability copy of a queued item.
struct QueueItemView {
  std::string routeId;
  std::string camera;
  std::string filePath;
  double      rangeEnd = 0;
  bool        inFlight = false;
};

struct UploadQueueOptions {
  std::chrono::milliseconds idleInterval{1000};
  int                       ledgerAttempts = 3;
  std::chrono::milliseconds ledgerRetryDelay{500};
};

// Single-flight FIFO in front of the transport.
//
// One worker thread takes items in enqueue order and holds the head item in
// the queue until both the transport call and the ledger update finish, so at
// most one transport call is ever in flight.
//
// On success the ledger is advanced to rangeEnd, the chunk file is deleted and
// the future becomes ready. On transport or ledger failure the future carries
// the exception and the chunk file is left in place. Items still queued at
// shutdown fail with QueueClosedError.
class UploadQueue {
public:
  UploadQueue(Transport& transport, ProgressLedger& ledger, UploadQueueOptions options = {});
  ~UploadQueue();

  UploadQueue(const UploadQueue&) = delete;
  UploadQueue& operator=(const UploadQueue&) = delete;

  void start();
  void shutdown();

  std::future<void> enqueue(QueueItem item);

  // Includes the item currently being sent.
  std::size_t size() const;
  std::vector<QueueItemView> snapshot() const;

private:
  struct Entry {
    QueueItem          item;
    std::promise<void> done;
  };

  void workerLoop();
  void process(Entry& entry);

  Transport&         transport_;
  ProgressLedger&    ledger_;
  UploadQueueOptions options_;

  mutable std::mutex      mtx_;
  std::condition_variable cv_;
  std::deque<Entry>       items_;
  bool                    inFlight_ = false;
  bool                    stopping_ = false;
  std::thread             worker_;
};

} // namespace frl
