#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace frl {

// Process-wide stop request shared by the pollers, the queue worker and the
// resource guard. waitFor() is the interruptible delay used by every loop.
class ShutdownSignal {
public:
  void request() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      requested_ = true;
    }
    cv_.notify_all();
  }

  bool requested() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return requested_;
  }

  // Sleeps up to `d`. Returns false if shutdown was requested meanwhile.
  template <class Rep, class Period>
  bool waitFor(std::chrono::duration<Rep, Period> d) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, d, [this] { return requested_; });
    return !requested_;
  }

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  bool requested_ = false;
};

} // namespace frl
