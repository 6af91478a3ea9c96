#pragma once
#include <chrono>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

namespace frl {

// Runs fn() up to `attempts` times, doubling the delay after each failure of
// type E. The last failure is rethrown.
template <class E, class Fn>
auto retryWithBackoff(const std::string& what,
                      int attempts,
                      std::chrono::milliseconds delay,
                      Fn&& fn) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const E& e) {
      if (attempt >= attempts) throw;
      spdlog::warn("{} failed (attempt {}/{}): {}", what, attempt, attempts, e.what());
      std::this_thread::sleep_for(delay);
      delay *= 2;
    }
  }
}

} // namespace frl
