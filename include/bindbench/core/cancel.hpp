#pragma once

#include <atomic>

namespace bindbench {

// Set from a signal handler, read by the benchmark loop and every poll tick.
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // Async-signal-safe.
  void request() noexcept { flag_.store(true, std::memory_order_release); }

  bool requested() const noexcept { return flag_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> flag_{false};
  static_assert(std::atomic<bool>::is_always_lock_free);
};

}  // namespace bindbench
