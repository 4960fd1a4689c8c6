#include "process/wait_loop.hpp"

#include <algorithm>
#include <thread>

#include "bindbench/process/process_handle.hpp"

namespace bindbench::detail {

Expected<RunResult> wait_with_deadline(ChildProcess& child,
                                       std::chrono::milliseconds timeout,
                                       const CancellationToken& cancel,
                                       const TerminateFn& terminate) {
  using Clock = ChildProcess::Clock;

  const auto start = child.started_at();
  const auto deadline = start + timeout;
  std::chrono::nanoseconds delay = kInitialBackoff;

  for (;;) {
    auto polled = child.try_wait();
    if (!polled) {
      return std::unexpected(polled.error());
    }
    if (polled->has_value()) {
      return RunResult{
          .exit_status = **polled,
          .elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start),
          .transferred_bytes = 0,
          .state = HandleState::NaturallyExited,
      };
    }

    const auto now = Clock::now();
    if (cancel.requested() || now >= deadline) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - start);
      auto killed = terminate();
      if (!killed) {
        return std::unexpected(killed.error());
      }
      return RunResult{
          .exit_status = *killed,
          .elapsed = elapsed,
          .transferred_bytes = 0,
          .state = HandleState::ForcefullyTerminated,
      };
    }

    const auto remaining = deadline - now;
    std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(delay, remaining));
    delay = std::min<std::chrono::nanoseconds>(delay * 2, kMaxBackoff);
  }
}

}  // namespace bindbench::detail
