#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "bindbench/core/cancel.hpp"
#include "bindbench/core/expected.hpp"
#include "bindbench/core/types.hpp"
#include "bindbench/process/child_process.hpp"
#include "bindbench/process/process_group.hpp"

namespace bindbench {

class ContainerRuntime;

// Graceful escalation window: 50 polls, 100 ms apart.
inline constexpr int kGracefulPolls = 50;
inline constexpr std::chrono::milliseconds kGracefulPollInterval{100};

inline constexpr std::chrono::milliseconds kInitialBackoff{1};
inline constexpr std::chrono::milliseconds kMaxBackoff{100};

// One running transfer. Running -> NaturallyExited | ForcefullyTerminated,
// exactly once.
class IProcessHandle {
 public:
  virtual ~IProcessHandle() = default;

  virtual HandleState state() const noexcept = 0;

  // Polls until the transfer exits, the timeout elapses or cancellation is
  // requested; the latter two terminate it. transferred_bytes is left at 0.
  virtual Expected<RunResult> wait_with_timeout(std::chrono::milliseconds timeout,
                                                const CancellationToken& cancel) = 0;
};

std::unique_ptr<IProcessHandle> make_local_process_handle(
    ChildProcess child,
    TerminationPolicy policy,
    std::shared_ptr<IProcessGroupController> controller);

std::unique_ptr<IProcessHandle> make_container_process_handle(
    ChildProcess client,
    std::string container_name,
    std::shared_ptr<const ContainerRuntime> runtime,
    std::shared_ptr<IProcessGroupController> controller);

}  // namespace bindbench
