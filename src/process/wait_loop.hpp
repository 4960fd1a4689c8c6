#pragma once

#include <chrono>
#include <functional>

#include "bindbench/core/cancel.hpp"
#include "bindbench/core/expected.hpp"
#include "bindbench/core/types.hpp"
#include "bindbench/process/child_process.hpp"

namespace bindbench::detail {

// Called only right after a try_wait() that reported the child still running.
using TerminateFn = std::function<Expected<ExitStatus>()>;

// Adaptive poll: 1 ms backoff doubling to 100 ms, never sleeping past the
// deadline. Elapsed time of a terminated run is taken when termination starts.
Expected<RunResult> wait_with_deadline(ChildProcess& child,
                                       std::chrono::milliseconds timeout,
                                       const CancellationToken& cancel,
                                       const TerminateFn& terminate);

}  // namespace bindbench::detail
