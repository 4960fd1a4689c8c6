#pragma once

#include <cstddef>
#include <memory>

#include <sys/types.h>

#include "bindbench/core/expected.hpp"

namespace bindbench {

// All raw signalling and reaping goes through here.
class IProcessGroupController {
 public:
  virtual ~IProcessGroupController() = default;

  virtual Expected<void> signal_primary(pid_t pid, int sig) = 0;
  virtual Expected<void> signal_group(pid_t pgid, int sig) = 0;

  // Collects every already-terminated child without blocking. Returns the
  // number of children reaped.
  virtual size_t reap_orphans() noexcept = 0;
};

std::shared_ptr<IProcessGroupController> make_posix_process_group_controller();

// Makes orphaned descendants re-parent to this process so reap_orphans() can
// collect them. No-op where unsupported.
Expected<void> become_child_subreaper();

}  // namespace bindbench
