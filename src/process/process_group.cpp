#include "bindbench/process/process_group.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace bindbench {
namespace {

class PosixProcessGroupController final : public IProcessGroupController {
 public:
  Expected<void> signal_primary(pid_t pid, int sig) override {
    if (pid <= 0) {
      return fail(ErrorCode::Internal, "refusing to signal pid " + std::to_string(pid));
    }
    if (::kill(pid, sig) != 0) {
      return fail(ErrorCode::TerminationFailed,
                  "kill(" + std::to_string(pid) + ", " + std::to_string(sig) +
                      ") failed: " + std::strerror(errno));
    }
    return {};
  }

  Expected<void> signal_group(pid_t pgid, int sig) override {
    if (pgid <= 1) {
      return fail(ErrorCode::Internal, "refusing to signal process group " + std::to_string(pgid));
    }
    if (::killpg(pgid, sig) != 0) {
      return fail(ErrorCode::TerminationFailed,
                  "killpg(" + std::to_string(pgid) + ", " + std::to_string(sig) +
                      ") failed: " + std::strerror(errno));
    }
    return {};
  }

  size_t reap_orphans() noexcept override {
    // waitpid returns 0 while unfinished children remain and -1 once none are
    // left, so stop at the first non-positive result.
    size_t reaped = 0;
    for (;;) {
      const pid_t r = ::waitpid(-1, nullptr, WNOHANG);
      if (r > 0) {
        ++reaped;
        continue;
      }
      if (r < 0 && errno == EINTR) {
        continue;
      }
      break;
    }
    return reaped;
  }
};

}  // namespace

std::shared_ptr<IProcessGroupController> make_posix_process_group_controller() {
  return std::make_shared<PosixProcessGroupController>();
}

Expected<void> become_child_subreaper() {
#ifdef __linux__
  if (::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0) {
    return fail(ErrorCode::Internal,
                std::string("prctl(PR_SET_CHILD_SUBREAPER) failed: ") + std::strerror(errno));
  }
#endif
  return {};
}

}  // namespace bindbench
