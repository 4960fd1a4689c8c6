#include "bindbench/process/process_handle.hpp"

#include <csignal>
#include <optional>
#include <thread>
#include <utility>

#include "bindbench/runner/container_runtime.hpp"
#include "process/wait_loop.hpp"

namespace bindbench {
namespace {

// SIGTERM to the primary only, give it kGracefulPolls to exit, then SIGKILL.
// rsync's receiver hangs if it gets SIGTERM together with the generator, so
// the generator alone is signalled and left to stop its receiver.
Expected<ExitStatus> terminate_gracefully(ChildProcess& child, IProcessGroupController& ctl) {
  auto sent = child.signal_if_running(ctl, SIGTERM);
  if (!sent) {
    return std::unexpected(sent.error());
  }
  if (*sent) {
    for (int i = 0; i < kGracefulPolls; ++i) {
      auto polled = child.try_wait();
      if (!polled) {
        return std::unexpected(polled.error());
      }
      if (polled->has_value()) {
        break;
      }
      std::this_thread::sleep_for(kGracefulPollInterval);
    }
    auto killed = child.signal_if_running(ctl, SIGKILL);
    if (!killed) {
      return std::unexpected(killed.error());
    }
  }
  return child.wait();
}

Expected<ExitStatus> terminate_group(ChildProcess& child, IProcessGroupController& ctl) {
  auto sent = child.signal_group_if_running(ctl, SIGKILL);
  if (!sent) {
    return std::unexpected(sent.error());
  }
  return child.wait();
}

class LocalProcessHandle final : public IProcessHandle {
 public:
  LocalProcessHandle(ChildProcess child,
                     TerminationPolicy policy,
                     std::shared_ptr<IProcessGroupController> controller)
      : child_(std::move(child)), policy_(policy), ctl_(std::move(controller)) {}

  HandleState state() const noexcept override {
    return result_ ? result_->state : HandleState::Running;
  }

  Expected<RunResult> wait_with_timeout(std::chrono::milliseconds timeout,
                                        const CancellationToken& cancel) override {
    if (result_) {
      return *result_;
    }
    auto r = detail::wait_with_deadline(child_, timeout, cancel, [this]() {
      return terminate();
    });
    if (!r) {
      return r;
    }
    result_ = *r;
    return r;
  }

 private:
  Expected<ExitStatus> terminate() {
    auto status = policy_ == TerminationPolicy::KillGroup ? terminate_group(child_, *ctl_)
                                                          : terminate_gracefully(child_, *ctl_);
    // Helpers that outlived the primary have been re-parented to us.
    ctl_->reap_orphans();
    return status;
  }

  ChildProcess child_;
  TerminationPolicy policy_;
  std::shared_ptr<IProcessGroupController> ctl_;
  std::optional<RunResult> result_{};
};

class ContainerProcessHandle final : public IProcessHandle {
 public:
  ContainerProcessHandle(ChildProcess client,
                         std::string name,
                         std::shared_ptr<const ContainerRuntime> runtime,
                         std::shared_ptr<IProcessGroupController> controller)
      : client_(std::move(client)),
        name_(std::move(name)),
        runtime_(std::move(runtime)),
        ctl_(std::move(controller)) {}

  HandleState state() const noexcept override {
    return result_ ? result_->state : HandleState::Running;
  }

  Expected<RunResult> wait_with_timeout(std::chrono::milliseconds timeout,
                                        const CancellationToken& cancel) override {
    if (result_) {
      return *result_;
    }
    auto r = detail::wait_with_deadline(client_, timeout, cancel, [this]() {
      return terminate();
    });
    if (!r) {
      return r;
    }
    result_ = *r;
    return r;
  }

 private:
  Expected<ExitStatus> terminate() {
    auto stopped = stop_container();
    if (!stopped) {
      return std::unexpected(stopped.error());
    }
    auto killed = client_.signal_if_running(*ctl_, SIGKILL);
    if (!killed) {
      return std::unexpected(killed.error());
    }
    auto status = client_.wait();
    ctl_->reap_orphans();
    return status;
  }

  // A failed kill is fine once the container is no longer running: it can
  // finish between our poll and the kill, and --rm removal lags behind. A
  // container left in created or exited state is removed so the daemon
  // cannot start it later.
  Expected<void> stop_container() {
    auto killed = runtime_->kill_container(name_);
    if (killed) {
      return {};
    }
    auto state = runtime_->inspect_container(name_);
    if (!state) {
      return std::unexpected(state.error());
    }
    if (*state == ContainerState::Absent) {
      return {};
    }
    if (*state == ContainerState::Stopped) {
      if (runtime_->remove_container(name_)) {
        return {};
      }
      state = runtime_->inspect_container(name_);
      if (!state) {
        return std::unexpected(state.error());
      }
      if (*state != ContainerState::Running) {
        return {};
      }
    }
    return fail(ErrorCode::TerminationFailed,
                "container " + name_ + " is still running after kill: " +
                    killed.error().message());
  }

  ChildProcess client_;
  std::string name_;
  std::shared_ptr<const ContainerRuntime> runtime_;
  std::shared_ptr<IProcessGroupController> ctl_;
  std::optional<RunResult> result_{};
};

}  // namespace

std::unique_ptr<IProcessHandle> make_local_process_handle(
    ChildProcess child,
    TerminationPolicy policy,
    std::shared_ptr<IProcessGroupController> controller) {
  return std::make_unique<LocalProcessHandle>(std::move(child), policy, std::move(controller));
}

std::unique_ptr<IProcessHandle> make_container_process_handle(
    ChildProcess client,
    std::string container_name,
    std::shared_ptr<const ContainerRuntime> runtime,
    std::shared_ptr<IProcessGroupController> controller) {
  return std::make_unique<ContainerProcessHandle>(std::move(client), std::move(container_name),
                                                  std::move(runtime), std::move(controller));
}

}  // namespace bindbench
