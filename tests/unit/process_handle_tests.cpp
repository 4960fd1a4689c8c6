#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

#include "bindbench/core/cancel.hpp"
#include "bindbench/process/child_process.hpp"
#include "bindbench/process/process_group.hpp"
#include "bindbench/process/process_handle.hpp"

namespace {

using namespace std::chrono_literals;

// Forwards to the POSIX controller and remembers every signal sent.
class RecordingController final : public bindbench::IProcessGroupController {
 public:
  struct Call {
    bool group;
    pid_t target;
    int sig;
  };

  bindbench::Expected<void> signal_primary(pid_t pid, int sig) override {
    calls.push_back(Call{false, pid, sig});
    return inner_->signal_primary(pid, sig);
  }

  bindbench::Expected<void> signal_group(pid_t pgid, int sig) override {
    calls.push_back(Call{true, pgid, sig});
    return inner_->signal_group(pgid, sig);
  }

  size_t reap_orphans() noexcept override { return inner_->reap_orphans(); }

  std::vector<Call> calls;

 private:
  std::shared_ptr<bindbench::IProcessGroupController> inner_ =
      bindbench::make_posix_process_group_controller();
};

std::unique_ptr<bindbench::IProcessHandle> start_shell(const std::string& script,
                                                       bindbench::TerminationPolicy policy,
                                                       std::shared_ptr<RecordingController> ctl) {
  bindbench::SpawnRequest req{};
  req.executable = "sh";
  req.args = {"-c", script};
  auto child = bindbench::ChildProcess::spawn(req);
  if (!child) {
    std::cerr << std::format("spawn failed: {}\n", child.error().message());
    return nullptr;
  }
  return bindbench::make_local_process_handle(std::move(*child), policy, std::move(ctl));
}

bool process_gone(pid_t pid) {
  std::ifstream stat(std::format("/proc/{}/stat", pid));
  if (!stat) {
    return true;
  }
  std::string line;
  std::getline(stat, line);
  const auto close = line.rfind(')');
  return close != std::string::npos && close + 2 < line.size() && line[close + 2] == 'Z';
}

bool test_natural_exit_sends_no_signal() {
  auto ctl = std::make_shared<RecordingController>();
  auto handle = start_shell("sleep 0.2; exit 3", bindbench::TerminationPolicy::GracefulThenKill, ctl);
  if (!handle) {
    return false;
  }

  bindbench::CancellationToken cancel;
  auto r = handle->wait_with_timeout(5000ms, cancel);
  if (!r) {
    std::cerr << std::format("wait failed: {}\n", r.error().message());
    return false;
  }
  if (r->state != bindbench::HandleState::NaturallyExited ||
      handle->state() != bindbench::HandleState::NaturallyExited) {
    std::cerr << "expected NaturallyExited\n";
    return false;
  }
  if (r->exit_status.exit_code.value_or(-1) != 3 || r->exit_status.signal) {
    std::cerr << std::format("unexpected exit code {}\n", r->exit_status.exit_code.value_or(-1));
    return false;
  }
  if (r->elapsed < 150ms || r->elapsed > 3s) {
    std::cerr << std::format("elapsed out of range: {}\n",
                             std::chrono::duration_cast<std::chrono::milliseconds>(r->elapsed));
    return false;
  }

  auto again = handle->wait_with_timeout(1ms, cancel);
  if (!again || again->elapsed != r->elapsed || again->state != r->state) {
    std::cerr << "second wait must return the recorded result\n";
    return false;
  }
  if (!ctl->calls.empty()) {
    std::cerr << std::format("expected no signals, got {}\n", ctl->calls.size());
    return false;
  }
  return true;
}

bool test_timeout_terminates_gracefully() {
  auto ctl = std::make_shared<RecordingController>();
  auto handle = start_shell("exec sleep 30", bindbench::TerminationPolicy::GracefulThenKill, ctl);
  if (!handle) {
    return false;
  }

  bindbench::CancellationToken cancel;
  const auto t0 = std::chrono::steady_clock::now();
  auto r = handle->wait_with_timeout(1000ms, cancel);
  const auto wall = std::chrono::steady_clock::now() - t0;
  if (!r) {
    std::cerr << std::format("wait failed: {}\n", r.error().message());
    return false;
  }
  if (r->state != bindbench::HandleState::ForcefullyTerminated) {
    std::cerr << "expected ForcefullyTerminated\n";
    return false;
  }
  if (r->elapsed < 1000ms || wall > 1000ms + 5s + 2s) {
    std::cerr << "termination outside the timeout window\n";
    return false;
  }
  if (r->exit_status.signal.value_or(0) != SIGTERM) {
    std::cerr << std::format("expected death by SIGTERM, got {}\n", r->exit_status.signal.value_or(0));
    return false;
  }
  if (ctl->calls.size() != 1 || ctl->calls[0].group || ctl->calls[0].sig != SIGTERM) {
    std::cerr << std::format("expected exactly one SIGTERM, got {} calls\n", ctl->calls.size());
    return false;
  }
  return true;
}

bool test_ignored_sigterm_escalates_to_sigkill() {
  auto ctl = std::make_shared<RecordingController>();
  auto handle = start_shell("trap '' TERM; exec sleep 30",
                            bindbench::TerminationPolicy::GracefulThenKill, ctl);
  if (!handle) {
    return false;
  }

  bindbench::CancellationToken cancel;
  auto r = handle->wait_with_timeout(500ms, cancel);
  if (!r) {
    std::cerr << std::format("wait failed: {}\n", r.error().message());
    return false;
  }
  if (r->exit_status.signal.value_or(0) != SIGKILL) {
    std::cerr << std::format("expected death by SIGKILL, got {}\n", r->exit_status.signal.value_or(0));
    return false;
  }
  if (ctl->calls.size() != 2 || ctl->calls[0].sig != SIGTERM || ctl->calls[1].sig != SIGKILL) {
    std::cerr << "expected SIGTERM then SIGKILL\n";
    return false;
  }
  return true;
}

bool test_cancellation_is_prompt() {
  auto ctl = std::make_shared<RecordingController>();
  auto handle = start_shell("exec sleep 30", bindbench::TerminationPolicy::GracefulThenKill, ctl);
  if (!handle) {
    return false;
  }

  bindbench::CancellationToken cancel;
  std::thread canceller([&cancel]() {
    std::this_thread::sleep_for(200ms);
    cancel.request();
  });

  const auto t0 = std::chrono::steady_clock::now();
  auto r = handle->wait_with_timeout(30000ms, cancel);
  const auto wall = std::chrono::steady_clock::now() - t0;
  canceller.join();

  if (!r) {
    std::cerr << std::format("wait failed: {}\n", r.error().message());
    return false;
  }
  if (r->state != bindbench::HandleState::ForcefullyTerminated) {
    std::cerr << "cancelled run must be ForcefullyTerminated\n";
    return false;
  }
  if (wall > 5s) {
    std::cerr << std::format("cancellation took {}\n",
                             std::chrono::duration_cast<std::chrono::milliseconds>(wall));
    return false;
  }
  return true;
}

bool test_group_kill_reaches_descendants() {
  if (auto sub = bindbench::become_child_subreaper(); !sub) {
    std::cerr << std::format("subreaper: {}\n", sub.error().message());
    return false;
  }

  const auto pidfile = std::filesystem::temp_directory_path() /
                       std::format("bindbench_group_test_{}.pid", ::getpid());
  std::error_code ec;
  std::filesystem::remove(pidfile, ec);

  auto ctl = std::make_shared<RecordingController>();
  auto handle = start_shell(std::format("sleep 30 & echo $! > '{}'; wait", pidfile.string()),
                            bindbench::TerminationPolicy::KillGroup, ctl);
  if (!handle) {
    return false;
  }

  bindbench::CancellationToken cancel;
  auto r = handle->wait_with_timeout(1000ms, cancel);
  if (!r) {
    std::cerr << std::format("wait failed: {}\n", r.error().message());
    return false;
  }
  if (r->exit_status.signal.value_or(0) != SIGKILL) {
    std::cerr << "group leader should die by SIGKILL\n";
    return false;
  }
  if (ctl->calls.size() != 1 || !ctl->calls[0].group || ctl->calls[0].sig != SIGKILL) {
    std::cerr << "expected exactly one group SIGKILL\n";
    return false;
  }

  pid_t grandchild = 0;
  {
    std::ifstream in(pidfile);
    in >> grandchild;
  }
  std::filesystem::remove(pidfile, ec);
  if (grandchild <= 0) {
    std::cerr << "grandchild pid was not recorded\n";
    return false;
  }

  bool gone = false;
  for (int i = 0; i < 100 && !gone; ++i) {
    gone = process_gone(grandchild);
    if (!gone) {
      std::this_thread::sleep_for(10ms);
    }
  }
  ctl->reap_orphans();
  if (!gone) {
    std::cerr << std::format("descendant {} survived the group kill\n", grandchild);
    return false;
  }
  return true;
}

bool test_spawn_failure_is_launch_failed() {
  bindbench::SpawnRequest req{};
  req.executable = "bindbench-no-such-program";
  auto child = bindbench::ChildProcess::spawn(req);
  if (child || child.error().code() != bindbench::ErrorCode::LaunchFailed) {
    std::cerr << "spawning a missing program should be LaunchFailed\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_natural_exit_sends_no_signal()) {
    return 1;
  }
  if (!test_timeout_terminates_gracefully()) {
    return 1;
  }
  if (!test_ignored_sigterm_escalates_to_sigkill()) {
    return 1;
  }
  if (!test_cancellation_is_prompt()) {
    return 1;
  }
  if (!test_group_kill_reaches_descendants()) {
    return 1;
  }
  if (!test_spawn_failure_is_launch_failed()) {
    return 1;
  }
  return 0;
}
