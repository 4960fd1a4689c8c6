#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

#include "bindbench/core/expected.hpp"
#include "bindbench/core/types.hpp"
#include "bindbench/process/process_group.hpp"

namespace bindbench {

struct SpawnRequest {
  std::string executable{};
  std::vector<std::string> args{};
  // Added to (or overriding) the inherited environment.
  std::vector<std::pair<std::string, std::string>> env{};
  // Receives stdout and stderr; -1 discards both.
  int output_fd{-1};
  bool new_process_group{true};
};

// One spawned OS process. The pid stays reserved (as a zombie at worst) until
// this object reaps it, and no signal can be routed through it afterwards.
class ChildProcess {
 public:
  using Clock = std::chrono::steady_clock;

  static Expected<ChildProcess> spawn(const SpawnRequest& req);

  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(ChildProcess&& other) noexcept;
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Kills and reaps a child that was never driven to completion.
  ~ChildProcess();

  pid_t pid() const noexcept { return pid_; }
  Clock::time_point started_at() const noexcept { return started_; }
  bool reaped() const noexcept { return status_.has_value(); }
  const std::optional<ExitStatus>& status() const noexcept { return status_; }

  // Non-blocking. std::nullopt means still running.
  Expected<std::optional<ExitStatus>> try_wait();
  // Blocks until the child exits.
  Expected<ExitStatus> wait();

  // Checks liveness immediately before signalling. Returns false without
  // sending anything if the child had already exited.
  Expected<bool> signal_if_running(IProcessGroupController& ctl, int sig);
  Expected<bool> signal_group_if_running(IProcessGroupController& ctl, int sig);

 private:
  ChildProcess(pid_t pid, Clock::time_point started) : pid_(pid), started_(started) {}

  void kill_and_reap() noexcept;

  pid_t pid_{-1};
  Clock::time_point started_{};
  std::optional<ExitStatus> status_{};
};

// Spawns and blocks until exit; for short helper commands.
Expected<ExitStatus> run_to_completion(const SpawnRequest& req);

}  // namespace bindbench
