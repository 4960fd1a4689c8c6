#include "bindbench/process/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace bindbench {
namespace {

std::string describe(const SpawnRequest& req) {
  std::string out = req.executable;
  for (const auto& a : req.args) {
    out += ' ';
    out += a;
  }
  return out;
}

// Inherited environment with req.env applied on top.
std::vector<std::string> build_environment(const SpawnRequest& req) {
  std::vector<std::string> out;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    const std::string_view entry(*e);
    const auto eq = entry.find('=');
    const auto key = entry.substr(0, eq);
    bool overridden = false;
    for (const auto& [k, v] : req.env) {
      if (k == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      out.emplace_back(entry);
    }
  }
  for (const auto& [k, v] : req.env) {
    out.push_back(k + "=" + v);
  }
  return out;
}

class SpawnAttributes {
 public:
  SpawnAttributes() {
    ::posix_spawnattr_init(&attr_);
    ::posix_spawn_file_actions_init(&actions_);
  }
  ~SpawnAttributes() {
    ::posix_spawn_file_actions_destroy(&actions_);
    ::posix_spawnattr_destroy(&attr_);
  }
  SpawnAttributes(const SpawnAttributes&) = delete;
  SpawnAttributes& operator=(const SpawnAttributes&) = delete;

  posix_spawnattr_t* attr() { return &attr_; }
  posix_spawn_file_actions_t* actions() { return &actions_; }

 private:
  posix_spawnattr_t attr_{};
  posix_spawn_file_actions_t actions_{};
};

}  // namespace

Expected<ChildProcess> ChildProcess::spawn(const SpawnRequest& req) {
  SpawnAttributes sa;

  short flags = POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK;
  if (req.new_process_group) {
    // Own group: a terminal Ctrl-C reaches only us, and the whole transfer
    // can be killed with one killpg.
    flags |= POSIX_SPAWN_SETPGROUP;
    ::posix_spawnattr_setpgroup(sa.attr(), 0);
  }
  ::posix_spawnattr_setflags(sa.attr(), flags);

  sigset_t defaults;
  ::sigemptyset(&defaults);
  ::sigaddset(&defaults, SIGINT);
  ::sigaddset(&defaults, SIGTERM);
  ::sigaddset(&defaults, SIGPIPE);
  ::posix_spawnattr_setsigdefault(sa.attr(), &defaults);

  sigset_t empty_mask;
  ::sigemptyset(&empty_mask);
  ::posix_spawnattr_setsigmask(sa.attr(), &empty_mask);

  ::posix_spawn_file_actions_addopen(sa.actions(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  if (req.output_fd >= 0) {
    ::posix_spawn_file_actions_adddup2(sa.actions(), req.output_fd, STDOUT_FILENO);
    ::posix_spawn_file_actions_adddup2(sa.actions(), req.output_fd, STDERR_FILENO);
  } else {
    ::posix_spawn_file_actions_addopen(sa.actions(), STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    ::posix_spawn_file_actions_addopen(sa.actions(), STDERR_FILENO, "/dev/null", O_WRONLY, 0);
  }

  std::vector<std::string> argv_str;
  argv_str.reserve(req.args.size() + 1);
  argv_str.push_back(req.executable);
  argv_str.insert(argv_str.end(), req.args.begin(), req.args.end());

  std::vector<char*> argv;
  argv.reserve(argv_str.size() + 1);
  for (auto& s : argv_str) {
    argv.push_back(s.data());
  }
  argv.push_back(nullptr);

  auto env_str = build_environment(req);
  std::vector<char*> envp;
  envp.reserve(env_str.size() + 1);
  for (auto& s : env_str) {
    envp.push_back(s.data());
  }
  envp.push_back(nullptr);

  pid_t pid = -1;
  const int rc = ::posix_spawnp(&pid, req.executable.c_str(), sa.actions(), sa.attr(),
                                argv.data(), envp.data());
  if (rc != 0) {
    return fail(ErrorCode::LaunchFailed,
                "failed to spawn '" + describe(req) + "': " + std::strerror(rc));
  }
  return ChildProcess{pid, Clock::now()};
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      started_(other.started_),
      status_(std::move(other.status_)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    kill_and_reap();
    pid_ = std::exchange(other.pid_, -1);
    started_ = other.started_;
    status_ = std::move(other.status_);
  }
  return *this;
}

ChildProcess::~ChildProcess() { kill_and_reap(); }

void ChildProcess::kill_and_reap() noexcept {
  if (pid_ <= 0 || status_.has_value()) {
    pid_ = -1;
    return;
  }
  int st = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(pid_, &st, WNOHANG);
  } while (r < 0 && errno == EINTR);
  if (r == 0) {
    ::kill(pid_, SIGKILL);
    do {
      r = ::waitpid(pid_, &st, 0);
    } while (r < 0 && errno == EINTR);
  }
  pid_ = -1;
}

Expected<std::optional<ExitStatus>> ChildProcess::try_wait() {
  if (status_) {
    return status_;
  }
  int st = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(pid_, &st, WNOHANG);
  } while (r < 0 && errno == EINTR);
  if (r < 0) {
    return fail(ErrorCode::Internal, "waitpid(" + std::to_string(pid_) +
                                         ", WNOHANG) failed: " + std::strerror(errno));
  }
  if (r == 0) {
    return std::optional<ExitStatus>{};
  }
  status_ = ExitStatus::from_wait_status(st);
  return status_;
}

Expected<ExitStatus> ChildProcess::wait() {
  if (status_) {
    return *status_;
  }
  int st = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(pid_, &st, 0);
  } while (r < 0 && errno == EINTR);
  if (r < 0) {
    return fail(ErrorCode::TerminationFailed,
                "waitpid(" + std::to_string(pid_) + ") failed: " + std::strerror(errno));
  }
  status_ = ExitStatus::from_wait_status(st);
  return *status_;
}

Expected<bool> ChildProcess::signal_if_running(IProcessGroupController& ctl, int sig) {
  auto running = try_wait();
  if (!running) {
    return std::unexpected(running.error());
  }
  if (running->has_value()) {
    return false;
  }
  auto sent = ctl.signal_primary(pid_, sig);
  if (!sent) {
    return std::unexpected(sent.error());
  }
  return true;
}

Expected<bool> ChildProcess::signal_group_if_running(IProcessGroupController& ctl,
                                                     int sig) {
  auto running = try_wait();
  if (!running) {
    return std::unexpected(running.error());
  }
  if (running->has_value()) {
    return false;
  }
  // Spawned with pgid == pid.
  auto sent = ctl.signal_group(pid_, sig);
  if (!sent) {
    return std::unexpected(sent.error());
  }
  return true;
}

Expected<ExitStatus> run_to_completion(const SpawnRequest& req) {
  auto child = ChildProcess::spawn(req);
  if (!child) {
    return std::unexpected(child.error());
  }
  return child->wait();
}

}  // namespace bindbench
