#include "bindbench/runner/container_runtime.hpp"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace bindbench {
namespace {

std::string describe_status(const ExitStatus& st) {
  if (st.exit_code) {
    return std::format("exit code {}", *st.exit_code);
  }
  if (st.signal) {
    return std::format("signal {}", *st.signal);
  }
  return "unknown status";
}

}  // namespace

Expected<ExitStatus> ContainerRuntime::invoke(std::vector<std::string> args,
                                              int output_fd) const {
  SpawnRequest req{};
  req.executable = binary_;
  req.args = std::move(args);
  req.output_fd = output_fd;
  return run_to_completion(req);
}

Expected<ExitStatus> ContainerRuntime::invoke_capture(std::vector<std::string> args,
                                                      std::string& output) const {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return fail(ErrorCode::IoError, std::format("pipe: {}", std::strerror(errno)));
  }
  auto st = invoke(std::move(args), fds[1]);
  ::close(fds[1]);

  // inspect output is a line or two; it fits in the pipe buffer while the
  // child runs.
  output.clear();
  char buf[512];
  for (;;) {
    const ssize_t n = ::read(fds[0], buf, sizeof(buf));
    if (n > 0) {
      output.append(buf, static_cast<size_t>(n));
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  ::close(fds[0]);
  return st;
}

Expected<bool> ContainerRuntime::image_exists(std::string_view image) const {
  auto st = invoke({"image", "inspect", std::string(image)}, -1);
  if (!st) {
    return std::unexpected(st.error());
  }
  return st->success();
}

Expected<void> ContainerRuntime::pull_image(std::string_view image, int output_fd) const {
  auto st = invoke({"pull", std::string(image)}, output_fd);
  if (!st) {
    return std::unexpected(st.error());
  }
  if (!st->success()) {
    return fail(ErrorCode::MissingDependency,
                std::format("{} pull {} failed with {}", binary_, image, describe_status(*st)));
  }
  return {};
}

Expected<ContainerState> ContainerRuntime::inspect_container(std::string_view name) const {
  std::string output;
  auto st = invoke_capture({"container", "inspect", "-f", "{{.State.Running}}", std::string(name)},
                           output);
  if (!st) {
    return std::unexpected(Error{ErrorCode::TerminationFailed, st.error().message()});
  }
  if (!st->success()) {
    return ContainerState::Absent;
  }
  while (!output.empty() && std::isspace(static_cast<unsigned char>(output.back()))) {
    output.pop_back();
  }
  return output == "true" ? ContainerState::Running : ContainerState::Stopped;
}

Expected<void> ContainerRuntime::kill_container(std::string_view name) const {
  auto st = invoke({"kill", std::string(name)}, -1);
  if (!st) {
    return std::unexpected(Error{ErrorCode::TerminationFailed, st.error().message()});
  }
  if (!st->success()) {
    return fail(ErrorCode::TerminationFailed,
                std::format("{} kill {} failed with {}", binary_, name, describe_status(*st)));
  }
  return {};
}

Expected<void> ContainerRuntime::remove_container(std::string_view name) const {
  auto st = invoke({"rm", "-f", std::string(name)}, -1);
  if (!st) {
    return std::unexpected(Error{ErrorCode::TerminationFailed, st.error().message()});
  }
  if (!st->success()) {
    return fail(ErrorCode::TerminationFailed,
                std::format("{} rm -f {} failed with {}", binary_, name, describe_status(*st)));
  }
  return {};
}

std::vector<std::string> ContainerRuntime::run_arguments(const ContainerRunSpec& spec) {
  std::vector<std::string> args{
      "run",
      "--rm",
      "--name",
      spec.name,
      "--network",
      spec.network,
      "-v",
      spec.mount_source + ":" + std::string(kContainerDataPath),
      spec.image,
      spec.program,
  };
  args.insert(args.end(), spec.program_args.begin(), spec.program_args.end());
  return args;
}

Expected<ChildProcess> ContainerRuntime::start(const ContainerRunSpec& spec,
                                               int output_fd) const {
  SpawnRequest req{};
  req.executable = binary_;
  req.args = run_arguments(spec);
  req.output_fd = output_fd;
  return ChildProcess::spawn(req);
}

std::string make_container_name() {
  static std::atomic<uint64_t> sequence{0};
  thread_local std::mt19937 rng{std::random_device{}()};
  const auto seq = sequence.fetch_add(1, std::memory_order_relaxed);
  return std::format("bindbench-{}-{}-{:08x}", ::getpid(), seq, static_cast<uint32_t>(rng()));
}

}  // namespace bindbench
