#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "bindbench/core/error.hpp"
#include "bindbench/core/log_sink.hpp"
#include "bindbench/core/types.hpp"

namespace bindbench {

const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::InvalidConfig:
      return "invalid configuration";
    case ErrorCode::MissingDependency:
      return "missing dependency";
    case ErrorCode::LaunchFailed:
      return "launch failed";
    case ErrorCode::TerminationFailed:
      return "termination failed";
    case ErrorCode::IoError:
      return "I/O error";
    case ErrorCode::Internal:
      return "internal error";
  }
  return "unknown error";
}

ExitStatus ExitStatus::from_wait_status(int status) noexcept {
  ExitStatus out{};
  if (WIFEXITED(status)) {
    out.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    out.signal = WTERMSIG(status);
  }
  return out;
}

Expected<LogSink> LogSink::open(const std::filesystem::path& path) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return fail(ErrorCode::IoError,
                "cannot open log file " + path.string() + ": " + std::strerror(errno));
  }
  return LogSink{fd};
}

LogSink::~LogSink() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

LogSink::LogSink(LogSink&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

LogSink& LogSink::operator=(LogSink&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

}  // namespace bindbench
