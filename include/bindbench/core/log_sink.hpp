#pragma once

#include <filesystem>

#include "bindbench/core/expected.hpp"

namespace bindbench {

// Owning descriptor that transfer programs write their stdout/stderr into.
class LogSink {
 public:
  static Expected<LogSink> open(const std::filesystem::path& path);

  LogSink() = default;
  ~LogSink();

  LogSink(LogSink&& other) noexcept;
  LogSink& operator=(LogSink&& other) noexcept;
  LogSink(const LogSink&) = delete;
  LogSink& operator=(const LogSink&) = delete;

  int fd() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }

 private:
  explicit LogSink(int fd) : fd_(fd) {}

  int fd_{-1};
};

}  // namespace bindbench
