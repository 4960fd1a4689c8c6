#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bindbench/core/expected.hpp"
#include "bindbench/process/child_process.hpp"

namespace bindbench {

inline constexpr std::string_view kContainerDataPath = "/data";

enum class ContainerState : uint8_t {
  Absent,
  // Created or exited but not yet removed.
  Stopped,
  Running,
};

struct ContainerRunSpec {
  std::string name{};
  std::string network{};
  std::string mount_source{};
  std::string image{};
  std::string program{};
  std::vector<std::string> program_args{};
};

// Thin client over a docker-compatible CLI (docker, podman, ...).
class ContainerRuntime {
 public:
  explicit ContainerRuntime(std::string binary = "docker") : binary_(std::move(binary)) {}

  const std::string& binary() const noexcept { return binary_; }

  Expected<bool> image_exists(std::string_view image) const;
  Expected<void> pull_image(std::string_view image, int output_fd) const;
  Expected<ContainerState> inspect_container(std::string_view name) const;
  Expected<void> kill_container(std::string_view name) const;
  Expected<void> remove_container(std::string_view name) const;

  Expected<ChildProcess> start(const ContainerRunSpec& spec, int output_fd) const;

  static std::vector<std::string> run_arguments(const ContainerRunSpec& spec);

 private:
  Expected<ExitStatus> invoke(std::vector<std::string> args, int output_fd) const;
  // Runs with stdout and stderr collected into `output`.
  Expected<ExitStatus> invoke_capture(std::vector<std::string> args, std::string& output) const;

  std::string binary_;
};

// bindbench-<pid>-<sequence>-<random>; unique across runs and across
// concurrent bindbench instances.
std::string make_container_name();

}  // namespace bindbench
