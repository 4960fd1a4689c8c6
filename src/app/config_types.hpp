#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "bindbench/core/types.hpp"

namespace bindbench::app {

struct Config {
  std::string upstream{};
  std::string profile{"default"};
  std::optional<std::filesystem::path> config_path{};

  uint32_t passes{3};
  uint32_t timeout_sec{30};

  std::optional<std::filesystem::path> tmp_dir{};
  std::filesystem::path log_path{"/dev/null"};

  std::optional<TransferProgram> program{};
  std::vector<std::string> extra_args{};
  std::string executable_path{};
};

struct Profile {
  std::string name{};
  RunnerFormat format{RunnerFormat::LocalBind};
  std::string image{};
  std::string runtime_binary{"docker"};
  // Declaration order.
  std::vector<Binding> uses{};
};

}  // namespace bindbench::app
