#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bindbench {

enum class TransferProgram { Rsync, Curl, Wget, Git };
enum class TransferKind { FileSync, HttpFetch, VersionControlClone };
enum class Destination { File, Directory };
enum class TerminationPolicy { GracefulThenKill, KillGroup };
enum class RunnerFormat { LocalBind, IsolatedNetwork };

enum class HandleState { Running, NaturallyExited, ForcefullyTerminated };
enum class RunOutcome { Ok, ExpectedTimeout, ExitFailure, SignalFailure };

struct Binding {
  std::string identifier{};
  std::string label{};
};

struct RunConfig {
  std::string upstream{};
  std::vector<std::string> extra_args{};
  uint32_t timeout_seconds{30};
  uint32_t pass_count{3};
  std::optional<std::filesystem::path> scratch_root{};
};

struct ExitStatus {
  std::optional<int> exit_code{};
  std::optional<int> signal{};

  bool success() const noexcept { return exit_code.has_value() && *exit_code == 0; }

  static ExitStatus from_wait_status(int status) noexcept;
};

struct RunResult {
  ExitStatus exit_status{};
  std::chrono::nanoseconds elapsed{};
  uint64_t transferred_bytes{};
  HandleState state{HandleState::Running};
};

struct RunRecord {
  size_t binding_index{};
  RunResult result{};
  double kbps{};
  RunOutcome outcome{RunOutcome::Ok};
  bool cancelled{false};
};

struct AggregatedScore {
  Binding binding{};
  double score_kbps{};
  double min_kbps{};
  double max_kbps{};
  uint32_t failures{};
};

}  // namespace bindbench
