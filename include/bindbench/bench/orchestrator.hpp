#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "bindbench/core/cancel.hpp"
#include "bindbench/core/expected.hpp"
#include "bindbench/core/log_sink.hpp"
#include "bindbench/core/types.hpp"
#include "bindbench/runner/runner.hpp"

namespace bindbench {

struct BenchmarkOptions {
  uint32_t pass_count{3};
  std::chrono::seconds timeout{30};
  std::optional<std::filesystem::path> scratch_root{};
};

// Progress callbacks; pass numbers are 1-based.
class IBenchmarkObserver {
 public:
  virtual ~IBenchmarkObserver() = default;

  virtual void on_pass_begin(uint32_t pass) = 0;
  virtual void on_run_complete(uint32_t pass, const Binding& binding, const RunRecord& record) = 0;
  virtual void on_pass_complete(uint32_t pass) = 0;
  virtual void on_cancelled() = 0;
};

struct BenchmarkReport {
  // Completed passes only; each holds one record per binding in binding order.
  std::vector<std::vector<RunRecord>> passes{};
  // Empty when cancelled.
  std::vector<AggregatedScore> scores{};
  bool cancelled{false};
};

RunOutcome classify_run(const RunResult& result, std::chrono::nanoseconds timeout) noexcept;

Expected<BenchmarkReport> run_benchmark(IRunner& runner,
                                        const BenchmarkOptions& options,
                                        const LogSink& log,
                                        const CancellationToken& cancel,
                                        IBenchmarkObserver* observer = nullptr);

}  // namespace bindbench
