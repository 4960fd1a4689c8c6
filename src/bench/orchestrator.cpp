#include "bindbench/bench/orchestrator.hpp"

#include <utility>

#include "app/math_utils.hpp"
#include "bindbench/bench/aggregate.hpp"
#include "bindbench/bench/scratch.hpp"
#include "bindbench/transfer/program.hpp"

namespace bindbench {

namespace {

double seconds_of(std::chrono::nanoseconds d) {
  return std::chrono::duration<double>(d).count();
}

Expected<RunRecord> run_once(IRunner& runner,
                             size_t index,
                             const BenchmarkOptions& options,
                             const LogSink& log,
                             const CancellationToken& cancel) {
  const auto& binding = runner.bindings()[index];
  const auto& traits = program_traits(runner.program());

  auto scratch = ScratchPath::create(traits.destination, options.scratch_root);
  if (!scratch) {
    return std::unexpected(scratch.error());
  }

  auto handle = runner.run(binding.identifier, scratch->path(), log);
  if (!handle) {
    return std::unexpected(handle.error());
  }

  const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options.timeout);
  auto result = (*handle)->wait_with_timeout(timeout, cancel);
  if (!result) {
    return std::unexpected(result.error());
  }

  auto bytes = scratch->measure_bytes();
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  result->transferred_bytes = *bytes;

  RunRecord rec{};
  rec.binding_index = index;
  rec.kbps = app::to_kbps(*bytes, seconds_of(result->elapsed));
  rec.outcome = classify_run(*result, options.timeout);
  rec.cancelled = cancel.requested();
  rec.result = std::move(*result);
  return rec;
}

}  // namespace

RunOutcome classify_run(const RunResult& result, std::chrono::nanoseconds timeout) noexcept {
  if (result.elapsed >= timeout) {
    return RunOutcome::ExpectedTimeout;
  }
  if (result.exit_status.signal) {
    return RunOutcome::SignalFailure;
  }
  if (result.exit_status.success()) {
    return RunOutcome::Ok;
  }
  return RunOutcome::ExitFailure;
}

Expected<BenchmarkReport> run_benchmark(IRunner& runner,
                                        const BenchmarkOptions& options,
                                        const LogSink& log,
                                        const CancellationToken& cancel,
                                        IBenchmarkObserver* observer) {
  if (options.pass_count == 0) {
    return fail(ErrorCode::InvalidArgument, "pass count must be at least 1");
  }
  if (options.timeout <= std::chrono::seconds::zero()) {
    return fail(ErrorCode::InvalidArgument, "timeout must be positive");
  }

  const auto& bindings = runner.bindings();
  BenchmarkReport report{};
  report.passes.reserve(options.pass_count);

  auto stop = [&]() {
    report.cancelled = true;
    if (observer) {
      observer->on_cancelled();
    }
    return report;
  };

  for (uint32_t pass = 1; pass <= options.pass_count; ++pass) {
    if (cancel.requested()) {
      return stop();
    }
    if (observer) {
      observer->on_pass_begin(pass);
    }

    std::vector<RunRecord> records;
    records.reserve(bindings.size());
    for (size_t i = 0; i < bindings.size(); ++i) {
      if (cancel.requested()) {
        return stop();
      }
      auto rec = run_once(runner, i, options, log, cancel);
      if (!rec) {
        return std::unexpected(rec.error());
      }
      if (observer) {
        observer->on_run_complete(pass, bindings[i], *rec);
      }
      if (rec->cancelled) {
        return stop();
      }
      records.push_back(std::move(*rec));
    }

    report.passes.push_back(std::move(records));
    if (observer) {
      observer->on_pass_complete(pass);
    }
  }

  if (cancel.requested()) {
    return stop();
  }
  report.scores = aggregate_scores(bindings, report.passes);
  return report;
}

}  // namespace bindbench
