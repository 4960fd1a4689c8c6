#include "bindbench/bench/aggregate.hpp"

#include <algorithm>

#include "app/math_utils.hpp"

namespace bindbench {

std::vector<AggregatedScore> aggregate_scores(std::span<const Binding> bindings,
                                              std::span<const std::vector<RunRecord>> passes) {
  std::vector<AggregatedScore> out;
  out.reserve(bindings.size());

  for (size_t i = 0; i < bindings.size(); ++i) {
    std::vector<double> samples;
    samples.reserve(passes.size());
    uint32_t failures = 0;
    for (const auto& pass : passes) {
      if (i >= pass.size()) {
        continue;
      }
      const auto& rec = pass[i];
      samples.push_back(rec.kbps);
      if (rec.outcome == RunOutcome::ExitFailure || rec.outcome == RunOutcome::SignalFailure) {
        ++failures;
      }
    }

    const auto stats = app::calc_stats(samples);
    out.push_back(AggregatedScore{
        .binding = bindings[i],
        .score_kbps = app::trimmed_mean(std::move(samples)),
        .min_kbps = stats.min,
        .max_kbps = stats.max,
        .failures = failures,
    });
  }

  std::stable_sort(out.begin(), out.end(), [](const AggregatedScore& a, const AggregatedScore& b) {
    return a.score_kbps > b.score_kbps;
  });
  return out;
}

}  // namespace bindbench
