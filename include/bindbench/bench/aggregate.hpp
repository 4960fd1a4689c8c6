#pragma once

#include <span>
#include <vector>

#include "bindbench/core/types.hpp"

namespace bindbench {

// One entry per binding, ranked by trimmed-mean bandwidth, best first.
// Every pass must hold exactly one record per binding, in binding order.
std::vector<AggregatedScore> aggregate_scores(std::span<const Binding> bindings,
                                              std::span<const std::vector<RunRecord>> passes);

}  // namespace bindbench
