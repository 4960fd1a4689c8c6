#pragma once

#include <cstdint>
#include <vector>

namespace bindbench::app {

struct Stats {
  double mean{0.0};
  double median{0.0};
  double min{0.0};
  double max{0.0};
};

Stats calc_stats(std::vector<double> values);

// Drops one minimum and one maximum when there are at least three samples.
double trimmed_mean(std::vector<double> values);

double to_kbps(uint64_t bytes, double sec);

}  // namespace bindbench::app
