#include "app/math_utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace bindbench::app {

Stats calc_stats(std::vector<double> values) {
  Stats out{};
  if (values.empty()) {
    return out;
  }
  std::sort(values.begin(), values.end());
  out.min = values.front();
  out.max = values.back();
  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  out.mean = sum / static_cast<double>(values.size());

  const double idx = 0.5 * static_cast<double>(values.size() - 1);
  const auto lo = static_cast<size_t>(std::floor(idx));
  const auto hi = static_cast<size_t>(std::ceil(idx));
  out.median = lo == hi ? values[lo] : (values[lo] + values[hi]) / 2.0;
  return out;
}

double trimmed_mean(std::vector<double> values) {
  if (values.empty()) {
    return 0.0;
  }
  if (values.size() < 3) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
  }
  std::sort(values.begin(), values.end());
  const double sum = std::accumulate(values.begin() + 1, values.end() - 1, 0.0);
  return sum / static_cast<double>(values.size() - 2);
}

double to_kbps(uint64_t bytes, double sec) {
  if (sec <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(bytes) / sec / 1024.0;
}

}  // namespace bindbench::app
