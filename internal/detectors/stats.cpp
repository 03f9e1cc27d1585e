#include "stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace convintel::detectors {

double Lift(double rate, double baseline) {
  if (!(baseline > 0.0)) return 1.0;
  return rate / baseline;
}

double Sigmoid(double x) {
  return 1.0 / (1.0 + std::exp(-x));
}

double SampleConfidence(uint32_t converted) {
  const double raw = Sigmoid((static_cast<double>(converted) - 50.0) / 15.0);
  return std::clamp(raw, 0.0, 1.0);
}

double UpperMedian(std::vector<double> values) {
  if (values.empty()) return 0.0;
  std::sort(values.begin(), values.end());
  return values[values.size() / 2];
}

uint32_t UpperMedian(std::vector<uint32_t> values) {
  if (values.empty()) return 0;
  std::sort(values.begin(), values.end());
  return values[values.size() / 2];
}

double NearestRankPercentile(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) return 0.0;
  const auto n    = sorted.size();
  auto       rank = static_cast<std::size_t>(std::ceil(p / 100.0 * static_cast<double>(n)));
  rank            = std::clamp<std::size_t>(rank, 1, n);
  return sorted[rank - 1];
}

double Mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace convintel::detectors
