#pragma once

#include <cstdint>
#include <vector>

namespace convintel::detectors {

/*
  Small statistics helpers shared by the detectors.

  Nothing here rounds: payloads carry full doubles so that a rerun over the
  same data encodes to the same bytes and tests can compare exact ratios.
*/

struct RateCounter {
  uint32_t total     = 0;
  uint32_t converted = 0;

  void Add(bool did_convert) {
    ++total;
    if (did_convert) ++converted;
  }

  // 0 for an empty counter.
  double Rate() const {
    return total == 0 ? 0.0 : static_cast<double>(converted) / static_cast<double>(total);
  }
};

// rate / baseline; 1.0 (no evidence) when the baseline is not positive.
double Lift(double rate, double baseline);

double Sigmoid(double x);

// clamp(sigmoid((converted - 50) / 15), 0, 1): ~0.5 at 50 converting samples.
double SampleConfidence(uint32_t converted);

// Element n/2 of the sorted values (the upper median for even n).
// Empty input gives 0.
double   UpperMedian(std::vector<double> values);
uint32_t UpperMedian(std::vector<uint32_t> values);

// Nearest-rank percentile over already sorted values, p in (0, 100].
double NearestRankPercentile(const std::vector<double>& sorted, double p);

double Mean(const std::vector<double>& values);

} // namespace convintel::detectors
