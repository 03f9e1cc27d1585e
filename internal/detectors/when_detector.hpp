#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "internal/detectors/detector.hpp"

namespace convintel::detectors {

/*
  WHEN: send timing that converts.

  Day/hour buckets come from touch send times (UTC); sequence gaps and
  time-to-convert come from the chronological touch history of converted
  leads.
*/
class WhenDetector final : public Detector {
 public:
  static constexpr uint32_t    kMinConverting   = 5;
  static constexpr uint32_t    kMinTotal        = 20;
  static constexpr uint32_t    kMinBucketSample = 3;
  static constexpr std::size_t kTopBuckets      = 5;
  static constexpr std::size_t kGapPairs        = 5;
  static constexpr uint32_t    kMinGapDays      = 1;
  static constexpr uint32_t    kMaxGapDays      = 14;
  // Booked touches outside [1, kMaxTouchPosition] are left out of the
  // position distribution and the average.
  static constexpr uint32_t    kMaxTouchPosition = 20;
  static constexpr double      kMaxTimingDays   = 90.0;

  // Used for touch_1_to_2, touch_2_to_3 and touch_3_to_4 without evidence.
  static constexpr std::array<uint32_t, 3> kDefaultGaps = {2, 3, 4};

  model::PatternType Type() const override {
    return model::PatternType::kWhen;
  }

  DetectionResult Detect(const TenantDataset& dataset) const override;

  // Upper median of whole-day gaps clamped to [1,14].
  static uint32_t AggregateGap(const std::vector<uint64_t>& gaps_ms);
};

} // namespace convintel::detectors
