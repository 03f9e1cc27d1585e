#pragma once

#include "internal/config/settings.hpp"
#include "internal/detectors/detector.hpp"

namespace convintel::detectors {

/*
  WHAT: which message content converts.

  Works on the content snapshots of touches: every touch that led to a
  booking against the most recent non-converting touches (capped). Touches
  whose snapshot is missing or unparsable are skipped and counted.
*/
class WhatDetector final : public Detector {
 public:
  static constexpr uint32_t    kMinConverting     = 5;
  static constexpr uint32_t    kMinTotal          = 20;
  static constexpr uint32_t    kMinFeatureSample  = 5;
  static constexpr uint32_t    kMinLengthSample   = 5;
  static constexpr uint32_t    kLengthBand        = 25;
  static constexpr uint32_t    kMinLengthFloor    = 10;
  static constexpr std::size_t kTopEffective      = 5;
  static constexpr std::size_t kTopIneffective    = 3;

  explicit WhatDetector(const config::DetectorSettings& settings);

  model::PatternType Type() const override {
    return model::PatternType::kWhat;
  }

  DetectionResult Detect(const TenantDataset& dataset) const override;

 private:
  uint32_t non_converting_cap_;
};

} // namespace convintel::detectors
