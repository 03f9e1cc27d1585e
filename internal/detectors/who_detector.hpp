#pragma once

#include "internal/config/settings.hpp"
#include "internal/detectors/detector.hpp"
#include "internal/detectors/weight_optimizer.hpp"

namespace convintel::detectors {

/*
  WHO: which lead attributes convert.

  Pools are leads with a terminal status; active leads are still in
  flight and belong to neither side. Emits title/industry/size rankings,
  timing-signal lifts and recommended scoring weights.
*/
class WhoDetector final : public Detector {
 public:
  static constexpr uint32_t kMinConverted     = 10;
  static constexpr uint32_t kMinTotal         = 30;
  static constexpr uint32_t kMinRankingSample = 5;
  static constexpr uint32_t kMinSignalSample  = 5;
  static constexpr uint32_t kMinSizeSample    = 3;
  static constexpr std::size_t kTopRankings   = 10;

  explicit WhoDetector(const config::DetectorSettings& settings);

  model::PatternType Type() const override {
    return model::PatternType::kWho;
  }

  DetectionResult Detect(const TenantDataset& dataset) const override;

 private:
  WeightOptimizer optimizer_;
};

} // namespace convintel::detectors
