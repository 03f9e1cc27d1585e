#pragma once

#include "internal/detectors/detector.hpp"
#include "internal/model/channel.hpp"

namespace convintel::detectors {

/*
  HOW: channel mix and ordering that converts.

  Works on per-lead touch sequences of terminal leads. Sequence keys are
  the first three channels of a lead's history, padded with empty slots.
*/
class HowDetector final : public Detector {
 public:
  static constexpr uint32_t    kMinConverted         = 5;
  static constexpr uint32_t    kMinTotal             = 20;
  static constexpr uint32_t    kMinChannelSample     = 3;
  static constexpr uint32_t    kMinSequenceSample    = 5;
  static constexpr uint32_t    kMinOutgoing          = 3;
  static constexpr std::size_t kTopSequences         = 5;
  static constexpr std::size_t kChannelCountBuckets  = 4;

  model::PatternType Type() const override {
    return model::PatternType::kHow;
  }

  DetectionResult Detect(const TenantDataset& dataset) const override;

  static model::ChannelSequenceKey SequenceKey(const LeadSequence& sequence);
};

} // namespace convintel::detectors
