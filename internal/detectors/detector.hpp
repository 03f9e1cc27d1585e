#pragma once

#include <cstdint>

#include "convintel/v1/patterns.pb.h"
#include "internal/detectors/dataset.hpp"
#include "internal/model/pattern_type.hpp"

namespace convintel::detectors {

/*
  Output of one detector over one dataset snapshot.

  sufficient=false marks the sentinel payload emitted below the sample
  floors; the store records it in history but never promotes it.
*/
struct DetectionResult {
  model::PatternType type        = model::PatternType::kWho;
  bool               sufficient  = false;
  uint32_t           sample_size = 0;
  double             confidence  = 0.0;

  convintel::v1::PatternPayload payload;
};

/*
  Detector interface.

  Detect() must be a pure function of the dataset: the orchestrator runs
  the four detectors of a tenant concurrently over the same snapshot.
  Implementations throw on internal failure; they never write.
*/
class Detector {
 public:
  virtual ~Detector() = default;

  virtual model::PatternType Type() const = 0;

  virtual DetectionResult Detect(const TenantDataset& dataset) const = 0;
};

} // namespace convintel::detectors
