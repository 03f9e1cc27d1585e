#pragma once

#include <memory>
#include <string>

#include "convintel/v1/runs.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/orchestration/learning_orchestrator.hpp"
#include "internal/scoring/component_scorer.hpp"
#include "internal/util/time.hpp"

namespace convintel::orchestration {

/*
  BackfillFlow

  Repairs a tenant's outcome data so the detectors have something to learn
  from, then runs them:

    - content snapshots rebuilt from raw touch text where missing or
      undecodable
    - component snapshots rebuilt from lead attributes where missing
    - led_to_booking set on the last touch at or before conversion for
      converted leads without a booking touch

  Repairs are one transaction; the learning run that follows writes
  through the pattern store as usual.
*/
class BackfillFlow {
 public:
  BackfillFlow(std::shared_ptr<db::Repository> repository, std::shared_ptr<LearningOrchestrator> orchestrator,
               scoring::ComponentScorer scorer);

  // Throws util::NotFound for an unknown tenant.
  convintel::v1::BackfillSummary Run(const std::string& tenant_id, util::TimePoint now);

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<LearningOrchestrator> orchestrator_;
  scoring::ComponentScorer              scorer_;
};

} // namespace convintel::orchestration
