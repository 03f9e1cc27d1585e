#pragma once

#include <memory>
#include <string>
#include <vector>

#include "convintel/v1/runs.pb.h"
#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/detectors/detector.hpp"
#include "internal/orchestration/worker_pool.hpp"
#include "internal/store/pattern_store.hpp"
#include "internal/util/time.hpp"

namespace convintel::orchestration {

/*
  LearningOrchestrator

  One learning run:
    1. archive expired patterns
    2. enumerate eligible tenants
    3. tenants in parallel on the worker pool; per tenant one dataset
       snapshot shared by the four detectors, which run concurrently
    4. every (tenant, detector) unit is attempted 1 + max_retries times
       with a fixed delay; a unit that still fails is logged and reported
       and never aborts the other units or tenants
*/
class LearningOrchestrator {
 public:
  LearningOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<store::PatternStore> store,
                       std::vector<std::shared_ptr<const detectors::Detector>> detectors, config::LearningSettings settings,
                       std::shared_ptr<WorkerPool> pool);

  convintel::v1::LearningRunSummary RunAll(util::TimePoint now);

  // RunTenant wrapped in a one-tenant summary; no archival pass.
  convintel::v1::LearningRunSummary RunOne(const std::string& tenant_id, util::TimePoint now);

  // Single-tenant run; throws util::NotFound for an unknown tenant.
  convintel::v1::TenantRunResult RunTenant(const std::string& tenant_id, util::TimePoint now);

  // Active or trialing, not deleted, enough conversions in the lookback window.
  std::vector<std::string> EligibleTenants(util::TimePoint now);

  // Eligible tenants without any usable (unexpired) pattern.
  std::vector<std::string> FindBackfillCandidates(util::TimePoint now);

  const config::LearningSettings& Settings() const {
    return settings_;
  }

 private:
  convintel::v1::DetectorRunResult RunUnit(const detectors::Detector& detector, const detectors::TenantDataset& dataset,
                                           util::TimePoint now);

  convintel::v1::TenantRunResult RunTenantGuarded(const std::string& tenant_id, util::TimePoint now);

  std::shared_ptr<db::Repository>                         repository_;
  std::shared_ptr<store::PatternStore>                    store_;
  std::vector<std::shared_ptr<const detectors::Detector>> detectors_;
  config::LearningSettings                                settings_;
  std::shared_ptr<WorkerPool>                             pool_;
};

} // namespace convintel::orchestration
