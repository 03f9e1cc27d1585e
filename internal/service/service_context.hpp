#pragma once

#include <functional>
#include <memory>

#include "internal/util/time.hpp"

namespace convintel::db { class Repository; }
namespace convintel::store { class PatternStore; class WeightCache; }
namespace convintel::health { class HealthMonitor; }
namespace convintel::orchestration { class LearningOrchestrator; class BackfillFlow; }

namespace convintel::service {

/*
  Dependency container shared by the admin surface.
*/
struct ServiceContext {
  std::shared_ptr<convintel::db::Repository> repository;
  std::shared_ptr<convintel::store::PatternStore> store;
  std::shared_ptr<convintel::store::WeightCache> weight_cache;
  std::shared_ptr<convintel::health::HealthMonitor> health;
  std::shared_ptr<convintel::orchestration::LearningOrchestrator> orchestrator;
  std::shared_ptr<convintel::orchestration::BackfillFlow> backfill;

  // Injected so tests can pin "now".
  std::function<convintel::util::TimePoint()> clock = convintel::util::Now;
};

}
