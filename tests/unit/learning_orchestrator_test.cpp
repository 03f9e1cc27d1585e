#include "internal/orchestration/learning_orchestrator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/pattern_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using convintel::db::memory::MemoryRepository;
using convintel::detectors::DetectionResult;
using convintel::detectors::Detector;
using convintel::detectors::TenantDataset;
using convintel::model::PatternType;
using convintel::orchestration::LearningOrchestrator;
using convintel::orchestration::WorkerPool;

constexpr uint64_t kDayMs = convintel::util::kMillisPerDay;
constexpr uint64_t kNowMs = 1704067200000ULL + 100 * kDayMs;

DetectionResult Sufficient(PatternType type, uint32_t sample_size) {
  DetectionResult result;
  result.type        = type;
  result.sufficient  = true;
  result.sample_size = sample_size;
  result.confidence  = 0.5;
  switch (type) {
    case PatternType::kWho: {
      auto* weights = result.payload.mutable_who()->mutable_recommended_weights();
      weights->set_data_quality(0.20);
      weights->set_authority(0.25);
      weights->set_company_fit(0.25);
      weights->set_timing(0.15);
      break;
    }
    case PatternType::kWhat:
      result.payload.mutable_what();
      break;
    case PatternType::kWhen:
      result.payload.mutable_when();
      break;
    case PatternType::kHow:
      result.payload.mutable_how();
      break;
  }
  return result;
}

class FixedDetector final : public Detector {
 public:
  FixedDetector(PatternType type, bool sufficient) : type_(type), sufficient_(sufficient) {
  }

  PatternType Type() const override {
    return type_;
  }

  DetectionResult Detect(const TenantDataset& dataset) const override {
    auto result = Sufficient(type_, static_cast<uint32_t>(dataset.leads.size()));
    if (!sufficient_) {
      result.sufficient = false;
      result.confidence = 0.0;
    }
    return result;
  }

 private:
  PatternType type_;
  bool        sufficient_;
};

// Throws on the first `failures` calls per tenant.
class FlakyDetector final : public Detector {
 public:
  FlakyDetector(PatternType type, int failures) : type_(type), failures_(failures) {
  }

  PatternType Type() const override {
    return type_;
  }

  DetectionResult Detect(const TenantDataset& dataset) const override {
    {
      std::lock_guard lock(mutex_);
      if (calls_[dataset.tenant_id]++ < failures_) {
        throw convintel::util::DetectorFailure("transient failure for " + dataset.tenant_id);
      }
    }
    return Sufficient(type_, static_cast<uint32_t>(dataset.leads.size()));
  }

  int Calls(const std::string& tenant_id) const {
    std::lock_guard lock(mutex_);
    auto            it = calls_.find(tenant_id);
    return it == calls_.end() ? 0 : it->second;
  }

 private:
  PatternType                        type_;
  int                                failures_;
  mutable std::mutex                 mutex_;
  mutable std::map<std::string, int> calls_;
};

void AddTenant(MemoryRepository& repo, const std::string& id, convintel::model::SubscriptionStatus status, bool deleted,
               int conversions, uint64_t converted_at_ms) {
  auto tx = repo.Begin();

  convintel::db::model::TenantRecord tenant;
  tenant.id      = id;
  tenant.name    = id;
  tenant.status  = status;
  tenant.deleted = deleted;
  assert(repo.UpsertTenant(*tx, tenant));

  for (int i = 0; i < conversions; ++i) {
    convintel::db::model::LeadRecord lead;
    lead.id              = id + "-lead-" + std::to_string(100 + i);
    lead.tenant_id       = id;
    lead.status          = convintel::model::LeadStatus::kConverted;
    lead.created_at_ms   = converted_at_ms - kDayMs;
    lead.converted_at_ms = converted_at_ms;
    assert(repo.UpsertLead(*tx, lead));
  }
  tx->Commit();
}

struct Fixture {
  std::shared_ptr<MemoryRepository>               repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<convintel::store::PatternStore> store = std::make_shared<convintel::store::PatternStore>(repo, MakeStoreSettings());
  std::shared_ptr<WorkerPool>                     pool  = std::make_shared<WorkerPool>(2);

  static convintel::config::StoreSettings MakeStoreSettings() {
    convintel::config::StoreSettings settings;
    settings.min_sample_size = 1;
    settings.retry_backoff   = std::chrono::milliseconds(0);
    return settings;
  }

  static convintel::config::LearningSettings MakeLearningSettings() {
    convintel::config::LearningSettings settings;
    settings.retry_delay = std::chrono::milliseconds(0);
    return settings;
  }

  Fixture() {
    using convintel::model::SubscriptionStatus;
    const uint64_t recent = kNowMs - 10 * kDayMs;
    AddTenant(*repo, "active", SubscriptionStatus::kActive, false, 25, recent);
    AddTenant(*repo, "cancelled", SubscriptionStatus::kCancelled, false, 30, recent);
    AddTenant(*repo, "deleted", SubscriptionStatus::kActive, true, 30, recent);
    AddTenant(*repo, "few", SubscriptionStatus::kActive, false, 19, recent);
    AddTenant(*repo, "stale", SubscriptionStatus::kActive, false, 25, kNowMs - 95 * kDayMs);
    AddTenant(*repo, "trial", SubscriptionStatus::kTrialing, false, 20, recent);
    pool->Start();
  }
};

convintel::util::TimePoint Now() {
  return convintel::util::FromUnixMillis(kNowMs);
}

void TestEligibility() {
  Fixture              fixture;
  LearningOrchestrator orchestrator(fixture.repo, fixture.store, {}, Fixture::MakeLearningSettings(), fixture.pool);

  const auto eligible = orchestrator.EligibleTenants(Now());
  assert((eligible == std::vector<std::string>{"active", "trial"}));
  assert((orchestrator.FindBackfillCandidates(Now()) == eligible));
}

void TestRunAllIsolatesFailures() {
  Fixture fixture;

  // an expired HOW row that the run archives first
  {
    convintel::v1::PatternPayload payload;
    payload.mutable_how();

    convintel::db::model::PatternRecord expired;
    expired.tenant_id      = "active";
    expired.pattern_type   = PatternType::kHow;
    expired.version        = 3;
    expired.payload_json   = convintel::store::EncodePayload(payload);
    expired.valid_until_ms = kNowMs - 1;
    auto tx                = fixture.repo->Begin();
    assert(fixture.repo->UpsertPattern(*tx, expired));
    tx->Commit();
  }

  auto flaky   = std::make_shared<FlakyDetector>(PatternType::kWhat, 1);
  auto failing = std::make_shared<FlakyDetector>(PatternType::kHow, 100);

  LearningOrchestrator orchestrator(fixture.repo, fixture.store,
                                    {std::make_shared<FixedDetector>(PatternType::kWho, true), flaky,
                                     std::make_shared<FixedDetector>(PatternType::kWhen, false), failing},
                                    Fixture::MakeLearningSettings(), fixture.pool);

  const auto summary = orchestrator.RunAll(Now());

  assert(!summary.run_id().empty());
  assert(summary.archived_patterns() == 1);
  assert(summary.tenants_processed() == 2);
  assert(summary.patterns_written() == 4);
  assert(summary.patterns_retained() == 2);
  assert(summary.failures() == 2);

  const auto& active = summary.tenants(0);
  assert(active.tenant_id() == "active");
  assert(!active.failed());
  assert(active.detectors_size() == 4);

  const auto& who = active.detectors(0);
  assert(who.pattern_type() == convintel::v1::PATTERN_TYPE_WHO);
  assert(who.outcome() == convintel::v1::DETECTOR_OUTCOME_SUPERSEDED);
  assert(who.attempts() == 1);
  assert(who.version() == 1);
  assert(who.sample_size() == 25);

  const auto& what = active.detectors(1);
  assert(what.outcome() == convintel::v1::DETECTOR_OUTCOME_SUPERSEDED);
  assert(what.attempts() == 2);

  const auto& when = active.detectors(2);
  assert(when.outcome() == convintel::v1::DETECTOR_OUTCOME_RETAINED_PREVIOUS);
  assert(when.version() == 0);

  const auto& how = active.detectors(3);
  assert(how.outcome() == convintel::v1::DETECTOR_OUTCOME_FAILED);
  assert(how.attempts() == 3);
  assert(how.error() == "transient failure for active");
  assert(failing->Calls("active") == 3);

  assert(fixture.store->Get("active", PatternType::kWho).has_value());
  assert(!fixture.store->Get("active", PatternType::kHow).has_value());
  assert(fixture.store->History("active", PatternType::kHow, 0)[0].archived);
  assert(fixture.store->History("trial", PatternType::kWhen, 0).size() == 1);

  assert(orchestrator.FindBackfillCandidates(Now()).empty());
}

void TestRunOne() {
  Fixture              fixture;
  LearningOrchestrator orchestrator(fixture.repo, fixture.store, {std::make_shared<FixedDetector>(PatternType::kWho, true)},
                                    Fixture::MakeLearningSettings(), fixture.pool);

  // runs regardless of eligibility
  const auto summary = orchestrator.RunOne("few", Now());
  assert(summary.tenants_size() == 1);
  assert(summary.tenants_processed() == 1);
  assert(summary.patterns_written() == 1);
  assert(summary.archived_patterns() == 0);
  assert(fixture.store->Get("few", PatternType::kWho)->version == 1);

  bool threw = false;
  try {
    orchestrator.RunOne("missing", Now());
  } catch (const convintel::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRerunSupersedesWithNextVersion() {
  Fixture              fixture;
  LearningOrchestrator orchestrator(fixture.repo, fixture.store, {std::make_shared<FixedDetector>(PatternType::kWho, true)},
                                    Fixture::MakeLearningSettings(), fixture.pool);

  orchestrator.RunAll(Now());
  const auto second = orchestrator.RunAll(Now());
  assert(second.tenants(0).detectors(0).version() == 2);
  assert(fixture.store->History("active", PatternType::kWho, 0).size() == 2);
}

} // namespace

int main() {
  TestEligibility();
  TestRunAllIsolatesFailures();
  TestRunOne();
  TestRerunSupersedesWithNextVersion();

  std::cout << "convintel_unit_learning_orchestrator: pass\n";
  return 0;
}
