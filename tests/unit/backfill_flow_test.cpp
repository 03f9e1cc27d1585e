#include "internal/orchestration/backfill_flow.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/detectors/stats.hpp"
#include "internal/detectors/who_detector.hpp"
#include "internal/features/content_snapshot.hpp"
#include "internal/store/pattern_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using convintel::db::memory::MemoryRepository;
using convintel::db::model::LeadRecord;
using convintel::db::model::TouchRecord;
using convintel::model::PatternType;
using convintel::orchestration::BackfillFlow;
using convintel::orchestration::LearningOrchestrator;

constexpr uint64_t kDayMs  = convintel::util::kMillisPerDay;
constexpr uint64_t kBaseMs = 1704067200000ULL;
constexpr uint64_t kNowMs  = kBaseMs + 30 * kDayMs;

class CountingDetector final : public convintel::detectors::Detector {
 public:
  PatternType Type() const override {
    return PatternType::kWhen;
  }

  convintel::detectors::DetectionResult Detect(const convintel::detectors::TenantDataset& dataset) const override {
    convintel::detectors::DetectionResult result;
    result.type        = PatternType::kWhen;
    result.sufficient  = false;
    result.sample_size = static_cast<uint32_t>(dataset.touches.size());
    result.payload.mutable_when();
    return result;
  }
};

TouchRecord Touch(const std::string& id, const std::string& lead_id, uint64_t sent_at_ms, uint32_t number) {
  TouchRecord touch;
  touch.id           = id;
  touch.tenant_id    = "t1";
  touch.lead_id      = lead_id;
  touch.channel      = convintel::model::Channel::kEmail;
  touch.sent_at_ms   = sent_at_ms;
  touch.touch_number = number;
  touch.subject      = "Quick question";
  touch.body         = "Hi Dana, would a free audit of your pipeline help?";
  return touch;
}

struct Fixture {
  std::shared_ptr<MemoryRepository>               repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<convintel::store::PatternStore> store = std::make_shared<convintel::store::PatternStore>(repo, convintel::config::StoreSettings{});
  std::shared_ptr<convintel::orchestration::WorkerPool> pool = std::make_shared<convintel::orchestration::WorkerPool>(1);
  std::shared_ptr<LearningOrchestrator>                 orchestrator;

  Fixture() {
    convintel::config::LearningSettings settings;
    settings.retry_delay = std::chrono::milliseconds(0);
    orchestrator         = std::make_shared<LearningOrchestrator>(repo, store, std::vector<std::shared_ptr<const convintel::detectors::Detector>>{
                                                                               std::make_shared<CountingDetector>()},
                                                          settings, pool);

    auto tx = repo->Begin();

    convintel::db::model::TenantRecord tenant;
    tenant.id = "t1";
    assert(repo->UpsertTenant(*tx, tenant));

    // converted on day 5, no component snapshot
    LeadRecord converted;
    converted.id              = "lead-a";
    converted.tenant_id       = "t1";
    converted.first_name      = "Dana";
    converted.title           = "CEO";
    converted.has_email       = true;
    converted.hiring          = true;
    converted.status          = convintel::model::LeadStatus::kConverted;
    converted.created_at_ms   = kBaseMs;
    converted.converted_at_ms = kBaseMs + 5 * kDayMs;
    assert(repo->UpsertLead(*tx, converted));

    // already scored
    LeadRecord scored;
    scored.id           = "lead-b";
    scored.tenant_id    = "t1";
    scored.status       = convintel::model::LeadStatus::kBounced;
    scored.score        = 42.0;
    scored.components   = convintel::model::ComponentScores{10, 10, 10, 5};
    scored.weights_used = convintel::model::DefaultWeights();
    scored.created_at_ms = kBaseMs;
    assert(repo->UpsertLead(*tx, scored));

    auto first = Touch("touch-a1", "lead-a", kBaseMs, 1);
    assert(repo->InsertTouch(*tx, first));

    auto second             = Touch("touch-a2", "lead-a", kBaseMs + 3 * kDayMs, 2);
    second.content_snapshot = "{not json";
    assert(repo->InsertTouch(*tx, second));

    // sent after the conversion
    auto third             = Touch("touch-a3", "lead-a", kBaseMs + 7 * kDayMs, 3);
    third.content_snapshot = convintel::features::EncodeSnapshot(convintel::features::BuildContentSnapshot(third, &converted));
    assert(repo->InsertTouch(*tx, third));

    auto other             = Touch("touch-b1", "lead-b", kBaseMs + kDayMs, 1);
    other.content_snapshot = convintel::features::EncodeSnapshot(convintel::features::BuildContentSnapshot(other, &scored));
    assert(repo->InsertTouch(*tx, other));

    tx->Commit();
    pool->Start();
  }

  BackfillFlow Flow() {
    return BackfillFlow(repo, orchestrator, convintel::scoring::ComponentScorer({"dental"}));
  }
};

void TestRepairsAndRunsDetection() {
  Fixture    fixture;
  auto       flow    = fixture.Flow();
  const auto summary = flow.Run("t1", convintel::util::FromUnixMillis(kNowMs));

  assert(summary.tenant_id() == "t1");
  assert(summary.content_snapshots_rebuilt() == 2);
  assert(summary.component_snapshots_rebuilt() == 1);
  assert(summary.bookings_flagged() == 1);

  assert(summary.detection().tenant_id() == "t1");
  assert(summary.detection().detectors_size() == 1);
  assert(summary.detection().detectors(0).sample_size() == 4);

  auto tx      = fixture.repo->Begin();
  auto touches = fixture.repo->ListTouches(*tx, "t1", 0);
  auto lead    = fixture.repo->GetLead(*tx, "t1", "lead-a");
  tx->Commit();

  for (const auto& touch : touches) {
    const auto snapshot = convintel::features::DecodeSnapshot(touch.content_snapshot);
    assert(snapshot.touch_number() == touch.touch_number);
    assert(touch.led_to_booking == (touch.id == "touch-a2"));
  }

  assert(lead->components.has_value());
  assert(lead->components->authority == 25.0);
  assert(lead->weights_used.has_value());
  assert(lead->score > 0.0);
  assert(lead->scored_at_ms == kNowMs);
}

void TestSecondRunFindsNothingToRepair() {
  Fixture fixture;
  auto    flow = fixture.Flow();
  flow.Run("t1", convintel::util::FromUnixMillis(kNowMs));

  const auto again = flow.Run("t1", convintel::util::FromUnixMillis(kNowMs));
  assert(again.content_snapshots_rebuilt() == 0);
  assert(again.component_snapshots_rebuilt() == 0);
  assert(again.bookings_flagged() == 0);
  assert(fixture.store->History("t1", PatternType::kWhen, 0).size() == 2);
}

void TestUnknownTenantIsNotFound() {
  Fixture fixture;
  auto    flow  = fixture.Flow();
  bool    threw = false;
  try {
    flow.Run("missing", convintel::util::FromUnixMillis(kNowMs));
  } catch (const convintel::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

/*
  200 leads scored before component snapshots existed: 60 converted,
  140 failed. Seniority carries most of the signal:
    converted  CEO, every fourth a Manager
    failed     Sales Rep or Director, every fifth a Founder
  contact data, company fit and timing vary independently of outcome.
*/
void SeedHistoricalTenant(MemoryRepository& repo, const std::string& tenant_id) {
  auto tx = repo.Begin();

  convintel::db::model::TenantRecord tenant;
  tenant.id = tenant_id;
  assert(repo.UpsertTenant(*tx, tenant));

  for (int i = 0; i < 200; ++i) {
    const bool converted = i < 60;

    LeadRecord lead;
    lead.id        = "hist-" + std::to_string(1000 + i);
    lead.tenant_id = tenant_id;
    if (converted) {
      lead.title = i % 4 == 0 ? "Practice Manager" : "CEO";
    } else {
      lead.title = i % 5 == 0 ? "Founder" : (i % 2 == 0 ? "Director of Ops" : "Sales Rep");
    }
    lead.has_email      = true;
    lead.email_verified = i % 3 == 0;
    lead.has_phone      = i % 4 < 2;
    lead.has_linkedin   = i % 7 != 0;
    lead.industry       = i % 3 == 1 ? "Software" : "Dental";
    lead.employee_count = static_cast<uint32_t>(i % 5 == 0 ? 300 : 10 + i % 40);
    lead.country        = i % 2 == 0 ? "Australia" : "US";
    lead.hiring         = i % 6 == 0;
    lead.new_role       = i % 9 == 0;
    lead.status         = converted ? convintel::model::LeadStatus::kConverted : convintel::model::LeadStatus::kNotInterested;
    lead.created_at_ms  = kBaseMs + static_cast<uint64_t>(i) * 60'000;
    if (converted) lead.converted_at_ms = kBaseMs + 5 * kDayMs;
    assert(repo.UpsertLead(*tx, lead));
  }
  tx->Commit();
}

void TestBackfilledHistoryLearnsNonDefaultWeights() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto store = std::make_shared<convintel::store::PatternStore>(repo, convintel::config::StoreSettings{});
  auto pool  = std::make_shared<convintel::orchestration::WorkerPool>(1);
  pool->Start();

  convintel::config::LearningSettings settings;
  settings.retry_delay = std::chrono::milliseconds(0);
  auto orchestrator    = std::make_shared<LearningOrchestrator>(
      repo, store,
      std::vector<std::shared_ptr<const convintel::detectors::Detector>>{
          std::make_shared<convintel::detectors::WhoDetector>(convintel::config::DetectorSettings{})},
      settings, pool);

  SeedHistoricalTenant(*repo, "t-hist");

  BackfillFlow flow(repo, orchestrator, convintel::scoring::ComponentScorer({"dental"}));
  const auto   summary = flow.Run("t-hist", convintel::util::FromUnixMillis(kNowMs));

  assert(summary.component_snapshots_rebuilt() == 200);
  assert(summary.detection().detectors_size() == 1);

  const auto& who_run = summary.detection().detectors(0);
  assert(who_run.outcome() == convintel::v1::DETECTOR_OUTCOME_SUPERSEDED);
  assert(who_run.sample_size() == 200);
  assert(who_run.confidence() > 0.5);
  assert(who_run.confidence() == convintel::detectors::SampleConfidence(60));

  const auto record = store->Get("t-hist", PatternType::kWho);
  assert(record.has_value());
  const auto who = convintel::store::DecodePayload(record->payload_json, PatternType::kWho).who();
  assert(who.optimizer_status() == "converged");

  const auto& learned  = who.recommended_weights();
  const auto  defaults = convintel::model::DefaultWeights();
  assert(learned.authority() > defaults.authority);
  assert(std::abs(learned.data_quality() + learned.authority() + learned.company_fit() + learned.timing() - 0.85) < 1e-9);

  pool->Stop();
}

} // namespace

int main() {
  TestRepairsAndRunsDetection();
  TestSecondRunFindsNothingToRepair();
  TestUnknownTenantIsNotFound();
  TestBackfilledHistoryLearnsNonDefaultWeights();

  std::cout << "convintel_unit_backfill_flow: pass\n";
  return 0;
}
