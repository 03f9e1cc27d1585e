#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using convintel::model::Channel;
using convintel::model::LeadStatus;
using namespace convintel::services::v1;

constexpr uint64_t kDayMs  = convintel::util::kMillisPerDay;
constexpr uint64_t kHourMs = 3'600'000ULL;

constexpr int kLeads     = 60;
constexpr int kConverted = 30;

/*
  Raw outcome data as the product writes it: no content snapshots, no
  component snapshots, no booking flags. Backfill repairs all three.
*/
void SeedTenant(convintel::db::Repository& repo, const std::string& tenant_id, uint64_t now_ms) {
  const uint64_t base = (now_ms / kDayMs - 30) * kDayMs;

  auto tx = repo.Begin();

  convintel::db::model::TenantRecord tenant;
  tenant.id     = tenant_id;
  tenant.name   = "Acme Growth";
  tenant.status = convintel::model::SubscriptionStatus::kActive;
  assert(repo.UpsertTenant(*tx, tenant));

  const char* titles[]     = {"CEO", "Director of Sales", "Marketing Manager", "VP Engineering", "Office Assistant"};
  const char* industries[] = {"Dental", "Software", "Legal"};

  for (int i = 0; i < kLeads; ++i) {
    const bool     converted = i < kConverted;
    const uint64_t created   = base + static_cast<uint64_t>(i) * kHourMs;

    convintel::db::model::LeadRecord lead;
    lead.id             = "lead-" + std::to_string(1000 + i);
    lead.tenant_id      = tenant_id;
    lead.first_name     = "Sam";
    lead.company        = "Company " + std::to_string(i);
    lead.title          = titles[i % 5];
    lead.industry       = industries[i % 3];
    lead.country        = i % 2 == 0 ? "Australia" : "US";
    lead.employee_count = static_cast<uint32_t>(5 + i * 7);
    lead.hiring         = i % 4 == 0;
    lead.new_role       = i % 6 == 0;
    lead.has_email      = true;
    lead.email_verified = i % 3 != 2;
    lead.has_phone      = i % 2 == 0;
    lead.has_linkedin   = i % 5 != 4;
    lead.status         = converted ? LeadStatus::kConverted : (i % 2 == 0 ? LeadStatus::kNotInterested : LeadStatus::kBounced);
    lead.created_at_ms  = created;
    if (converted) lead.converted_at_ms = created + 5 * kDayMs + 2 * kHourMs;
    assert(repo.UpsertLead(*tx, lead));

    const Channel  channels[] = {Channel::kEmail, Channel::kLinkedin, Channel::kEmail};
    const uint64_t offsets[]  = {9 * kHourMs, 2 * kDayMs + 14 * kHourMs, 5 * kDayMs};
    for (int n = 0; n < 3; ++n) {
      convintel::db::model::TouchRecord touch;
      touch.id           = lead.id + "-t" + std::to_string(n + 1);
      touch.tenant_id    = tenant_id;
      touch.lead_id      = lead.id;
      touch.channel      = channels[n];
      touch.sent_at_ms   = created + offsets[n];
      touch.touch_number = static_cast<uint32_t>(n + 1);
      touch.sequence_id  = "seq-main";
      touch.template_id  = i % 2 == 0 ? "tmpl-a" : "tmpl-b";
      touch.subject      = i % 2 == 0 ? "Idea for {company}" : "Quick question";
      touch.body         = converted ? "Hi Sam, we fill your pipeline with more leads. Worth 15 minutes?"
                                     : "Hello, following up on my note. Let me know.";
      assert(repo.InsertTouch(*tx, touch));
    }
  }

  tx->Commit();
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestBackfillLearnServeAndCheck() {
  const auto config = convintel::config::ConfigLoader::LoadFromYamlString(R"(learning:
  retry_delay_ms: 1
  worker_threads: 2
  store_retry_backoff_ms: 1
)");

  auto repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  auto app  = convintel::factory::Build(config, repo);

  const uint64_t now_ms = convintel::util::ToUnixMillis(convintel::util::Now());
  SeedTenant(*repo, "tenant-acme", now_ms);

  auto& admin = *app.admin_service;

  // nothing learned yet
  assert((app.orchestrator->FindBackfillCandidates(convintel::util::Now()) == std::vector<std::string>{"tenant-acme"}));

  TriggerBackfillRequest backfill_req;
  backfill_req.set_tenant_id("tenant-acme");
  const auto backfill = admin.TriggerBackfill(backfill_req).summary();
  assert(backfill.content_snapshots_rebuilt() == 3 * kLeads);
  assert(backfill.component_snapshots_rebuilt() == kLeads);
  assert(backfill.bookings_flagged() == kConverted);
  assert(backfill.detection().detectors_size() == 4);
  for (const auto& unit : backfill.detection().detectors()) {
    assert(unit.outcome() == convintel::v1::DETECTOR_OUTCOME_SUPERSEDED);
    assert(unit.version() == 1);
  }
  assert(app.orchestrator->FindBackfillCandidates(convintel::util::Now()).empty());

  GetPatternRequest get_req;
  get_req.set_tenant_id("tenant-acme");
  get_req.set_pattern_type(convintel::v1::PATTERN_TYPE_WHO);
  const auto who = admin.GetPattern(get_req);
  assert(!who.expired());
  assert(who.pattern().version() == 1);
  assert(who.pattern().sample_size() == kLeads);
  assert(who.pattern().payload().who().converted_count() == kConverted);

  const auto weights = app.weight_cache->GetWeightsForScoring("tenant-acme", convintel::util::Now());
  assert(convintel::model::WeightsWithinBounds(weights, 0.01));

  ListPatternsRequest list_req;
  list_req.set_tenant_id("tenant-acme");
  const auto listed = admin.ListPatterns(list_req);
  assert(listed.patterns_size() == 4);
  assert(listed.patterns(0).pattern_type() == convintel::v1::PATTERN_TYPE_WHO);
  assert(listed.patterns(3).payload().has_how());

  // single tenant relearn supersedes every type
  TriggerLearningRequest learn_req;
  learn_req.set_tenant_id("tenant-acme");
  const auto relearn = admin.TriggerLearning(learn_req).summary();
  assert(relearn.tenants_processed() == 1);
  assert(relearn.patterns_written() == 4);
  assert(relearn.failures() == 0);

  GetPatternHistoryRequest history_req;
  history_req.set_tenant_id("tenant-acme");
  history_req.set_pattern_type(convintel::v1::PATTERN_TYPE_WHEN);
  const auto history = admin.GetPatternHistory(history_req);
  assert(history.entries_size() == 2);
  assert(history.entries(0).pattern().version() == 2);
  assert(history.entries(0).history_id() > history.entries(1).history_id());
  assert(!history.entries(0).archived());

  // identical data gives identical payloads
  assert(history.entries(0).pattern().payload().SerializeAsString() == history.entries(1).pattern().payload().SerializeAsString());

  const auto batch = admin.TriggerLearning(TriggerLearningRequest{}).summary();
  assert(batch.tenants_processed() == 1);
  assert(batch.archived_patterns() == 0);

  const auto report = admin.RunHealthCheck(RunHealthCheckRequest{}).report();
  assert(report.patterns_checked() == 4);
  assert(!report.escalated());
  bool low_confidence = false;
  for (const auto& warning : report.warnings()) {
    assert(warning.severity() != convintel::v1::SEVERITY_HIGH);
    low_confidence = low_confidence || warning.code() == "low_confidence";
  }
  // 30 conversions sit well below the confidence floor
  assert(low_confidence);

  app.pool->Stop();
}

void TestAdminErrors() {
  auto repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  auto app  = convintel::factory::Build(convintel::runtime::config::RuntimeConfig{}, repo);
  auto& admin = *app.admin_service;

  GetPatternRequest missing_tenant;
  missing_tenant.set_pattern_type(convintel::v1::PATTERN_TYPE_WHO);
  assert(Throws<convintel::util::InvalidArgument>([&] { admin.GetPattern(missing_tenant); }));

  GetPatternRequest unspecified;
  unspecified.set_tenant_id("t1");
  assert(Throws<convintel::util::InvalidArgument>([&] { admin.GetPattern(unspecified); }));

  GetPatternRequest absent;
  absent.set_tenant_id("t1");
  absent.set_pattern_type(convintel::v1::PATTERN_TYPE_HOW);
  assert(Throws<convintel::util::NotFound>([&] { admin.GetPattern(absent); }));

  TriggerLearningRequest unknown;
  unknown.set_tenant_id("ghost");
  assert(Throws<convintel::util::NotFound>([&] { admin.TriggerLearning(unknown); }));

  TriggerBackfillRequest unknown_backfill;
  unknown_backfill.set_tenant_id("ghost");
  assert(Throws<convintel::util::NotFound>([&] { admin.TriggerBackfill(unknown_backfill); }));

  // an empty store is healthy
  const auto report = admin.RunHealthCheck(RunHealthCheckRequest{}).report();
  assert(report.patterns_checked() == 0);
  assert(!report.escalated());

  app.pool->Stop();
}

} // namespace

int main() {
  TestBackfillLearnServeAndCheck();
  TestAdminErrors();

  std::cout << "convintel_integration_learning_pipeline: pass\n";
  return 0;
}
