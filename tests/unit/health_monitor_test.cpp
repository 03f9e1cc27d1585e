#include "internal/health/health_monitor.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/pattern_codec.hpp"

namespace {

using convintel::db::memory::MemoryRepository;
using convintel::db::model::PatternRecord;
using convintel::health::HealthMonitor;
using convintel::model::PatternType;

constexpr uint64_t kNowMs = 1704067200000ULL;
constexpr uint64_t kDayMs = convintel::util::kMillisPerDay;

std::string WhoJson(double authority, double timing) {
  convintel::v1::PatternPayload payload;
  auto* weights = payload.mutable_who()->mutable_recommended_weights();
  weights->set_data_quality(0.20);
  weights->set_authority(authority);
  weights->set_company_fit(0.25);
  weights->set_timing(timing);
  return convintel::store::EncodePayload(payload);
}

std::string WhenJson() {
  convintel::v1::PatternPayload payload;
  payload.mutable_when();
  return convintel::store::EncodePayload(payload);
}

PatternRecord Healthy(const std::string& tenant_id, PatternType type) {
  PatternRecord record;
  record.tenant_id      = tenant_id;
  record.pattern_type   = type;
  record.version        = 1;
  record.payload_json   = type == PatternType::kWho ? WhoJson(0.25, 0.15) : WhenJson();
  record.sample_size    = 120;
  record.confidence     = 0.9;
  record.computed_at_ms = kNowMs - kDayMs;
  record.valid_until_ms = kNowMs + 10 * kDayMs;
  return record;
}

struct Fixture {
  std::shared_ptr<MemoryRepository>              repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<convintel::store::PatternStore> store = std::make_shared<convintel::store::PatternStore>(repo, convintel::config::StoreSettings{});

  void Put(const PatternRecord& record) {
    auto tx = repo->Begin();
    assert(repo->UpsertPattern(*tx, record));
    tx->Commit();
  }
};

std::vector<std::string> Codes(const convintel::v1::HealthReport& report, const std::string& tenant_id) {
  std::vector<std::string> codes;
  for (const auto& warning : report.warnings()) {
    if (warning.tenant_id() == tenant_id) codes.push_back(warning.code());
  }
  return codes;
}

bool Has(const std::vector<std::string>& codes, const std::string& code) {
  return std::find(codes.begin(), codes.end(), code) != codes.end();
}

void TestHealthyPatternsProduceNoWarnings() {
  Fixture fixture;
  fixture.Put(Healthy("t1", PatternType::kWho));
  fixture.Put(Healthy("t1", PatternType::kWhen));

  HealthMonitor monitor(fixture.store, convintel::config::HealthSettings{});
  const auto    report = monitor.Check(convintel::util::FromUnixMillis(kNowMs));

  assert(report.patterns_checked() == 2);
  assert(report.warnings_size() == 0);
  assert(!report.escalated());
  assert(report.checked_at().seconds() == static_cast<int64_t>(kNowMs / 1000));
}

void TestEachWarningCode() {
  Fixture fixture;

  auto expired           = Healthy("expired", PatternType::kWhen);
  expired.valid_until_ms = kNowMs;
  fixture.Put(expired);

  auto expiring           = Healthy("expiring", PatternType::kWhen);
  expiring.valid_until_ms = kNowMs + 3 * kDayMs;
  fixture.Put(expiring);

  auto thin        = Healthy("thin", PatternType::kWhen);
  thin.sample_size = 29;
  thin.confidence  = 0.29;
  fixture.Put(thin);

  auto skewed         = Healthy("skewed", PatternType::kWho);
  skewed.payload_json = WhoJson(0.45, 0.15);
  fixture.Put(skewed);

  auto garbled         = Healthy("garbled", PatternType::kWho);
  garbled.payload_json = "{not json";
  fixture.Put(garbled);

  HealthMonitor monitor(fixture.store, convintel::config::HealthSettings{});
  const auto    report = monitor.Check(convintel::util::FromUnixMillis(kNowMs));

  assert(report.patterns_checked() == 5);
  assert((Codes(report, "expired") == std::vector<std::string>{"expired"}));
  assert((Codes(report, "expiring") == std::vector<std::string>{"expiring_soon"}));
  assert((Codes(report, "thin") == std::vector<std::string>{"low_sample_size", "low_confidence"}));
  assert((Codes(report, "skewed") == std::vector<std::string>{"weights_out_of_bounds"}));
  assert((Codes(report, "garbled") == std::vector<std::string>{"undecodable_payload"}));

  for (const auto& warning : report.warnings()) {
    if (warning.code() == "expiring_soon") assert(warning.severity() == convintel::v1::SEVERITY_LOW);
    if (warning.code() == "low_confidence") assert(warning.severity() == convintel::v1::SEVERITY_MEDIUM);
    if (warning.code() == "expired") assert(warning.severity() == convintel::v1::SEVERITY_HIGH);
  }

  // expired + skewed + garbled
  assert(report.escalated());
}

void TestEscalationThreshold() {
  Fixture fixture;
  auto    expired        = Healthy("t1", PatternType::kWhen);
  expired.valid_until_ms = kNowMs - 1;
  fixture.Put(expired);

  convintel::config::HealthSettings settings;
  settings.escalation_threshold = 2;
  HealthMonitor monitor(fixture.store, settings);
  assert(!monitor.Check(convintel::util::FromUnixMillis(kNowMs)).escalated());

  settings.escalation_threshold = 0;
  HealthMonitor never(fixture.store, settings);
  assert(!never.Check(convintel::util::FromUnixMillis(kNowMs)).escalated());

  auto second           = Healthy("t2", PatternType::kWhen);
  second.valid_until_ms = kNowMs - 1;
  fixture.Put(second);
  settings.escalation_threshold = 2;
  HealthMonitor two(fixture.store, settings);
  assert(two.Check(convintel::util::FromUnixMillis(kNowMs)).escalated());
}

void TestInspectIsSideEffectFree() {
  Fixture       fixture;
  HealthMonitor monitor(fixture.store, convintel::config::HealthSettings{});

  auto record        = Healthy("t1", PatternType::kWho);
  record.sample_size = 10;
  const auto warnings = monitor.Inspect(record, convintel::util::FromUnixMillis(kNowMs));
  assert(warnings.size() == 1);
  assert(warnings[0].code() == "low_sample_size");
  assert(warnings[0].pattern_type() == convintel::v1::PATTERN_TYPE_WHO);
  assert(fixture.store->ListAll().empty());
}

} // namespace

int main() {
  TestHealthyPatternsProduceNoWarnings();
  TestEachWarningCode();
  TestEscalationThreshold();
  TestInspectIsSideEffectFree();

  std::cout << "convintel_unit_health_monitor: pass\n";
  return 0;
}
