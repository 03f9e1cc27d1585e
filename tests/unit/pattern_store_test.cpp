#include "internal/store/pattern_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/pattern_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using convintel::db::Repository;
using convintel::db::Result;
using convintel::db::Transaction;
using convintel::detectors::DetectionResult;
using convintel::model::PatternType;
using convintel::store::PatternStore;
namespace dbm = convintel::db::model;

constexpr uint64_t kNowMs = 1704067200000ULL;

convintel::util::TimePoint At(uint64_t ms) {
  return convintel::util::FromUnixMillis(ms);
}

convintel::config::StoreSettings FastSettings() {
  convintel::config::StoreSettings settings;
  settings.retry_backoff = std::chrono::milliseconds(0);
  return settings;
}

DetectionResult WhoResult(uint32_t sample_size, double confidence, double authority) {
  DetectionResult result;
  result.type        = PatternType::kWho;
  result.sufficient  = true;
  result.sample_size = sample_size;
  result.confidence  = confidence;

  auto* who     = result.payload.mutable_who();
  auto* weights = who->mutable_recommended_weights();
  weights->set_data_quality(0.15);
  weights->set_authority(authority);
  weights->set_company_fit(0.25);
  weights->set_timing(0.45 - authority);
  who->set_optimizer_status("converged");
  return result;
}

DetectionResult WhenSentinel() {
  DetectionResult result;
  result.type        = PatternType::kWhen;
  result.sufficient  = false;
  result.sample_size = 4;
  result.payload.mutable_when();
  return result;
}

/*
  Delegates to an in-memory repository and reports Busy for the first
  `busy_writes` pattern upserts.
*/
class BusyRepository final : public Repository {
 public:
  explicit BusyRepository(int busy_writes) : busy_writes_(busy_writes) {
  }

  int upsert_calls = 0;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result UpsertTenant(Transaction& tx, const dbm::TenantRecord& r) override {
    return inner_.UpsertTenant(tx, r);
  }
  std::optional<dbm::TenantRecord> GetTenant(Transaction& tx, const std::string& id) override {
    return inner_.GetTenant(tx, id);
  }
  std::vector<dbm::TenantRecord> ListTenants(Transaction& tx) override {
    return inner_.ListTenants(tx);
  }
  uint64_t CountConversionsSince(Transaction& tx, const std::string& id, uint64_t since_ms) override {
    return inner_.CountConversionsSince(tx, id, since_ms);
  }

  Result UpsertLead(Transaction& tx, const dbm::LeadRecord& r) override {
    return inner_.UpsertLead(tx, r);
  }
  std::optional<dbm::LeadRecord> GetLead(Transaction& tx, const std::string& tenant, const std::string& id) override {
    return inner_.GetLead(tx, tenant, id);
  }
  std::vector<dbm::LeadRecord> ListLeads(Transaction& tx, const std::string& tenant, uint64_t since_ms) override {
    return inner_.ListLeads(tx, tenant, since_ms);
  }
  Result UpdateLeadScoreSnapshot(Transaction& tx, const std::string& tenant, const std::string& id,
                                 const convintel::model::ComponentScores& components, const convintel::model::ScoringWeights& weights,
                                 double score, uint64_t scored_at_ms) override {
    return inner_.UpdateLeadScoreSnapshot(tx, tenant, id, components, weights, score, scored_at_ms);
  }

  Result InsertTouch(Transaction& tx, const dbm::TouchRecord& r) override {
    return inner_.InsertTouch(tx, r);
  }
  std::vector<dbm::TouchRecord> ListTouches(Transaction& tx, const std::string& tenant, uint64_t since_ms) override {
    return inner_.ListTouches(tx, tenant, since_ms);
  }
  Result UpdateTouchSnapshot(Transaction& tx, const std::string& tenant, const std::string& id, const std::string& json) override {
    return inner_.UpdateTouchSnapshot(tx, tenant, id, json);
  }
  Result SetLedToBooking(Transaction& tx, const std::string& tenant, const std::string& id) override {
    return inner_.SetLedToBooking(tx, tenant, id);
  }

  std::optional<dbm::PatternRecord> GetPattern(Transaction& tx, const std::string& tenant, PatternType type) override {
    return inner_.GetPattern(tx, tenant, type);
  }
  std::vector<dbm::PatternRecord> ListPatterns(Transaction& tx, const std::string& tenant) override {
    return inner_.ListPatterns(tx, tenant);
  }
  std::vector<dbm::PatternRecord> ListAllPatterns(Transaction& tx) override {
    return inner_.ListAllPatterns(tx);
  }
  Result UpsertPattern(Transaction& tx, const dbm::PatternRecord& r) override {
    if (upsert_calls++ < busy_writes_) {
      return Result::Err(convintel::db::ErrorCode::Busy, "database is locked");
    }
    return inner_.UpsertPattern(tx, r);
  }
  Result DeletePattern(Transaction& tx, const std::string& tenant, PatternType type) override {
    return inner_.DeletePattern(tx, tenant, type);
  }

  Result AppendPatternHistory(Transaction& tx, dbm::PatternHistoryRecord& r) override {
    return inner_.AppendPatternHistory(tx, r);
  }
  std::vector<dbm::PatternHistoryRecord> ListPatternHistory(Transaction& tx, const std::string& tenant, PatternType type,
                                                            uint32_t limit) override {
    return inner_.ListPatternHistory(tx, tenant, type, limit);
  }

  Result UpsertWeightCache(Transaction& tx, const dbm::WeightCacheRecord& r) override {
    return inner_.UpsertWeightCache(tx, r);
  }
  std::optional<dbm::WeightCacheRecord> GetWeightCache(Transaction& tx, const std::string& tenant) override {
    return inner_.GetWeightCache(tx, tenant);
  }

 private:
  convintel::db::memory::MemoryRepository inner_;
  int                                     busy_writes_;
};

void TestPromotionIncrementsVersion() {
  auto         repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  PatternStore store(repo, FastSettings());

  auto first = store.Record("t1", WhoResult(40, 0.4, 0.25), At(kNowMs));
  assert(first.superseded);
  assert(first.version == 1);
  assert(first.attempts == 1);

  auto second = store.Record("t1", WhoResult(60, 0.6, 0.30), At(kNowMs + 1000));
  assert(second.version == 2);

  const auto current = store.Get("t1", PatternType::kWho);
  assert(current.has_value());
  assert(current->version == 2);
  assert(current->sample_size == 60);
  assert(current->computed_at_ms == kNowMs + 1000);
  assert(current->valid_until_ms == kNowMs + 1000 + 14 * convintel::util::kMillisPerDay);

  const auto payload = convintel::store::DecodePayload(current->payload_json, PatternType::kWho);
  assert(payload.who().recommended_weights().authority() == 0.30);

  const auto history = store.History("t1", PatternType::kWho, 0);
  assert(history.size() == 2);
  assert(history[0].pattern.version == 2);
  assert(history[1].pattern.version == 1);
  assert(!history[0].archived);
}

void TestRetainedRunKeepsCurrentAndRecordsHistory() {
  auto         repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  PatternStore store(repo, FastSettings());

  store.Record("t1", WhoResult(40, 0.4, 0.25), At(kNowMs));

  // below min_sample_size
  auto low_sample = store.Record("t1", WhoResult(29, 0.9, 0.40), At(kNowMs + 1));
  assert(!low_sample.superseded);
  assert(low_sample.version == 1);

  // below min_confidence
  auto low_confidence = store.Record("t1", WhoResult(100, 0.05, 0.40), At(kNowMs + 2));
  assert(!low_confidence.superseded);

  const auto current = store.Get("t1", PatternType::kWho);
  assert(current->version == 1);
  assert(current->sample_size == 40);

  const auto history = store.History("t1", PatternType::kWho, 0);
  assert(history.size() == 3);
  assert(history[0].pattern.version == 0);
  assert(history[0].pattern.sample_size == 100);
  assert(history[1].pattern.version == 0);

  const auto limited = store.History("t1", PatternType::kWho, 1);
  assert(limited.size() == 1);
}

void TestSentinelIsNeverPromoted() {
  auto         repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  PatternStore store(repo, FastSettings());

  const auto outcome = store.Record("t1", WhenSentinel(), At(kNowMs));
  assert(!outcome.superseded);
  assert(outcome.version == 0);
  assert(!store.Get("t1", PatternType::kWhen).has_value());
  assert(store.History("t1", PatternType::kWhen, 0).size() == 1);
}

void TestWhoSupersedeRefreshesWeightCache() {
  auto         repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  PatternStore store(repo, FastSettings());

  store.Record("t1", WhoResult(40, 0.4, 0.30), At(kNowMs));

  auto tx    = repo->Begin();
  auto cache = repo->GetWeightCache(*tx, "t1");
  tx->Commit();
  assert(cache.has_value());
  assert(cache->weights.authority == 0.30);
  assert(cache->sample_count == 40);
  assert(cache->updated_at_ms == kNowMs);
  assert(cache->valid_until_ms == kNowMs + 14 * convintel::util::kMillisPerDay);

  // a retained WHO run leaves the cache alone
  store.Record("t1", WhoResult(10, 0.9, 0.40), At(kNowMs + 5));
  auto tx2    = repo->Begin();
  auto cache2 = repo->GetWeightCache(*tx2, "t1");
  tx2->Commit();
  assert(cache2->weights.authority == 0.30);
}

void TestPayloadTypeMismatchIsRejected() {
  auto         repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  PatternStore store(repo, FastSettings());

  auto result = WhoResult(40, 0.4, 0.25);
  result.type = PatternType::kHow;

  bool threw = false;
  try {
    store.Record("t1", result, At(kNowMs));
  } catch (const convintel::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(store.History("t1", PatternType::kHow, 0).empty());
}

void TestArchiveExpiredMovesRowsToHistory() {
  auto         repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  PatternStore store(repo, FastSettings());

  store.Record("t1", WhoResult(40, 0.4, 0.25), At(kNowMs));
  store.Record("t2", WhoResult(40, 0.4, 0.25), At(kNowMs + 3 * convintel::util::kMillisPerDay));

  const uint64_t archive_at = kNowMs + 15 * convintel::util::kMillisPerDay;
  assert(store.ArchiveExpired(At(archive_at)) == 1);

  assert(!store.Get("t1", PatternType::kWho).has_value());
  assert(store.Get("t2", PatternType::kWho).has_value());

  const auto history = store.History("t1", PatternType::kWho, 0);
  assert(history.size() == 2);
  assert(history[0].archived);
  assert(history[0].recorded_at_ms == archive_at);
  assert(history[0].pattern.version == 1);

  assert(store.ArchiveExpired(At(archive_at)) == 0);
}

void TestRequireDistinguishesMissingFromInsufficient() {
  auto         repo = std::make_shared<convintel::db::memory::MemoryRepository>();
  PatternStore store(repo, FastSettings());

  bool not_found = false;
  try {
    store.Require("t1", PatternType::kWhen);
  } catch (const convintel::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  store.Record("t1", WhenSentinel(), At(kNowMs));
  bool insufficient = false;
  try {
    store.Require("t1", PatternType::kWhen);
  } catch (const convintel::util::InsufficientData&) {
    insufficient = true;
  }
  assert(insufficient);

  store.Record("t1", WhoResult(40, 0.4, 0.25), At(kNowMs));
  assert(store.Require("t1", PatternType::kWho).version == 1);

  // archived rows are gone, not insufficient
  store.ArchiveExpired(At(kNowMs + 15 * convintel::util::kMillisPerDay));
  bool archived = false;
  try {
    store.Require("t1", PatternType::kWho);
  } catch (const convintel::util::NotFound&) {
    archived = true;
  }
  assert(archived);
}

void TestTransientWritesAreRetried() {
  auto         repo = std::make_shared<BusyRepository>(2);
  PatternStore store(repo, FastSettings());

  const auto outcome = store.Record("t1", WhoResult(40, 0.4, 0.25), At(kNowMs));
  assert(outcome.attempts == 3);
  assert(outcome.version == 1);
  assert(store.History("t1", PatternType::kWho, 0).size() == 1);
}

void TestRetryExhaustionIsStoreWriteFailure() {
  auto         repo = std::make_shared<BusyRepository>(100);
  PatternStore store(repo, FastSettings());

  bool threw = false;
  try {
    store.Record("t1", WhoResult(40, 0.4, 0.25), At(kNowMs));
  } catch (const convintel::util::StoreWriteFailure&) {
    threw = true;
  }
  assert(threw);
  // write_retries = 3 means four attempts
  assert(repo->upsert_calls == 4);
  assert(store.History("t1", PatternType::kWho, 0).empty());
  assert(!store.Get("t1", PatternType::kWho).has_value());
}

} // namespace

int main() {
  TestPromotionIncrementsVersion();
  TestRetainedRunKeepsCurrentAndRecordsHistory();
  TestSentinelIsNeverPromoted();
  TestWhoSupersedeRefreshesWeightCache();
  TestPayloadTypeMismatchIsRejected();
  TestArchiveExpiredMovesRowsToHistory();
  TestRequireDistinguishesMissingFromInsufficient();
  TestTransientWritesAreRetried();
  TestRetryExhaustionIsStoreWriteFailure();

  std::cout << "convintel_unit_pattern_store: pass\n";
  return 0;
}
