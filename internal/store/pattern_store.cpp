#include "pattern_store.hpp"

#include <stdexcept>
#include <thread>

#include "internal/model/pattern_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/pattern_codec.hpp"
#include "internal/util/errors.hpp"

namespace convintel::store {

namespace {

// A repository result that may succeed on a fresh transaction.
class TransientWrite : public std::runtime_error {
 public:
  explicit TransientWrite(const std::string& msg) : std::runtime_error(msg) {
  }
};

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context + ": " + db::ToString(result.code)
                                              : context + ": " + result.message;
  if (result.IsTransient()) {
    throw TransientWrite(message);
  }
  throw util::StoreWriteFailure(message);
}

} // namespace

PatternStore::PatternStore(std::shared_ptr<db::Repository> repository, config::StoreSettings settings)
    : repository_(std::move(repository)), settings_(settings) {
}

template <typename Fn>
auto PatternStore::WithRetry(const std::string& op, uint32_t* attempts, Fn&& fn) {
  const uint32_t max_attempts = settings_.write_retries + 1;
  for (uint32_t attempt = 1;; ++attempt) {
    if (attempts != nullptr) *attempts = attempt;

    std::string error;
    try {
      return fn();
    } catch (const TransientWrite& e) {
      error = e.what();
    } catch (const db::TransactionConflict& e) {
      error = e.what();
    }

    if (attempt >= max_attempts) {
      throw util::StoreWriteFailure(op + ": retries exhausted: " + error);
    }
    CONVINTEL_LOG_WARN("Transient store error; retrying", {observability::StringField("op", op), observability::StringField("error", error),
                                                           observability::IntField("attempt", attempt)});
    std::this_thread::sleep_for(settings_.retry_backoff);
  }
}

bool PatternStore::ShouldPromote(const detectors::DetectionResult& result) const {
  return result.sufficient && result.sample_size >= settings_.min_sample_size && result.confidence >= settings_.min_confidence;
}

RecordOutcome PatternStore::Record(const std::string& tenant_id, const detectors::DetectionResult& result, util::TimePoint computed_at) {
  if (!PayloadMatchesType(result.payload, result.type)) {
    throw util::InvalidArgument("record pattern: payload does not match type " + std::string(model::ToString(result.type)));
  }

  const uint64_t computed_ms = util::ToUnixMillis(computed_at);
  const bool     promote     = ShouldPromote(result);

  db::model::PatternRecord record;
  record.tenant_id      = tenant_id;
  record.pattern_type   = result.type;
  record.payload_json   = EncodePayload(result.payload);
  record.sample_size    = result.sample_size;
  record.confidence     = result.confidence;
  record.computed_at_ms = computed_ms;
  record.valid_until_ms = computed_ms + util::DaysToMillis(settings_.validity_days);

  const std::string context = "record " + std::string(model::ToString(result.type)) + " pattern for " + tenant_id;

  RecordOutcome outcome;
  outcome.superseded = promote;

  WithRetry(context, &outcome.attempts, [&] {
    auto tx      = repository_->Begin();
    auto current = repository_->GetPattern(*tx, tenant_id, result.type);

    record.version = promote ? (current ? current->version + 1 : 1) : 0;

    if (promote) {
      ThrowIfDbError(repository_->UpsertPattern(*tx, record), context);

      if (result.type == model::PatternType::kWho) {
        db::model::WeightCacheRecord cache;
        cache.tenant_id      = tenant_id;
        cache.weights        = FromProto(result.payload.who().recommended_weights());
        cache.sample_count   = result.sample_size;
        cache.updated_at_ms  = computed_ms;
        cache.valid_until_ms = record.valid_until_ms;
        ThrowIfDbError(repository_->UpsertWeightCache(*tx, cache), context + ": weight cache");
      }
    }

    db::model::PatternHistoryRecord history;
    history.pattern        = record;
    history.archived       = false;
    history.recorded_at_ms = computed_ms;
    ThrowIfDbError(repository_->AppendPatternHistory(*tx, history), context + ": history");

    tx->Commit();

    outcome.version = promote ? record.version : (current ? current->version : 0);
  });

  CONVINTEL_LOG_INFO(promote ? "Pattern superseded" : "Pattern retained",
                     {observability::StringField("tenant", tenant_id), observability::StringField("type", model::ToString(result.type)),
                      observability::IntField("version", static_cast<std::int64_t>(outcome.version)),
                      observability::IntField("sample_size", result.sample_size), observability::DoubleField("confidence", result.confidence)});
  return outcome;
}

uint32_t PatternStore::ArchiveExpired(util::TimePoint now) {
  const uint64_t now_ms = util::ToUnixMillis(now);

  uint32_t archived = 0;
  WithRetry("archive expired patterns", nullptr, [&] {
    archived = 0;
    auto tx  = repository_->Begin();
    for (const auto& record : repository_->ListAllPatterns(*tx)) {
      if (record.valid_until_ms > now_ms) continue;

      db::model::PatternHistoryRecord history;
      history.pattern        = record;
      history.archived       = true;
      history.recorded_at_ms = now_ms;
      ThrowIfDbError(repository_->AppendPatternHistory(*tx, history), "archive pattern history");
      ThrowIfDbError(repository_->DeletePattern(*tx, record.tenant_id, record.pattern_type), "archive pattern delete");
      ++archived;
    }
    tx->Commit();
  });

  if (archived > 0) {
    CONVINTEL_LOG_INFO("Archived expired patterns", {observability::IntField("count", archived)});
  }
  return archived;
}

std::optional<db::model::PatternRecord> PatternStore::Get(const std::string& tenant_id, model::PatternType type) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetPattern(*tx, tenant_id, type);
  tx->Commit();
  return record;
}

db::model::PatternRecord PatternStore::Require(const std::string& tenant_id, model::PatternType type) {
  auto tx      = repository_->Begin();
  auto record  = repository_->GetPattern(*tx, tenant_id, type);
  auto history = record ? std::vector<db::model::PatternHistoryRecord>{} : repository_->ListPatternHistory(*tx, tenant_id, type, 1);
  tx->Commit();

  if (record) return std::move(*record);

  const std::string what = std::string(model::ToString(type)) + " pattern for tenant " + tenant_id;
  if (!history.empty() && !history.front().archived) {
    throw util::InsufficientData("no " + what + ": last run below confidence or sample floor");
  }
  throw util::NotFound("no " + what);
}

std::vector<db::model::PatternRecord> PatternStore::List(const std::string& tenant_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListPatterns(*tx, tenant_id);
  tx->Commit();
  return records;
}

std::vector<db::model::PatternRecord> PatternStore::ListAll() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListAllPatterns(*tx);
  tx->Commit();
  return records;
}

std::vector<db::model::PatternHistoryRecord> PatternStore::History(const std::string& tenant_id, model::PatternType type, uint32_t limit) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListPatternHistory(*tx, tenant_id, type, limit);
  tx->Commit();
  return records;
}

} // namespace convintel::store
