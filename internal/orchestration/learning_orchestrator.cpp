#include "learning_orchestrator.hpp"

#include <chrono>
#include <future>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace convintel::orchestration {

namespace {

using convintel::v1::DetectorRunResult;
using convintel::v1::TenantRunResult;

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

std::string_view OutcomeName(convintel::v1::DetectorOutcome outcome) {
  switch (outcome) {
    case convintel::v1::DETECTOR_OUTCOME_SUPERSEDED:
      return "superseded";
    case convintel::v1::DETECTOR_OUTCOME_RETAINED_PREVIOUS:
      return "retained";
    case convintel::v1::DETECTOR_OUTCOME_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

void Tally(convintel::v1::LearningRunSummary& summary) {
  uint32_t written  = 0;
  uint32_t retained = 0;
  uint32_t failures = 0;
  for (const auto& tenant : summary.tenants()) {
    if (tenant.failed()) ++failures;
    for (const auto& unit : tenant.detectors()) {
      switch (unit.outcome()) {
        case convintel::v1::DETECTOR_OUTCOME_SUPERSEDED:
          ++written;
          break;
        case convintel::v1::DETECTOR_OUTCOME_RETAINED_PREVIOUS:
          ++retained;
          break;
        case convintel::v1::DETECTOR_OUTCOME_FAILED:
          ++failures;
          break;
        default:
          break;
      }
    }
  }
  summary.set_tenants_processed(static_cast<uint32_t>(summary.tenants_size()));
  summary.set_patterns_written(written);
  summary.set_patterns_retained(retained);
  summary.set_failures(failures);
}

} // namespace

LearningOrchestrator::LearningOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<store::PatternStore> store,
                                           std::vector<std::shared_ptr<const detectors::Detector>> detectors,
                                           config::LearningSettings settings, std::shared_ptr<WorkerPool> pool)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      detectors_(std::move(detectors)),
      settings_(settings),
      pool_(std::move(pool)) {
}

std::vector<std::string> LearningOrchestrator::EligibleTenants(util::TimePoint now) {
  const uint64_t now_ms   = util::ToUnixMillis(now);
  const uint64_t window   = util::DaysToMillis(settings_.lookback_days);
  const uint64_t since_ms = now_ms > window ? now_ms - window : 0;

  std::vector<std::string> eligible;
  auto                     tx = repository_->Begin();
  for (const auto& tenant : repository_->ListTenants(*tx)) {
    if (tenant.deleted || !model::IsLearningEligible(tenant.status)) continue;
    if (repository_->CountConversionsSince(*tx, tenant.id, since_ms) < settings_.min_conversions) continue;
    eligible.push_back(tenant.id);
  }
  tx->Commit();
  return eligible;
}

std::vector<std::string> LearningOrchestrator::FindBackfillCandidates(util::TimePoint now) {
  const uint64_t now_ms = util::ToUnixMillis(now);

  std::vector<std::string> candidates;
  for (const auto& tenant_id : EligibleTenants(now)) {
    bool usable = false;
    for (const auto& record : store_->List(tenant_id)) {
      if (record.valid_until_ms > now_ms) {
        usable = true;
        break;
      }
    }
    if (!usable) candidates.push_back(tenant_id);
  }
  return candidates;
}

DetectorRunResult LearningOrchestrator::RunUnit(const detectors::Detector& detector, const detectors::TenantDataset& dataset,
                                                util::TimePoint now) {
  const auto type  = detector.Type();
  const auto start = std::chrono::steady_clock::now();

  DetectorRunResult run;
  run.set_pattern_type(model::ToProto(type));

  const uint32_t max_attempts = settings_.max_retries + 1;
  std::string    last_error;
  bool           succeeded = false;

  for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    run.set_attempts(attempt);
    try {
      const auto result  = detector.Detect(dataset);
      const auto outcome = store_->Record(dataset.tenant_id, result, now);

      run.set_outcome(outcome.superseded ? convintel::v1::DETECTOR_OUTCOME_SUPERSEDED
                                         : convintel::v1::DETECTOR_OUTCOME_RETAINED_PREVIOUS);
      run.set_confidence(result.confidence);
      run.set_sample_size(result.sample_size);
      run.set_version(outcome.version);
      succeeded = true;
      break;
    } catch (const std::exception& e) {
      last_error = e.what();
      CONVINTEL_LOG_WARN("Detector attempt failed",
                         {observability::StringField("tenant", dataset.tenant_id), observability::StringField("type", model::ToString(type)),
                          observability::IntField("attempt", attempt), observability::StringField("error", e.what())});
      if (attempt < max_attempts) {
        std::this_thread::sleep_for(settings_.retry_delay);
      }
    }
  }

  if (!succeeded) {
    run.set_outcome(convintel::v1::DETECTOR_OUTCOME_FAILED);
    run.set_error(last_error);
    CONVINTEL_LOG_ERROR("Detector failed after retries",
                        {observability::StringField("tenant", dataset.tenant_id), observability::StringField("type", model::ToString(type)),
                         observability::IntField("attempts", run.attempts()), observability::StringField("error", last_error)});
  }

  observability::Metrics::Instance().RecordDetectorRun(model::ToString(type), OutcomeName(run.outcome()));
  observability::Metrics::Instance().ObserveDetectorLatencyMs(model::ToString(type), ElapsedMs(start));
  return run;
}

TenantRunResult LearningOrchestrator::RunTenant(const std::string& tenant_id, util::TimePoint now) {
  observability::SpanScope span("learning.tenant");
  span.SetAttribute("tenant", tenant_id);

  {
    auto tx     = repository_->Begin();
    auto tenant = repository_->GetTenant(*tx, tenant_id);
    tx->Commit();
    if (!tenant) {
      throw util::NotFound("tenant not found: " + tenant_id);
    }
  }

  TenantRunResult result;
  result.set_tenant_id(tenant_id);

  const auto dataset = detectors::LoadDataset(*repository_, tenant_id, util::ToUnixMillis(now), settings_.lookback_days);

  std::vector<std::future<DetectorRunResult>> units;
  units.reserve(detectors_.size());
  for (const auto& detector : detectors_) {
    units.push_back(std::async(std::launch::async, [this, detector, &dataset, now] { return RunUnit(*detector, dataset, now); }));
  }
  for (auto& unit : units) {
    *result.add_detectors() = unit.get();
  }

  CONVINTEL_LOG_INFO("Tenant learning finished", {observability::StringField("tenant", tenant_id),
                                                  observability::IntField("leads", static_cast<std::int64_t>(dataset.leads.size())),
                                                  observability::IntField("touches", static_cast<std::int64_t>(dataset.touches.size()))});
  return result;
}

TenantRunResult LearningOrchestrator::RunTenantGuarded(const std::string& tenant_id, util::TimePoint now) {
  try {
    return RunTenant(tenant_id, now);
  } catch (const std::exception& e) {
    CONVINTEL_LOG_ERROR("Tenant learning failed", {observability::StringField("tenant", tenant_id), observability::StringField("error", e.what())});
    TenantRunResult failed;
    failed.set_tenant_id(tenant_id);
    failed.set_failed(true);
    failed.set_error(e.what());
    return failed;
  }
}

convintel::v1::LearningRunSummary LearningOrchestrator::RunAll(util::TimePoint now) {
  observability::SpanScope span("learning.run");

  convintel::v1::LearningRunSummary summary;
  summary.set_run_id(util::GenerateUUIDString());
  *summary.mutable_started_at() = util::ToProto(util::Now());

  CONVINTEL_LOG_INFO("Learning run started", {observability::StringField("run_id", summary.run_id())});

  if (settings_.archive_expired) {
    try {
      summary.set_archived_patterns(store_->ArchiveExpired(now));
    } catch (const util::StoreWriteFailure& e) {
      CONVINTEL_LOG_ERROR("Archiving expired patterns failed", {observability::StringField("error", e.what())});
    }
  }

  const auto tenants = EligibleTenants(now);

  std::vector<std::future<TenantRunResult>> runs;
  runs.reserve(tenants.size());
  for (const auto& tenant_id : tenants) {
    runs.push_back(pool_->Submit([this, tenant_id, now] { return RunTenantGuarded(tenant_id, now); }));
  }

  for (auto& run : runs) {
    *summary.add_tenants() = run.get();
  }

  Tally(summary);
  *summary.mutable_completed_at() = util::ToProto(util::Now());

  span.SetAttribute("tenants", static_cast<std::int64_t>(tenants.size()));
  span.SetAttribute("failures", static_cast<std::int64_t>(summary.failures()));

  CONVINTEL_LOG_INFO("Learning run finished",
                     {observability::StringField("run_id", summary.run_id()), observability::IntField("tenants", summary.tenants_processed()),
                      observability::IntField("written", summary.patterns_written()),
                      observability::IntField("retained", summary.patterns_retained()),
                      observability::IntField("failures", summary.failures())});
  return summary;
}

convintel::v1::LearningRunSummary LearningOrchestrator::RunOne(const std::string& tenant_id, util::TimePoint now) {
  convintel::v1::LearningRunSummary summary;
  summary.set_run_id(util::GenerateUUIDString());
  *summary.mutable_started_at() = util::ToProto(util::Now());

  *summary.add_tenants() = RunTenant(tenant_id, now);

  Tally(summary);
  *summary.mutable_completed_at() = util::ToProto(util::Now());
  return summary;
}

} // namespace convintel::orchestration
