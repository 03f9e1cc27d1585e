#include "admin_service.hpp"

#include <chrono>

#include "internal/health/health_monitor.hpp"
#include "internal/model/pattern_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/orchestration/backfill_flow.hpp"
#include "internal/orchestration/learning_orchestrator.hpp"
#include "internal/store/pattern_codec.hpp"
#include "internal/store/pattern_store.hpp"
#include "internal/util/errors.hpp"

namespace convintel::service {

using namespace convintel::services::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

void RequireTenant(const std::string& tenant_id) {
  if (tenant_id.empty()) {
    throw util::InvalidArgument("tenant_id is required");
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto AdminService::Instrumented(std::string_view route, Fn&& fn) {
  convintel::observability::SpanScope span(route);
  const auto                          started_at = std::chrono::steady_clock::now();

  try {
    auto resp = fn(span);
    convintel::observability::Metrics::Instance().RecordRequest(route, true);
    convintel::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CONVINTEL_LOG_ERROR("RPC failed",
                        {convintel::observability::StringField("route", route), convintel::observability::StringField("error", ex.what())});
    convintel::observability::Metrics::Instance().RecordRequest(route, false);
    convintel::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

GetPatternResponse AdminService::GetPattern(const GetPatternRequest& req) {
  return Instrumented("AdminService.GetPattern", [&](convintel::observability::SpanScope& span) {
    RequireTenant(req.tenant_id());
    const auto type = model::FromProto(req.pattern_type());
    span.SetAttribute("tenant", req.tenant_id());
    span.SetAttribute("pattern_type", model::ToString(type));

    const auto record = ctx_.store->Require(req.tenant_id(), type);

    GetPatternResponse resp;
    *resp.mutable_pattern() = store::ToProto(record);
    resp.set_expired(record.valid_until_ms <= util::ToUnixMillis(ctx_.clock()));
    return resp;
  });
}

ListPatternsResponse AdminService::ListPatterns(const ListPatternsRequest& req) {
  return Instrumented("AdminService.ListPatterns", [&](convintel::observability::SpanScope& span) {
    RequireTenant(req.tenant_id());
    span.SetAttribute("tenant", req.tenant_id());

    ListPatternsResponse resp;
    for (const auto& record : ctx_.store->List(req.tenant_id())) {
      *resp.add_patterns() = store::ToProto(record);
    }
    return resp;
  });
}

GetPatternHistoryResponse AdminService::GetPatternHistory(const GetPatternHistoryRequest& req) {
  return Instrumented("AdminService.GetPatternHistory", [&](convintel::observability::SpanScope& span) {
    RequireTenant(req.tenant_id());
    const auto type = model::FromProto(req.pattern_type());
    span.SetAttribute("tenant", req.tenant_id());
    span.SetAttribute("pattern_type", model::ToString(type));

    GetPatternHistoryResponse resp;
    for (const auto& row : ctx_.store->History(req.tenant_id(), type, req.limit())) {
      auto* entry = resp.add_entries();
      entry->set_history_id(row.history_id);
      entry->set_archived(row.archived);
      *entry->mutable_pattern() = store::ToProto(row.pattern);
    }
    return resp;
  });
}

TriggerLearningResponse AdminService::TriggerLearning(const TriggerLearningRequest& req) {
  return Instrumented("AdminService.TriggerLearning", [&](convintel::observability::SpanScope& span) {
    TriggerLearningResponse resp;
    if (req.tenant_id().empty()) {
      *resp.mutable_summary() = ctx_.orchestrator->RunAll(ctx_.clock());
    } else {
      span.SetAttribute("tenant", req.tenant_id());
      *resp.mutable_summary() = ctx_.orchestrator->RunOne(req.tenant_id(), ctx_.clock());
    }
    return resp;
  });
}

TriggerBackfillResponse AdminService::TriggerBackfill(const TriggerBackfillRequest& req) {
  return Instrumented("AdminService.TriggerBackfill", [&](convintel::observability::SpanScope& span) {
    RequireTenant(req.tenant_id());
    span.SetAttribute("tenant", req.tenant_id());

    TriggerBackfillResponse resp;
    *resp.mutable_summary() = ctx_.backfill->Run(req.tenant_id(), ctx_.clock());
    return resp;
  });
}

RunHealthCheckResponse AdminService::RunHealthCheck(const RunHealthCheckRequest&) {
  return Instrumented("AdminService.RunHealthCheck", [&](convintel::observability::SpanScope&) {
    RunHealthCheckResponse resp;
    *resp.mutable_report() = ctx_.health->Check(ctx_.clock());
    return resp;
  });
}

} // namespace convintel::service
