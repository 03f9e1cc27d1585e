#include "backfill_flow.hpp"

#include <map>
#include <vector>

#include "internal/features/content_snapshot.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scoring/score_snapshot_writer.hpp"
#include "internal/util/errors.hpp"

namespace convintel::orchestration {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  const auto message = result.message.empty() ? context + ": " + db::ToString(result.code) : context + ": " + result.message;
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound(message);
  }
  throw util::StoreWriteFailure(message);
}

bool SnapshotUsable(const std::string& json) {
  if (json.empty()) return false;
  try {
    features::DecodeSnapshot(json);
    return true;
  } catch (const util::MalformedContent&) {
    return false;
  }
}

} // namespace

BackfillFlow::BackfillFlow(std::shared_ptr<db::Repository> repository, std::shared_ptr<LearningOrchestrator> orchestrator,
                           scoring::ComponentScorer scorer)
    : repository_(std::move(repository)), orchestrator_(std::move(orchestrator)), scorer_(std::move(scorer)) {
}

convintel::v1::BackfillSummary BackfillFlow::Run(const std::string& tenant_id, util::TimePoint now) {
  observability::SpanScope span("backfill.run");
  span.SetAttribute("tenant", tenant_id);

  convintel::v1::BackfillSummary summary;
  summary.set_tenant_id(tenant_id);

  uint32_t content_rebuilt   = 0;
  uint32_t component_rebuilt = 0;
  uint32_t bookings_flagged  = 0;

  {
    auto tx = repository_->Begin();
    if (!repository_->GetTenant(*tx, tenant_id)) {
      throw util::NotFound("tenant not found: " + tenant_id);
    }

    const auto leads   = repository_->ListLeads(*tx, tenant_id, 0);
    const auto touches = repository_->ListTouches(*tx, tenant_id, 0);

    std::map<std::string, const db::model::LeadRecord*> leads_by_id;
    for (const auto& lead : leads) leads_by_id[lead.id] = &lead;

    // content snapshots
    for (const auto& touch : touches) {
      if (SnapshotUsable(touch.content_snapshot)) continue;

      auto        it       = leads_by_id.find(touch.lead_id);
      const auto* lead     = it == leads_by_id.end() ? nullptr : it->second;
      const auto  snapshot = features::EncodeSnapshot(features::BuildContentSnapshot(touch, lead));
      ThrowIfDbError(repository_->UpdateTouchSnapshot(*tx, tenant_id, touch.id, snapshot), "backfill content snapshot " + touch.id);
      ++content_rebuilt;
    }

    // component snapshots, scored with the default weights
    const auto weights = model::DefaultWeights();
    for (const auto& lead : leads) {
      if (lead.components) continue;

      const auto   components = scorer_.Score(lead);
      const double score      = lead.score > 0.0 ? lead.score : scorer_.TotalScore(lead, components, weights);
      const auto   scored_at  = lead.scored_at_ms > 0 ? util::FromUnixMillis(lead.scored_at_ms) : now;
      scoring::ScoreSnapshotWriter::Record(*repository_, *tx, tenant_id, lead.id, components, weights, score, scored_at);
      ++component_rebuilt;
    }

    // booking touches
    std::map<std::string, std::vector<const db::model::TouchRecord*>> touches_by_lead;
    for (const auto& touch : touches) touches_by_lead[touch.lead_id].push_back(&touch);

    for (const auto& lead : leads) {
      if (lead.status != model::LeadStatus::kConverted || lead.converted_at_ms == 0) continue;

      auto it = touches_by_lead.find(lead.id);
      if (it == touches_by_lead.end()) continue;

      const db::model::TouchRecord* booking  = nullptr;
      bool                          flagged  = false;
      for (const auto* touch : it->second) {
        if (touch->led_to_booking) flagged = true;
        if (touch->sent_at_ms <= lead.converted_at_ms) booking = touch;
      }
      if (flagged || booking == nullptr) continue;

      const auto result = repository_->SetLedToBooking(*tx, tenant_id, booking->id);
      if (result.code == db::ErrorCode::AlreadyExists) continue;
      ThrowIfDbError(result, "backfill booking flag " + booking->id);
      ++bookings_flagged;
    }

    tx->Commit();
  }

  summary.set_content_snapshots_rebuilt(content_rebuilt);
  summary.set_component_snapshots_rebuilt(component_rebuilt);
  summary.set_bookings_flagged(bookings_flagged);

  CONVINTEL_LOG_INFO("Backfill repairs committed",
                     {observability::StringField("tenant", tenant_id), observability::IntField("content_snapshots", content_rebuilt),
                      observability::IntField("component_snapshots", component_rebuilt),
                      observability::IntField("bookings_flagged", bookings_flagged)});

  *summary.mutable_detection() = orchestrator_->RunTenant(tenant_id, now);
  return summary;
}

} // namespace convintel::orchestration
