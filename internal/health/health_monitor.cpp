#include "health_monitor.hpp"

#include <string>

#include "internal/model/pattern_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/pattern_codec.hpp"
#include "internal/util/errors.hpp"

namespace convintel::health {

namespace {

using convintel::v1::HealthWarning;
using convintel::v1::Severity;

std::string_view SeverityName(Severity severity) {
  switch (severity) {
    case convintel::v1::SEVERITY_LOW:
      return "low";
    case convintel::v1::SEVERITY_MEDIUM:
      return "medium";
    case convintel::v1::SEVERITY_HIGH:
      return "high";
    default:
      return "unspecified";
  }
}

HealthWarning MakeWarning(const db::model::PatternRecord& record, std::string code, Severity severity, std::string message) {
  HealthWarning warning;
  warning.set_tenant_id(record.tenant_id);
  warning.set_pattern_type(model::ToProto(record.pattern_type));
  warning.set_code(std::move(code));
  warning.set_severity(severity);
  warning.set_message(std::move(message));
  return warning;
}

} // namespace

HealthMonitor::HealthMonitor(std::shared_ptr<store::PatternStore> store, config::HealthSettings settings)
    : store_(std::move(store)), settings_(settings) {
}

std::vector<HealthWarning> HealthMonitor::Inspect(const db::model::PatternRecord& record, util::TimePoint now) const {
  std::vector<HealthWarning> warnings;

  const auto state = model::Classify(record.valid_until_ms, util::ToUnixMillis(now), util::DaysToMillis(settings_.expiring_soon_days));
  if (state == model::PatternState::kExpired) {
    warnings.push_back(MakeWarning(record, "expired", convintel::v1::SEVERITY_HIGH, "pattern expired; consumers fall back to defaults"));
  } else if (state == model::PatternState::kExpiringSoon) {
    warnings.push_back(MakeWarning(record, "expiring_soon", convintel::v1::SEVERITY_LOW,
                                   "pattern expires within " + std::to_string(settings_.expiring_soon_days) + " days"));
  }

  if (record.sample_size < settings_.min_sample_size) {
    warnings.push_back(MakeWarning(record, "low_sample_size", convintel::v1::SEVERITY_MEDIUM,
                                   "sample size " + std::to_string(record.sample_size) + " below " +
                                       std::to_string(settings_.min_sample_size)));
  }

  if (record.confidence < settings_.min_confidence) {
    warnings.push_back(MakeWarning(record, "low_confidence", convintel::v1::SEVERITY_MEDIUM,
                                   "confidence " + std::to_string(record.confidence) + " below " +
                                       std::to_string(settings_.min_confidence)));
  }

  try {
    const auto payload = store::DecodePayload(record.payload_json, record.pattern_type);
    if (record.pattern_type == model::PatternType::kWho) {
      const auto weights = store::FromProto(payload.who().recommended_weights());
      if (!model::WeightsWithinBounds(weights, settings_.weight_sum_tolerance)) {
        warnings.push_back(MakeWarning(record, "weights_out_of_bounds", convintel::v1::SEVERITY_HIGH,
                                       "recommended weights outside [0.05,0.50] or sum " + std::to_string(weights.Sum()) +
                                           " away from 0.85"));
      }
    }
  } catch (const util::MalformedContent& e) {
    warnings.push_back(MakeWarning(record, "undecodable_payload", convintel::v1::SEVERITY_HIGH, e.what()));
  }

  return warnings;
}

convintel::v1::HealthReport HealthMonitor::Check(util::TimePoint now) {
  observability::SpanScope span("health.check");

  convintel::v1::HealthReport report;
  *report.mutable_checked_at() = util::ToProto(now);

  const auto patterns = store_->ListAll();
  report.set_patterns_checked(static_cast<uint32_t>(patterns.size()));

  uint32_t high = 0;
  for (const auto& record : patterns) {
    for (auto& warning : Inspect(record, now)) {
      if (warning.severity() == convintel::v1::SEVERITY_HIGH) ++high;

      CONVINTEL_LOG_WARN("Pattern health warning",
                         {observability::StringField("tenant", warning.tenant_id()),
                          observability::StringField("type", model::ToString(record.pattern_type)),
                          observability::StringField("code", warning.code()),
                          observability::StringField("severity", SeverityName(warning.severity())),
                          observability::StringField("message", warning.message())});
      observability::Metrics::Instance().RecordHealthWarning(SeverityName(warning.severity()));

      *report.add_warnings() = std::move(warning);
    }
  }

  span.SetAttribute("patterns", static_cast<std::int64_t>(patterns.size()));
  span.SetAttribute("warnings", static_cast<std::int64_t>(report.warnings_size()));

  if (settings_.escalation_threshold > 0 && high >= settings_.escalation_threshold) {
    report.set_escalated(true);
    CONVINTEL_LOG_ERROR("Pattern health escalation", {observability::IntField("high_severity", high),
                                                      observability::IntField("threshold", settings_.escalation_threshold)});
    observability::Metrics::Instance().RecordEscalation();
  }

  return report;
}

} // namespace convintel::health
