#include "lead.hpp"

#include <cmath>

namespace convintel::model {

std::string_view ToString(LeadStatus status) {
  switch (status) {
    case LeadStatus::kActive:
      return "active";
    case LeadStatus::kConverted:
      return "converted";
    case LeadStatus::kUnsubscribed:
      return "unsubscribed";
    case LeadStatus::kBounced:
      return "bounced";
    case LeadStatus::kNotInterested:
      return "not_interested";
    case LeadStatus::kDead:
      return "dead";
  }
  return "active";
}

std::optional<LeadStatus> ParseLeadStatus(std::string_view text) {
  for (const auto status : {LeadStatus::kActive, LeadStatus::kConverted, LeadStatus::kUnsubscribed, LeadStatus::kBounced,
                            LeadStatus::kNotInterested, LeadStatus::kDead}) {
    if (text == ToString(status)) return status;
  }
  return std::nullopt;
}

std::string_view ToString(SubscriptionStatus status) {
  switch (status) {
    case SubscriptionStatus::kActive:
      return "active";
    case SubscriptionStatus::kTrialing:
      return "trialing";
    case SubscriptionStatus::kPastDue:
      return "past_due";
    case SubscriptionStatus::kCancelled:
      return "cancelled";
  }
  return "cancelled";
}

std::optional<SubscriptionStatus> ParseSubscriptionStatus(std::string_view text) {
  for (const auto status : {SubscriptionStatus::kActive, SubscriptionStatus::kTrialing, SubscriptionStatus::kPastDue,
                            SubscriptionStatus::kCancelled}) {
    if (text == ToString(status)) return status;
  }
  return std::nullopt;
}

bool WeightsWithinBounds(const ScoringWeights& weights, double sum_tolerance) {
  for (const double w : weights.AsArray()) {
    if (!std::isfinite(w) || w < kWeightLowerBound - 1e-9 || w > kWeightUpperBound + 1e-9) {
      return false;
    }
  }
  return std::fabs(weights.Sum() - kWeightTarget) <= sum_tolerance;
}

} // namespace convintel::model
