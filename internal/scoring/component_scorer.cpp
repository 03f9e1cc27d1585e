#include "component_scorer.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

#include "internal/features/content_features.hpp"

namespace convintel::scoring {

namespace {

constexpr double kRiskMax = 15.0;

constexpr std::array<std::pair<std::string_view, double>, 14> kAuthorityScores = {{
    {"owner", 25},
    {"ceo", 25},
    {"founder", 25},
    {"co-founder", 25},
    {"chief", 22},
    {"c-suite", 22},
    {"president", 22},
    {"vice president", 18},
    {"vp", 18},
    {"director", 15},
    {"head", 15},
    {"senior manager", 10},
    {"manager", 7},
    {"lead", 7},
}};

constexpr std::array<std::string_view, 5> kBadTitles = {"assistant", "intern", "student", "coordinator", "receptionist"};

constexpr std::array<std::string_view, 3> kPreferredCountries = {"australia", "au", "aus"};
constexpr std::array<std::string_view, 8> kSecondaryCountries = {"new zealand", "nz", "united states", "us", "usa", "united kingdom", "uk", "gb"};

template <std::size_t N>
bool OneOf(const std::string& value, const std::array<std::string_view, N>& options) {
  return std::find(options.begin(), options.end(), value) != options.end();
}

} // namespace

ComponentScorer::ComponentScorer(std::vector<std::string> target_industries) : target_industries_(std::move(target_industries)) {
}

model::ComponentScores ComponentScorer::Score(const db::model::LeadRecord& lead) const {
  return {DataQuality(lead), Authority(lead.title), CompanyFit(lead), Timing(lead)};
}

double ComponentScorer::DataQuality(const db::model::LeadRecord& lead) {
  double score = 0;
  if (lead.email_verified) {
    score += 8;
  } else if (lead.has_email) {
    score += 4;
  }
  if (lead.has_phone) {
    score += lead.phone_verified ? 6 : 3;
  }
  if (lead.has_linkedin) score += 4;
  if (lead.has_personal_email) score += 2;
  return std::min(model::kComponentMaxima[0], score);
}

double ComponentScorer::Authority(const std::string& title) {
  if (title.empty()) return 0;
  const auto lowered = features::ToLower(title);
  for (const auto& [keyword, points] : kAuthorityScores) {
    if (lowered.find(keyword) != std::string::npos) return points;
  }
  return 5;
}

double ComponentScorer::CompanyFit(const db::model::LeadRecord& lead) const {
  double score = 0;

  if (!lead.industry.empty()) {
    const auto industry = features::ToLower(lead.industry);
    for (const auto& target : target_industries_) {
      if (industry.find(features::ToLower(target)) != std::string::npos) {
        score += 10;
        break;
      }
    }
  }

  const auto count = lead.employee_count;
  if (count >= 5 && count <= 50) {
    score += 8;
  } else if (count >= 51 && count <= 200) {
    score += 5;
  } else if (count >= 1 && count <= 4) {
    score += 3;
  }

  if (!lead.country.empty()) {
    const auto country = features::ToLower(lead.country);
    if (OneOf(country, kPreferredCountries)) {
      score += 7;
    } else if (OneOf(country, kSecondaryCountries)) {
      score += 4;
    }
  }
  return std::min(model::kComponentMaxima[2], score);
}

double ComponentScorer::Timing(const db::model::LeadRecord& lead) {
  double score = 0;
  if (lead.new_role) score += 6;
  if (lead.hiring) score += 5;
  if (lead.funded) score += 4;
  return std::min(model::kComponentMaxima[3], score);
}

double ComponentScorer::Risk(const db::model::LeadRecord& lead) {
  double score = kRiskMax;
  if (lead.status == model::LeadStatus::kBounced) score -= 10;
  if (lead.status == model::LeadStatus::kUnsubscribed) score -= 15;
  const auto title = features::ToLower(lead.title);
  if (std::any_of(kBadTitles.begin(), kBadTitles.end(), [&](std::string_view bad) { return title.find(bad) != std::string::npos; })) {
    score -= 5;
  }
  return std::max(0.0, score);
}

double ComponentScorer::TotalScore(const db::model::LeadRecord& lead, const model::ComponentScores& components,
                                   const model::ScoringWeights& weights) const {
  const auto values = components.AsArray();
  const auto w      = weights.AsArray();

  double total = 0;
  for (std::size_t i = 0; i < model::kComponentCount; ++i) {
    total += values[i] / model::kComponentMaxima[i] * 100.0 * w[i];
  }
  const double risk_weight = std::max(0.0, 1.0 - weights.Sum());
  total += Risk(lead) / kRiskMax * 100.0 * risk_weight;
  return std::clamp(total, 0.0, 100.0);
}

} // namespace convintel::scoring
