#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace convintel::model {

enum class LeadStatus : std::uint8_t {
  kActive        = 0,
  kConverted     = 1,
  kUnsubscribed  = 2,
  kBounced       = 3,
  kNotInterested = 4,
  kDead          = 5,
};

constexpr bool IsTerminal(LeadStatus status) {
  return status != LeadStatus::kActive;
}

constexpr bool IsFailed(LeadStatus status) {
  return IsTerminal(status) && status != LeadStatus::kConverted;
}

std::string_view          ToString(LeadStatus status);
std::optional<LeadStatus> ParseLeadStatus(std::string_view text);

enum class SubscriptionStatus : std::uint8_t {
  kActive    = 0,
  kTrialing  = 1,
  kPastDue   = 2,
  kCancelled = 3,
};

constexpr bool IsLearningEligible(SubscriptionStatus status) {
  return status == SubscriptionStatus::kActive || status == SubscriptionStatus::kTrialing;
}

std::string_view                  ToString(SubscriptionStatus status);
std::optional<SubscriptionStatus> ParseSubscriptionStatus(std::string_view text);

// ---------------------------------------------------------------------------
// Scoring components
// ---------------------------------------------------------------------------

inline constexpr std::size_t kComponentCount = 4;

// data_quality, authority, company_fit, timing
inline constexpr std::array<std::string_view, kComponentCount> kComponentNames = {
    "data_quality", "authority", "company_fit", "timing"};

inline constexpr std::array<double, kComponentCount> kComponentMaxima = {20.0, 25.0, 25.0, 15.0};

struct ComponentScores {
  double data_quality = 0.0;
  double authority    = 0.0;
  double company_fit  = 0.0;
  double timing       = 0.0;

  std::array<double, kComponentCount> AsArray() const {
    return {data_quality, authority, company_fit, timing};
  }

  double Total() const {
    return data_quality + authority + company_fit + timing;
  }

  bool operator==(const ComponentScores&) const = default;
};

inline constexpr double kWeightTarget     = 0.85;
inline constexpr double kWeightLowerBound = 0.05;
inline constexpr double kWeightUpperBound = 0.50;

struct ScoringWeights {
  double data_quality = 0.20;
  double authority    = 0.25;
  double company_fit  = 0.25;
  double timing       = 0.15;

  std::array<double, kComponentCount> AsArray() const {
    return {data_quality, authority, company_fit, timing};
  }

  static ScoringWeights FromArray(const std::array<double, kComponentCount>& values) {
    return {values[0], values[1], values[2], values[3]};
  }

  double Sum() const {
    return data_quality + authority + company_fit + timing;
  }

  bool operator==(const ScoringWeights&) const = default;
};

inline ScoringWeights DefaultWeights() {
  return {};
}

// Bounds per weight and sum within tolerance of kWeightTarget.
bool WeightsWithinBounds(const ScoringWeights& weights, double sum_tolerance);

// ---------------------------------------------------------------------------
// Tiers
// ---------------------------------------------------------------------------

enum class LeadTier : std::uint8_t {
  kHot  = 0,
  kWarm = 1,
  kCool = 2,
  kCold = 3,
};

inline constexpr double kHotThreshold  = 85.0;
inline constexpr double kWarmThreshold = 60.0;
inline constexpr double kCoolThreshold = 35.0;

constexpr LeadTier TierForScore(double score) {
  if (score >= kHotThreshold) return LeadTier::kHot;
  if (score >= kWarmThreshold) return LeadTier::kWarm;
  if (score >= kCoolThreshold) return LeadTier::kCool;
  return LeadTier::kCold;
}

constexpr std::string_view ToString(LeadTier tier) {
  switch (tier) {
    case LeadTier::kHot:
      return "hot";
    case LeadTier::kWarm:
      return "warm";
    case LeadTier::kCool:
      return "cool";
    case LeadTier::kCold:
      return "cold";
  }
  return "cold";
}

} // namespace convintel::model
