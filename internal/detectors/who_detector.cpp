#include "who_detector.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <string>
#include <vector>

#include "internal/detectors/stats.hpp"
#include "internal/features/lead_features.hpp"

namespace convintel::detectors {

namespace {

using LeadRecord = db::model::LeadRecord;

void SetWeights(const model::ScoringWeights& weights, v1::ScoringWeights* out) {
  out->set_data_quality(weights.data_quality);
  out->set_authority(weights.authority);
  out->set_company_fit(weights.company_fit);
  out->set_timing(weights.timing);
}

// Values with enough samples, ranked by rate (ties: larger sample, then name).
void AppendRankings(const std::map<std::string, RateCounter>& counters, double baseline,
                    google::protobuf::RepeatedPtrField<v1::CategoryRanking>* out) {
  std::vector<std::pair<std::string, RateCounter>> eligible;
  for (const auto& [value, counter] : counters) {
    if (counter.total >= WhoDetector::kMinRankingSample) eligible.emplace_back(value, counter);
  }

  std::sort(eligible.begin(), eligible.end(), [](const auto& a, const auto& b) {
    if (a.second.Rate() != b.second.Rate()) return a.second.Rate() > b.second.Rate();
    if (a.second.total != b.second.total) return a.second.total > b.second.total;
    return a.first < b.first;
  });
  if (eligible.size() > WhoDetector::kTopRankings) eligible.resize(WhoDetector::kTopRankings);

  for (const auto& [value, counter] : eligible) {
    auto* ranking = out->Add();
    ranking->set_value(value);
    ranking->set_conversion_rate(counter.Rate());
    ranking->set_sample_size(counter.total);
    ranking->set_lift(Lift(counter.Rate(), baseline));
  }
}

// flagged rate / unflagged rate; 1.0 without evidence on both sides.
double SignalLift(const RateCounter& flagged, const RateCounter& unflagged) {
  if (flagged.total < WhoDetector::kMinSignalSample || unflagged.total < WhoDetector::kMinSignalSample) return 1.0;
  if (unflagged.Rate() <= 0.0) return 1.0;
  return flagged.Rate() / unflagged.Rate();
}

struct SignalCounters {
  RateCounter flagged;
  RateCounter unflagged;

  void Add(bool flag, bool converted) {
    (flag ? flagged : unflagged).Add(converted);
  }
};

} // namespace

WhoDetector::WhoDetector(const config::DetectorSettings& settings) : optimizer_(settings.optimizer) {
}

DetectionResult WhoDetector::Detect(const TenantDataset& dataset) const {
  std::vector<const LeadRecord*> pool;
  for (const auto& lead : dataset.leads) {
    if (model::IsTerminal(lead.status)) pool.push_back(&lead);
  }

  RateCounter overall;
  for (const auto* lead : pool) {
    overall.Add(lead->status == model::LeadStatus::kConverted);
  }

  DetectionResult result;
  result.type        = model::PatternType::kWho;
  result.sample_size = overall.total;

  auto* who = result.payload.mutable_who();
  who->set_baseline_conversion_rate(overall.Rate());
  who->set_converted_count(overall.converted);

  if (overall.converted < kMinConverted || overall.total < kMinTotal) {
    result.sufficient = false;
    result.confidence = 0.0;
    SetWeights(model::DefaultWeights(), who->mutable_recommended_weights());
    who->set_optimizer_status("insufficient_data");
    return result;
  }

  const double baseline = overall.Rate();

  std::map<std::string, RateCounter> titles;
  std::map<std::string, RateCounter> industries;
  std::array<RateCounter, features::kSizeBuckets.size()> sizes{};
  SignalCounters new_role;
  SignalCounters hiring;
  SignalCounters funded;
  std::vector<TrainingRow> rows;

  for (const auto* lead : pool) {
    const bool converted = lead->status == model::LeadStatus::kConverted;

    if (auto title = features::NormalizeTitle(lead->title)) titles[*title].Add(converted);
    if (!lead->industry.empty()) industries[lead->industry].Add(converted);
    if (auto bucket = features::SizeBucketIndex(lead->employee_count)) sizes[*bucket].Add(converted);

    new_role.Add(lead->new_role, converted);
    hiring.Add(lead->hiring, converted);
    funded.Add(lead->funded, converted);

    if (lead->components) rows.push_back(MakeTrainingRow(*lead->components, converted));
  }

  AppendRankings(titles, baseline, who->mutable_title_rankings());
  AppendRankings(industries, baseline, who->mutable_industry_rankings());

  auto*       size_analysis = who->mutable_size_analysis();
  double      best_rate     = -1.0;
  std::string sweet_spot;
  for (std::size_t i = 0; i < sizes.size(); ++i) {
    const auto& counter = sizes[i];
    if (counter.total == 0) continue;

    auto* bucket = size_analysis->add_distribution();
    bucket->set_bucket(std::string(features::kSizeBuckets[i].label));
    bucket->set_conversion_rate(counter.Rate());
    bucket->set_sample_size(counter.total);

    if (counter.total >= kMinSizeSample && counter.Rate() > best_rate) {
      best_rate  = counter.Rate();
      sweet_spot = std::string(features::kSizeBuckets[i].label);
    }
  }
  size_analysis->set_sweet_spot(sweet_spot);

  auto* signals = who->mutable_timing_signals();
  signals->set_new_role_lift(SignalLift(new_role.flagged, new_role.unflagged));
  signals->set_hiring_lift(SignalLift(hiring.flagged, hiring.unflagged));
  signals->set_funded_lift(SignalLift(funded.flagged, funded.unflagged));

  const auto optimized = optimizer_.Optimize(rows);
  SetWeights(optimized.weights, who->mutable_recommended_weights());
  who->set_optimizer_status(optimized.status);

  result.sufficient = true;
  result.confidence = SampleConfidence(overall.converted);
  return result;
}

} // namespace convintel::detectors
