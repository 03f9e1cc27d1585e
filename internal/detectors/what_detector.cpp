#include "what_detector.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <map>
#include <string>
#include <vector>

#include "internal/detectors/stats.hpp"
#include "internal/features/content_snapshot.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace convintel::detectors {

namespace {

using TouchRecord = db::model::TouchRecord;

struct Sample {
  v1::ContentSnapshot snapshot;
  model::Channel      channel   = model::Channel::kEmail;
  bool                converted = false;
};

// Per-feature counters; frequency is measured against converting touches.
class FeatureTable {
 public:
  void Add(const std::string& name, bool converted) {
    counters_[name].Add(converted);
  }

  std::vector<v1::FeatureLift> Eligible(double baseline, uint32_t converting_total) const {
    std::vector<v1::FeatureLift> out;
    for (const auto& [name, counter] : counters_) {
      if (counter.total < WhatDetector::kMinFeatureSample) continue;
      v1::FeatureLift lift;
      lift.set_name(name);
      lift.set_frequency(converting_total == 0 ? 0.0
                                               : static_cast<double>(counter.converted) / static_cast<double>(converting_total));
      lift.set_conversion_rate(counter.Rate());
      lift.set_lift(Lift(counter.Rate(), baseline));
      lift.set_sample_size(counter.total);
      out.push_back(std::move(lift));
    }
    return out;
  }

 private:
  std::map<std::string, RateCounter> counters_;
};

bool LiftDescending(const v1::FeatureLift& a, const v1::FeatureLift& b) {
  if (a.lift() != b.lift()) return a.lift() > b.lift();
  if (a.sample_size() != b.sample_size()) return a.sample_size() > b.sample_size();
  return a.name() < b.name();
}

bool LiftAscending(const v1::FeatureLift& a, const v1::FeatureLift& b) {
  if (a.lift() != b.lift()) return a.lift() < b.lift();
  if (a.sample_size() != b.sample_size()) return a.sample_size() > b.sample_size();
  return a.name() < b.name();
}

template <typename Pred, typename Order>
void AppendSelected(std::vector<v1::FeatureLift> candidates, Pred keep, Order order, std::size_t limit,
                    google::protobuf::RepeatedPtrField<v1::FeatureLift>* out) {
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const v1::FeatureLift& f) { return !keep(f); }),
                   candidates.end());
  std::sort(candidates.begin(), candidates.end(), order);
  if (limit > 0 && candidates.size() > limit) candidates.resize(limit);
  for (auto& c : candidates) {
    *out->Add() = std::move(c);
  }
}

bool Effective(const v1::FeatureLift& f) {
  return f.lift() > 1.0;
}

bool Ineffective(const v1::FeatureLift& f) {
  return f.lift() < 1.0;
}

bool Any(const v1::FeatureLift&) {
  return true;
}

struct PersonalizationFlag {
  const char* name;
  bool (v1::PersonalizationFlags::*get)() const;
};

constexpr PersonalizationFlag kPersonalizationFlags[] = {
    {"company_mention", &v1::PersonalizationFlags::has_company_mention},
    {"first_name", &v1::PersonalizationFlags::has_first_name},
    {"recent_news", &v1::PersonalizationFlags::has_recent_news},
    {"mutual_connection", &v1::PersonalizationFlags::has_mutual_connection},
    {"industry_specific", &v1::PersonalizationFlags::has_industry_specific},
};

} // namespace

WhatDetector::WhatDetector(const config::DetectorSettings& settings) : non_converting_cap_(settings.non_converting_sample_cap) {
}

DetectionResult WhatDetector::Detect(const TenantDataset& dataset) const {
  std::vector<const TouchRecord*> converting;
  std::vector<const TouchRecord*> others;
  for (const auto& touch : dataset.touches) {
    (touch.led_to_booking ? converting : others).push_back(&touch);
  }

  // most recent first; id keeps equal timestamps deterministic
  std::sort(others.begin(), others.end(), [](const TouchRecord* a, const TouchRecord* b) {
    if (a->sent_at_ms != b->sent_at_ms) return a->sent_at_ms > b->sent_at_ms;
    return a->id < b->id;
  });
  if (others.size() > non_converting_cap_) others.resize(non_converting_cap_);

  std::vector<Sample> samples;
  uint32_t            skipped = 0;
  auto                decode  = [&](const TouchRecord* touch, bool converted) {
    try {
      samples.push_back({features::DecodeSnapshot(touch->content_snapshot), touch->channel, converted});
    } catch (const util::MalformedContent& e) {
      ++skipped;
      CONVINTEL_LOG_DEBUG("Skipping touch with malformed content snapshot",
                          {observability::StringField("tenant", dataset.tenant_id), observability::StringField("touch", touch->id),
                           observability::StringField("error", e.what())});
    }
  };
  for (const auto* touch : converting) decode(touch, true);
  for (const auto* touch : others) decode(touch, false);

  if (skipped > 0) {
    CONVINTEL_LOG_WARN("Touches skipped for malformed content", {observability::StringField("tenant", dataset.tenant_id),
                                                                 observability::IntField("skipped", skipped)});
  }

  RateCounter overall;
  for (const auto& sample : samples) overall.Add(sample.converted);

  DetectionResult result;
  result.type        = model::PatternType::kWhat;
  result.sample_size = overall.total;

  auto* what = result.payload.mutable_what();
  what->set_skipped_malformed(skipped);

  if (overall.converted < kMinConverting || overall.total < kMinTotal) {
    result.sufficient = false;
    result.confidence = 0.0;
    return result;
  }

  const double baseline = overall.Rate();

  FeatureTable pain_points;
  FeatureTable ctas;
  FeatureTable angles;
  FeatureTable subjects;
  FeatureTable templates;
  std::map<model::Channel, std::vector<uint32_t>> converting_lengths;
  std::array<RateCounter, std::size(kPersonalizationFlags)> personalization{};
  RateCounter with_links;
  RateCounter without_links;

  for (const auto& sample : samples) {
    const auto& snap      = sample.snapshot;
    const bool  converted = sample.converted;

    for (const auto& pain : snap.pain_points()) pain_points.Add(pain, converted);
    if (!snap.cta().empty()) ctas.Add(snap.cta(), converted);
    for (const auto& angle : snap.angles()) angles.Add(angle, converted);
    if (sample.channel == model::Channel::kEmail && !snap.subject_pattern().empty()) {
      subjects.Add(snap.subject_pattern(), converted);
    }
    if (!snap.template_id().empty()) templates.Add(snap.template_id(), converted);

    if (converted) converting_lengths[sample.channel].push_back(snap.word_count());

    for (std::size_t i = 0; i < std::size(kPersonalizationFlags); ++i) {
      if ((snap.personalization().*kPersonalizationFlags[i].get)()) personalization[i].Add(converted);
    }

    (snap.link_count() > 0 ? with_links : without_links).Add(converted);
  }

  const uint32_t converting_total = overall.converted;

  const auto pains = pain_points.Eligible(baseline, converting_total);
  AppendSelected(pains, Effective, LiftDescending, kTopEffective, what->mutable_pain_points()->mutable_effective());
  AppendSelected(pains, Ineffective, LiftAscending, kTopIneffective, what->mutable_pain_points()->mutable_ineffective());

  AppendSelected(ctas.Eligible(baseline, converting_total), Effective, LiftDescending, 0, what->mutable_ctas()->mutable_effective());
  AppendSelected(angles.Eligible(baseline, converting_total), Any, LiftDescending, 0, what->mutable_angles()->mutable_rankings());

  const auto subject_lifts = subjects.Eligible(baseline, converting_total);
  AppendSelected(subject_lifts, Effective, LiftDescending, 0, what->mutable_subject_patterns()->mutable_winning());
  AppendSelected(subject_lifts, Ineffective, LiftAscending, 0, what->mutable_subject_patterns()->mutable_losing());

  AppendSelected(templates.Eligible(baseline, converting_total), Any, LiftDescending, 0, what->mutable_template_performance());

  for (const auto channel : model::kAllChannels) {
    auto it = converting_lengths.find(channel);
    if (it == converting_lengths.end() || it->second.size() < kMinLengthSample) continue;

    const uint32_t optimal = UpperMedian(it->second);
    auto*          band    = what->add_optimal_length();
    band->set_channel(std::string(model::ToString(channel)));
    band->set_optimal_words(optimal);
    band->set_min_words(optimal > kMinLengthFloor + kLengthBand ? optimal - kLengthBand : kMinLengthFloor);
    band->set_max_words(optimal + kLengthBand);
    band->set_sample_size(static_cast<uint32_t>(it->second.size()));
  }

  for (std::size_t i = 0; i < std::size(kPersonalizationFlags); ++i) {
    const auto& counter = personalization[i];
    auto*       lift    = what->add_personalization_lift();
    lift->set_name(kPersonalizationFlags[i].name);
    lift->set_value(counter.total < kMinFeatureSample ? 1.0 : Lift(counter.Rate(), baseline));
  }

  auto* links = what->mutable_link_effectiveness();
  links->set_name("links");
  links->set_frequency(converting_total == 0 ? 0.0
                                             : static_cast<double>(with_links.converted) / static_cast<double>(converting_total));
  links->set_conversion_rate(with_links.Rate());
  links->set_sample_size(with_links.total);
  if (with_links.total < kMinFeatureSample || without_links.total < kMinFeatureSample || without_links.Rate() <= 0.0) {
    links->set_lift(1.0);
  } else {
    links->set_lift(with_links.Rate() / without_links.Rate());
  }

  result.sufficient = true;
  result.confidence = SampleConfidence(overall.converted);
  return result;
}

} // namespace convintel::detectors
