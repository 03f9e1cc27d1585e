#include "how_detector.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/detectors/stats.hpp"
#include "internal/model/lead.hpp"

namespace convintel::detectors {

namespace {

constexpr std::array<const char*, HowDetector::kChannelCountBuckets> kCountBucketLabels = {"1", "2", "3", "4+"};

constexpr std::array<model::LeadTier, 3> kReportedTiers = {model::LeadTier::kHot, model::LeadTier::kWarm, model::LeadTier::kCool};

std::set<model::Channel> DistinctChannels(const LeadSequence& sequence) {
  std::set<model::Channel> channels;
  for (const auto* touch : sequence.touches) channels.insert(touch->channel);
  return channels;
}

void AppendChannelRates(const std::map<model::Channel, RateCounter>& counters, double baseline,
                        google::protobuf::RepeatedPtrField<v1::ChannelRate>* out) {
  for (const auto& [channel, counter] : counters) {
    if (counter.total < HowDetector::kMinChannelSample) continue;
    auto* rate = out->Add();
    rate->set_channel(model::ToProto(channel));
    rate->set_conversion_rate(counter.Rate());
    rate->set_lift(Lift(counter.Rate(), baseline));
    rate->set_sample_size(counter.total);
  }
}

} // namespace

model::ChannelSequenceKey HowDetector::SequenceKey(const LeadSequence& sequence) {
  model::ChannelSequenceKey key{};
  for (std::size_t i = 0; i < key.size() && i < sequence.touches.size(); ++i) {
    key[i] = sequence.touches[i]->channel;
  }
  return key;
}

DetectionResult HowDetector::Detect(const TenantDataset& dataset) const {
  const auto sequences = BuildSequences(dataset);

  RateCounter overall;
  for (const auto& sequence : sequences) overall.Add(sequence.Converted());

  DetectionResult result;
  result.type        = model::PatternType::kHow;
  result.sample_size = overall.total;

  auto* how = result.payload.mutable_how();

  if (overall.converted < kMinConverted || overall.total < kMinTotal) {
    result.sufficient = false;
    result.confidence = 0.0;
    return result;
  }

  const double baseline = overall.Rate();

  // booking channel distribution
  std::map<model::Channel, uint32_t> bookings;
  uint32_t                           booking_total = 0;
  for (const auto& touch : dataset.touches) {
    if (!touch.led_to_booking) continue;
    ++bookings[touch.channel];
    ++booking_total;
  }
  for (const auto& [channel, count] : bookings) {
    auto* share = how->add_booking_channel_distribution();
    share->set_channel(model::ToProto(channel));
    share->set_count(count);
    share->set_share(static_cast<double>(count) / static_cast<double>(booking_total));
  }

  std::map<model::Channel, RateCounter>                                first_touch;
  std::array<RateCounter, kChannelCountBuckets>                        channel_counts{};
  std::map<model::ChannelSequenceKey, RateCounter>                     by_sequence;
  std::map<model::LeadTier, RateCounter>                               tier_baselines;
  std::map<model::LeadTier, std::map<model::Channel, RateCounter>>     tier_channels;
  std::map<std::pair<model::Channel, model::Channel>, uint32_t>        transitions;
  std::map<model::Channel, uint32_t>                                   outgoing;

  for (const auto& sequence : sequences) {
    const bool converted = sequence.Converted();
    const auto channels  = DistinctChannels(sequence);

    first_touch[sequence.touches.front()->channel].Add(converted);
    channel_counts[std::min(channels.size(), kChannelCountBuckets) - 1].Add(converted);
    by_sequence[SequenceKey(sequence)].Add(converted);

    const auto tier = model::TierForScore(sequence.lead->score);
    if (tier != model::LeadTier::kCold) {
      tier_baselines[tier].Add(converted);
      for (const auto channel : channels) tier_channels[tier][channel].Add(converted);
    }

    if (converted) {
      for (std::size_t i = 0; i + 1 < sequence.touches.size(); ++i) {
        const auto from = sequence.touches[i]->channel;
        ++transitions[{from, sequence.touches[i + 1]->channel}];
        ++outgoing[from];
      }
    }
  }

  // first-touch effectiveness
  AppendChannelRates(first_touch, baseline, how->mutable_first_touch_effectiveness());
  const v1::ChannelRate* best = nullptr;
  for (const auto& rate : how->first_touch_effectiveness()) {
    if (best == nullptr || rate.conversion_rate() > best->conversion_rate() ||
        (rate.conversion_rate() == best->conversion_rate() && rate.sample_size() > best->sample_size())) {
      best = &rate;
    }
  }
  how->set_best_first_channel(best == nullptr ? v1::CHANNEL_UNSPECIFIED : best->channel());

  // multi-channel lift against single-channel sequences
  const double single_rate = channel_counts[0].total == 0 ? 0.0 : channel_counts[0].Rate();
  double       best_rate   = -1.0;
  std::string  optimal;
  for (std::size_t i = 0; i < channel_counts.size(); ++i) {
    const auto& counter = channel_counts[i];
    if (counter.total == 0) continue;

    auto* lift = how->add_multi_channel_lift();
    lift->set_bucket(kCountBucketLabels[i]);
    lift->set_conversion_rate(counter.Rate());
    lift->set_lift(Lift(counter.Rate(), single_rate));
    lift->set_sample_size(counter.total);

    if (counter.total >= kMinChannelSample && counter.Rate() > best_rate) {
      best_rate = counter.Rate();
      optimal   = kCountBucketLabels[i];
    }
  }
  how->set_optimal_channel_count(optimal);

  // winning sequences
  std::vector<std::pair<model::ChannelSequenceKey, RateCounter>> groups;
  for (const auto& [key, counter] : by_sequence) {
    if (counter.total >= kMinSequenceSample) groups.emplace_back(key, counter);
  }
  std::sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) {
    if (a.second.Rate() != b.second.Rate()) return a.second.Rate() > b.second.Rate();
    if (a.second.total != b.second.total) return a.second.total > b.second.total;
    return a.first < b.first;
  });
  if (groups.size() > kTopSequences) groups.resize(kTopSequences);
  for (const auto& [key, counter] : groups) {
    auto* sequence = how->add_winning_sequences();
    for (const auto& slot : key) sequence->add_steps(model::ToProto(slot));
    sequence->set_conversion_rate(counter.Rate());
    sequence->set_sample_size(counter.total);
    sequence->set_converted(counter.converted);
  }

  // channel effectiveness by tier
  for (const auto tier : kReportedTiers) {
    auto it = tier_baselines.find(tier);
    if (it == tier_baselines.end()) continue;

    auto* effectiveness = how->add_channel_effectiveness_by_tier();
    effectiveness->set_tier(std::string(model::ToString(tier)));
    effectiveness->set_baseline_rate(it->second.Rate());
    effectiveness->set_sample_size(it->second.total);
    AppendChannelRates(tier_channels[tier], it->second.Rate(), effectiveness->mutable_channels());
  }

  // transition matrix over converted sequences
  for (const auto& [edge, count] : transitions) {
    const uint32_t total = outgoing[edge.first];
    if (total < kMinOutgoing) continue;

    auto* transition = how->add_channel_transitions();
    transition->set_from_channel(model::ToProto(edge.first));
    transition->set_to_channel(model::ToProto(edge.second));
    transition->set_probability(static_cast<double>(count) / static_cast<double>(total));
    transition->set_count(count);
  }

  result.sufficient = true;
  result.confidence = SampleConfidence(overall.converted);
  return result;
}

} // namespace convintel::detectors
