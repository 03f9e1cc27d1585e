#include "when_detector.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "internal/detectors/stats.hpp"
#include "internal/util/time.hpp"

namespace convintel::detectors {

namespace {

constexpr std::array<const char*, 7> kDayNames = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};

std::string HourLabel(std::size_t hour) {
  std::string label = std::to_string(hour);
  if (label.size() < 2) label.insert(0, "0");
  return label + ":00";
}

std::string GapName(std::size_t pair) {
  return "touch_" + std::to_string(pair + 1) + "_to_" + std::to_string(pair + 2);
}

template <std::size_t N, typename LabelFn>
void AppendBestBuckets(const std::array<RateCounter, N>& buckets, double baseline, LabelFn label,
                       google::protobuf::RepeatedPtrField<v1::TimeBucket>* out) {
  std::vector<std::size_t> eligible;
  for (std::size_t i = 0; i < N; ++i) {
    if (buckets[i].total >= WhenDetector::kMinBucketSample) eligible.push_back(i);
  }

  std::sort(eligible.begin(), eligible.end(), [&](std::size_t a, std::size_t b) {
    if (buckets[a].Rate() != buckets[b].Rate()) return buckets[a].Rate() > buckets[b].Rate();
    if (buckets[a].total != buckets[b].total) return buckets[a].total > buckets[b].total;
    return a < b;
  });
  if (eligible.size() > WhenDetector::kTopBuckets) eligible.resize(WhenDetector::kTopBuckets);

  for (std::size_t i : eligible) {
    auto* bucket = out->Add();
    bucket->set_label(label(i));
    bucket->set_index(static_cast<uint32_t>(i));
    bucket->set_conversion_rate(buckets[i].Rate());
    bucket->set_lift(Lift(buckets[i].Rate(), baseline));
    bucket->set_sample_size(buckets[i].total);
  }
}

void AppendDefaultGaps(v1::WhenPayload* when) {
  for (std::size_t i = 0; i < WhenDetector::kDefaultGaps.size(); ++i) {
    auto* gap = when->add_optimal_sequence_gaps();
    gap->set_transition(GapName(i));
    gap->set_days(WhenDetector::kDefaultGaps[i]);
    gap->set_sample_size(0);
  }
}

} // namespace

uint32_t WhenDetector::AggregateGap(const std::vector<uint64_t>& gaps_ms) {
  std::vector<uint32_t> days;
  days.reserve(gaps_ms.size());
  for (uint64_t gap : gaps_ms) {
    const auto whole = static_cast<uint32_t>(std::min<uint64_t>(gap / util::kMillisPerDay, kMaxGapDays));
    days.push_back(std::clamp(whole, kMinGapDays, kMaxGapDays));
  }
  return UpperMedian(std::move(days));
}

DetectionResult WhenDetector::Detect(const TenantDataset& dataset) const {
  RateCounter overall;
  for (const auto& touch : dataset.touches) overall.Add(touch.led_to_booking);

  DetectionResult result;
  result.type        = model::PatternType::kWhen;
  result.sample_size = overall.total;

  auto* when = result.payload.mutable_when();

  if (overall.converted < kMinConverting || overall.total < kMinTotal) {
    result.sufficient = false;
    result.confidence = 0.0;
    AppendDefaultGaps(when);
    return result;
  }

  const double baseline = overall.Rate();

  std::array<RateCounter, 7>  days{};
  std::array<RateCounter, 24> hours{};
  std::map<uint32_t, uint32_t> converting_positions;
  double                       position_sum   = 0.0;
  uint32_t                     position_count = 0;

  for (const auto& touch : dataset.touches) {
    days[util::DayOfWeekUtc(touch.sent_at_ms)].Add(touch.led_to_booking);
    hours[util::HourOfDayUtc(touch.sent_at_ms)].Add(touch.led_to_booking);
    if (touch.led_to_booking && touch.touch_number >= 1 && touch.touch_number <= kMaxTouchPosition) {
      ++converting_positions[touch.touch_number];
      position_sum += touch.touch_number;
      ++position_count;
    }
  }

  AppendBestBuckets(days, baseline, [](std::size_t i) { return std::string(kDayNames[i]); }, when->mutable_best_days());
  AppendBestBuckets(hours, baseline, HourLabel, when->mutable_best_hours());

  const uint32_t max_position = converting_positions.empty() ? 0 : converting_positions.rbegin()->first;
  uint32_t       peak         = 0;
  uint32_t       peak_count   = 0;
  for (uint32_t n = 1; n <= max_position; ++n) {
    auto           it    = converting_positions.find(n);
    const uint32_t count = it == converting_positions.end() ? 0 : it->second;

    auto* share = when->add_converting_touch_distribution();
    share->set_name("touch_" + std::to_string(n));
    share->set_value(static_cast<double>(count) / static_cast<double>(overall.converted));

    if (count > peak_count) {
      peak       = n;
      peak_count = count;
    }
  }
  when->set_peak_converting_touch(peak);
  when->set_avg_touches_to_convert(position_count == 0 ? 0.0 : position_sum / static_cast<double>(position_count));

  std::array<std::vector<uint64_t>, kGapPairs> gaps;
  std::vector<double>                          timing_days;
  for (const auto& sequence : BuildSequences(dataset)) {
    if (!sequence.Converted()) continue;
    const auto& touches = sequence.touches;

    for (std::size_t i = 0; i + 1 < touches.size() && i < kGapPairs; ++i) {
      const uint64_t from = touches[i]->sent_at_ms;
      const uint64_t to   = touches[i + 1]->sent_at_ms;
      gaps[i].push_back(to > from ? to - from : 0);
    }

    const uint64_t first = touches.front()->sent_at_ms;
    const uint64_t last  = touches.back()->sent_at_ms;
    const double   span  = static_cast<double>(last > first ? last - first : 0) / static_cast<double>(util::kMillisPerDay);
    timing_days.push_back(std::clamp(span, 0.0, kMaxTimingDays));
  }

  for (std::size_t i = 0; i < kGapPairs; ++i) {
    if (gaps[i].empty() && i >= kDefaultGaps.size()) continue;

    auto* gap = when->add_optimal_sequence_gaps();
    gap->set_transition(GapName(i));
    gap->set_days(gaps[i].empty() ? kDefaultGaps[i] : AggregateGap(gaps[i]));
    gap->set_sample_size(static_cast<uint32_t>(gaps[i].size()));
  }

  auto* timing = when->mutable_conversion_timing();
  std::sort(timing_days.begin(), timing_days.end());
  timing->set_avg_days(Mean(timing_days));
  timing->set_median_days(UpperMedian(timing_days));
  timing->set_p50(NearestRankPercentile(timing_days, 50.0));
  timing->set_p80(NearestRankPercentile(timing_days, 80.0));
  timing->set_p95(NearestRankPercentile(timing_days, 95.0));
  timing->set_sample_size(static_cast<uint32_t>(timing_days.size()));

  result.sufficient = true;
  result.confidence = SampleConfidence(overall.converted);
  return result;
}

} // namespace convintel::detectors
