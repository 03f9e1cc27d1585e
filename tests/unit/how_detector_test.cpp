#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/detectors/how_detector.hpp"
#include "internal/detectors/stats.hpp"

namespace {

using convintel::db::model::LeadRecord;
using convintel::db::model::TouchRecord;
using convintel::detectors::HowDetector;
using convintel::detectors::TenantDataset;
using convintel::model::Channel;
using convintel::model::LeadStatus;

constexpr uint64_t kBase  = 1704067200000ULL;
constexpr uint64_t kDayMs = 24ULL * 3600ULL * 1000ULL;

bool Near(double a, double b) {
  return std::abs(a - b) < 1e-9;
}

int g_next_lead = 0;

void AddLead(TenantDataset& dataset, const std::vector<Channel>& channels, bool converted, double score,
             LeadStatus failed_status = LeadStatus::kNotInterested) {
  LeadRecord lead;
  lead.id        = "lead-" + std::to_string(1000 + g_next_lead++);
  lead.tenant_id = dataset.tenant_id;
  lead.status    = converted ? LeadStatus::kConverted : failed_status;
  lead.score     = score;
  dataset.leads.push_back(lead);

  for (std::size_t n = 0; n < channels.size(); ++n) {
    TouchRecord touch;
    touch.id             = lead.id + "-t" + std::to_string(n + 1);
    touch.tenant_id      = dataset.tenant_id;
    touch.lead_id        = lead.id;
    touch.channel        = channels[n];
    touch.touch_number   = static_cast<uint32_t>(n + 1);
    touch.sent_at_ms     = kBase + n * 2 * kDayMs;
    touch.led_to_booking = converted && n + 1 == channels.size();
    dataset.touches.push_back(touch);
  }
}

/*
  hot   email > linkedin > email   5 of 6 converted
  warm  email > email > email      2 of 10
  cool  sms                        1 of 8
  one active lead that must be ignored
*/
TenantDataset ChannelDataset(int hot_converted = 5) {
  TenantDataset dataset;
  dataset.tenant_id = "tenant-how";
  for (int i = 0; i < 6; ++i) AddLead(dataset, {Channel::kEmail, Channel::kLinkedin, Channel::kEmail}, i < hot_converted, 90.0);
  for (int i = 0; i < 10; ++i) AddLead(dataset, {Channel::kEmail, Channel::kEmail, Channel::kEmail}, i < 2, 70.0);
  for (int i = 0; i < 8; ++i) AddLead(dataset, {Channel::kSms}, i < 1, 40.0);

  AddLead(dataset, {Channel::kVoice}, false, 95.0, LeadStatus::kActive);
  return dataset;
}

void TestBookingAndFirstTouch() {
  HowDetector detector;
  const auto  result = detector.Detect(ChannelDataset());

  assert(result.type == convintel::model::PatternType::kHow);
  assert(result.sufficient);
  assert(result.sample_size == 24);
  assert(Near(result.confidence, convintel::detectors::SampleConfidence(8)));

  const auto& how = result.payload.how();
  assert(how.booking_channel_distribution_size() == 2);
  assert(how.booking_channel_distribution(0).channel() == convintel::v1::CHANNEL_EMAIL);
  assert(how.booking_channel_distribution(0).count() == 7);
  assert(Near(how.booking_channel_distribution(0).share(), 7.0 / 8.0));
  assert(how.booking_channel_distribution(1).channel() == convintel::v1::CHANNEL_SMS);

  assert(how.first_touch_effectiveness_size() == 2);
  assert(Near(how.first_touch_effectiveness(0).conversion_rate(), 7.0 / 16.0));
  assert(Near(how.first_touch_effectiveness(0).lift(), (7.0 / 16.0) / (8.0 / 24.0)));
  assert(how.best_first_channel() == convintel::v1::CHANNEL_EMAIL);
}

void TestMultiChannelLift() {
  HowDetector detector;
  const auto  how = detector.Detect(ChannelDataset()).payload.how();

  assert(how.multi_channel_lift_size() == 2);
  assert(how.multi_channel_lift(0).bucket() == "1");
  assert(how.multi_channel_lift(0).sample_size() == 18);
  assert(Near(how.multi_channel_lift(0).lift(), 1.0));
  assert(how.multi_channel_lift(1).bucket() == "2");
  assert(Near(how.multi_channel_lift(1).lift(), (5.0 / 6.0) / (3.0 / 18.0)));
  assert(how.optimal_channel_count() == "2");
}

void TestWinningSequencesArePadded() {
  HowDetector detector;
  const auto  how = detector.Detect(ChannelDataset()).payload.how();

  assert(how.winning_sequences_size() == 3);
  const auto& best = how.winning_sequences(0);
  assert(best.steps_size() == 3);
  assert(best.steps(0) == convintel::v1::CHANNEL_EMAIL);
  assert(best.steps(1) == convintel::v1::CHANNEL_LINKEDIN);
  assert(best.steps(2) == convintel::v1::CHANNEL_EMAIL);
  assert(best.converted() == 5);
  assert(best.sample_size() == 6);

  const auto& sms = how.winning_sequences(2);
  assert(sms.steps(0) == convintel::v1::CHANNEL_SMS);
  assert(sms.steps(1) == convintel::v1::CHANNEL_UNSPECIFIED);
  assert(sms.steps(2) == convintel::v1::CHANNEL_UNSPECIFIED);
}

void TestTiersAndTransitions() {
  HowDetector detector;
  const auto  how = detector.Detect(ChannelDataset()).payload.how();

  assert(how.channel_effectiveness_by_tier_size() == 3);
  assert(how.channel_effectiveness_by_tier(0).tier() == "hot");
  assert(Near(how.channel_effectiveness_by_tier(0).baseline_rate(), 5.0 / 6.0));
  assert(how.channel_effectiveness_by_tier(0).channels_size() == 2);
  assert(how.channel_effectiveness_by_tier(1).tier() == "warm");
  assert(how.channel_effectiveness_by_tier(2).tier() == "cool");
  assert(how.channel_effectiveness_by_tier(2).channels(0).channel() == convintel::v1::CHANNEL_SMS);

  assert(how.channel_transitions_size() == 3);
  const auto& email_email = how.channel_transitions(0);
  assert(email_email.from_channel() == convintel::v1::CHANNEL_EMAIL);
  assert(email_email.to_channel() == convintel::v1::CHANNEL_EMAIL);
  assert(email_email.count() == 4);
  assert(Near(email_email.probability(), 4.0 / 9.0));

  const auto& email_linkedin = how.channel_transitions(1);
  assert(email_linkedin.to_channel() == convintel::v1::CHANNEL_LINKEDIN);
  assert(Near(email_linkedin.probability(), 5.0 / 9.0));

  const auto& linkedin_email = how.channel_transitions(2);
  assert(linkedin_email.from_channel() == convintel::v1::CHANNEL_LINKEDIN);
  assert(Near(linkedin_email.probability(), 1.0));
}

void TestBelowFloorsIsEmpty() {
  HowDetector detector;
  // 1 + 2 + 1 converted
  const auto result = detector.Detect(ChannelDataset(1));
  assert(!result.sufficient);
  assert(result.confidence == 0.0);
  assert(result.payload.has_how());
  assert(result.payload.how().winning_sequences_size() == 0);
}

void TestEqualRateSequencesPreferLargerSample() {
  TenantDataset dataset;
  dataset.tenant_id = "tenant-ties";
  for (int i = 0; i < 6; ++i) AddLead(dataset, {Channel::kLinkedin}, i < 3, 70.0);
  for (int i = 0; i < 10; ++i) AddLead(dataset, {Channel::kVoice}, i < 5, 70.0);
  for (int i = 0; i < 6; ++i) AddLead(dataset, {Channel::kSms}, i < 1, 70.0);

  HowDetector detector;
  const auto  how = detector.Detect(dataset).payload.how();

  assert(how.winning_sequences_size() == 3);
  assert(how.winning_sequences(0).steps(0) == convintel::v1::CHANNEL_VOICE);
  assert(how.winning_sequences(0).sample_size() == 10);
  assert(how.winning_sequences(1).steps(0) == convintel::v1::CHANNEL_LINKEDIN);
  assert(how.winning_sequences(1).sample_size() == 6);
  assert(how.winning_sequences(2).steps(0) == convintel::v1::CHANNEL_SMS);
}

void TestEqualRateAndSampleOrderByKey() {
  TenantDataset dataset;
  dataset.tenant_id = "tenant-ties";
  // inserted in the reverse of the expected order
  for (int i = 0; i < 5; ++i) AddLead(dataset, {Channel::kEmail, Channel::kEmail}, i < 2, 70.0);
  for (int i = 0; i < 5; ++i) AddLead(dataset, {Channel::kEmail}, i < 2, 70.0);
  for (int i = 0; i < 10; ++i) AddLead(dataset, {Channel::kLinkedin}, i < 3, 70.0);

  HowDetector detector;
  const auto  how = detector.Detect(dataset).payload.how();

  assert(how.winning_sequences_size() == 3);
  // an empty slot sorts before any channel
  const auto& single = how.winning_sequences(0);
  assert(single.steps(0) == convintel::v1::CHANNEL_EMAIL);
  assert(single.steps(1) == convintel::v1::CHANNEL_UNSPECIFIED);
  const auto& doubled = how.winning_sequences(1);
  assert(doubled.steps(0) == convintel::v1::CHANNEL_EMAIL);
  assert(doubled.steps(1) == convintel::v1::CHANNEL_EMAIL);
  assert(Near(single.conversion_rate(), doubled.conversion_rate()));
  assert(how.winning_sequences(2).steps(0) == convintel::v1::CHANNEL_LINKEDIN);
}

void TestRerunIsByteIdentical() {
  HowDetector detector;
  const auto  dataset = ChannelDataset();
  const auto  first   = detector.Detect(dataset);
  const auto  second  = detector.Detect(dataset);
  assert(first.payload.SerializeAsString() == second.payload.SerializeAsString());
  assert(first.confidence == second.confidence);
}

void TestSequenceKeyTakesFirstThreeChannels() {
  LeadRecord  lead;
  TouchRecord a, b, c, d;
  a.channel = Channel::kVoice;
  b.channel = Channel::kSms;
  c.channel = Channel::kEmail;
  d.channel = Channel::kLinkedin;

  convintel::detectors::LeadSequence sequence{&lead, {&a, &b, &c, &d}};
  const auto key = HowDetector::SequenceKey(sequence);
  assert(key[0] == Channel::kVoice);
  assert(key[2] == Channel::kEmail);

  convintel::detectors::LeadSequence shorter{&lead, {&a}};
  const auto short_key = HowDetector::SequenceKey(shorter);
  assert(short_key[0] == Channel::kVoice);
  assert(!short_key[1].has_value());
}

} // namespace

int main() {
  TestBookingAndFirstTouch();
  TestMultiChannelLift();
  TestWinningSequencesArePadded();
  TestTiersAndTransitions();
  TestBelowFloorsIsEmpty();
  TestEqualRateSequencesPreferLargerSample();
  TestEqualRateAndSampleOrderByKey();
  TestRerunIsByteIdentical();
  TestSequenceKeyTakesFirstThreeChannels();

  std::cout << "convintel_unit_how_detector: pass\n";
  return 0;
}
