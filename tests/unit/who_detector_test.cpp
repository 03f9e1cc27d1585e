#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/config/settings.hpp"
#include "internal/detectors/stats.hpp"
#include "internal/detectors/who_detector.hpp"

namespace {

using convintel::db::model::LeadRecord;
using convintel::detectors::TenantDataset;
using convintel::detectors::WhoDetector;
using convintel::model::LeadStatus;

bool Near(double a, double b) {
  return std::abs(a - b) < 1e-9;
}

std::string LeadId(int i) {
  return (i < 10 ? "lead-0" : "lead-") + std::to_string(i);
}

/*
  40 terminal leads, 16 converted (baseline 0.4):
    CEO       leads 0-11 and 16-19   12 of 16 converted
    Sales Rep the rest               4 of 24 converted
    16-30 employees for converted leads, 101-250 otherwise
    hiring on leads 0-9 and 30-34
  plus 5 active leads that must be ignored.
*/
TenantDataset MixedDataset(int converted_count = 16) {
  TenantDataset dataset;
  dataset.tenant_id = "tenant-who";

  for (int i = 0; i < 40; ++i) {
    LeadRecord lead;
    lead.id             = LeadId(i);
    lead.tenant_id      = dataset.tenant_id;
    lead.title          = (i < 12 || (i >= 16 && i < 20)) ? "CEO" : "Sales Rep";
    lead.industry       = "Dental";
    lead.employee_count = i < 16 ? 20 : 200;
    lead.hiring         = i < 10 || (i >= 30 && i < 35);
    lead.status         = i < converted_count ? LeadStatus::kConverted : LeadStatus::kNotInterested;
    dataset.leads.push_back(lead);
  }
  for (int i = 0; i < 5; ++i) {
    LeadRecord lead;
    lead.id        = "lead-active-" + std::to_string(i);
    lead.tenant_id = dataset.tenant_id;
    lead.title     = "CEO";
    lead.status    = LeadStatus::kActive;
    dataset.leads.push_back(lead);
  }
  return dataset;
}

void TestRankingsSizesAndSignals() {
  WhoDetector detector(convintel::config::DetectorSettings{});
  const auto  result = detector.Detect(MixedDataset());

  assert(result.type == convintel::model::PatternType::kWho);
  assert(result.sufficient);
  assert(result.sample_size == 40);
  assert(Near(result.confidence, convintel::detectors::SampleConfidence(16)));

  const auto& who = result.payload.who();
  assert(Near(who.baseline_conversion_rate(), 0.4));
  assert(who.converted_count() == 16);

  assert(who.title_rankings_size() == 2);
  assert(who.title_rankings(0).value() == "ceo");
  assert(Near(who.title_rankings(0).conversion_rate(), 0.75));
  assert(Near(who.title_rankings(0).lift(), 0.75 / 0.4));
  assert(who.title_rankings(0).sample_size() == 16);
  assert(who.title_rankings(1).value() == "Sales Rep");

  assert(who.industry_rankings_size() == 1);
  assert(Near(who.industry_rankings(0).lift(), 1.0));

  assert(who.size_analysis().sweet_spot() == "16-30");
  assert(who.size_analysis().distribution_size() == 2);
  assert(who.size_analysis().distribution(0).bucket() == "16-30");
  assert(who.size_analysis().distribution(1).bucket() == "101-250");

  // hiring: 10 of 15 flagged converted, 6 of 25 unflagged
  assert(Near(who.timing_signals().hiring_lift(), (10.0 / 15.0) / (6.0 / 25.0)));
  // nobody flagged new_role or funded
  assert(who.timing_signals().new_role_lift() == 1.0);
  assert(who.timing_signals().funded_lift() == 1.0);

  // no component snapshots, so the optimizer has nothing to fit
  assert(who.optimizer_status() == "insufficient_rows");
  assert(Near(who.recommended_weights().authority(), 0.25));
}

void TestBelowFloorsEmitsSentinel() {
  WhoDetector detector(convintel::config::DetectorSettings{});
  const auto  result = detector.Detect(MixedDataset(9));

  assert(!result.sufficient);
  assert(result.confidence == 0.0);
  assert(result.sample_size == 40);

  const auto& who = result.payload.who();
  assert(who.optimizer_status() == "insufficient_data");
  assert(who.converted_count() == 9);
  assert(Near(who.baseline_conversion_rate(), 9.0 / 40.0));
  assert(who.title_rankings_size() == 0);
  assert(Near(who.recommended_weights().data_quality(), 0.20));
  assert(Near(who.recommended_weights().timing(), 0.15));
}

void TestLearnsWeightsFromComponentSnapshots() {
  auto dataset = MixedDataset();
  int  i       = 0;
  for (auto& lead : dataset.leads) {
    if (lead.status == LeadStatus::kActive) continue;
    const bool converted = lead.status == LeadStatus::kConverted;
    lead.components = convintel::model::ComponentScores{
        .data_quality = 4.0 + (i % 5) * 3.0,
        .authority    = converted ? 20.0 + (i % 3) : 4.0 + (i % 4),
        .company_fit  = 10.0 + (i % 7) * 2.0,
        .timing       = (i % 4) * 4.0,
    };
    ++i;
  }

  WhoDetector detector(convintel::config::DetectorSettings{});
  const auto  who = detector.Detect(dataset).payload.who();

  assert(who.optimizer_status() == "converged");
  const auto& w   = who.recommended_weights();
  const double sum = w.data_quality() + w.authority() + w.company_fit() + w.timing();
  assert(Near(sum, 0.85));
  assert(w.authority() > w.timing());
  assert(w.authority() > w.data_quality());
}

void TestRerunIsByteIdentical() {
  WhoDetector detector(convintel::config::DetectorSettings{});
  const auto  dataset = MixedDataset();
  assert(detector.Detect(dataset).payload.SerializeAsString() == detector.Detect(dataset).payload.SerializeAsString());
}

} // namespace

int main() {
  TestRankingsSizesAndSignals();
  TestBelowFloorsEmitsSentinel();
  TestLearnsWeightsFromComponentSnapshots();
  TestRerunIsByteIdentical();

  std::cout << "convintel_unit_who_detector: pass\n";
  return 0;
}
