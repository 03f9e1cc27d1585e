#include "dataset.hpp"

#include <map>

#include "internal/util/time.hpp"

namespace convintel::detectors {

TenantDataset LoadDataset(db::Repository& repository, const std::string& tenant_id, uint64_t now_ms, uint32_t lookback_days) {
  const uint64_t window   = util::DaysToMillis(lookback_days);
  const uint64_t since_ms = now_ms > window ? now_ms - window : 0;

  TenantDataset dataset;
  dataset.tenant_id = tenant_id;
  dataset.as_of_ms  = now_ms;

  auto tx         = repository.Begin();
  dataset.leads   = repository.ListLeads(*tx, tenant_id, since_ms);
  dataset.touches = repository.ListTouches(*tx, tenant_id, since_ms);
  tx->Commit();

  return dataset;
}

bool LeadSequence::Converted() const {
  return lead != nullptr && lead->status == model::LeadStatus::kConverted;
}

std::vector<LeadSequence> BuildSequences(const TenantDataset& dataset) {
  std::map<std::string, std::vector<const db::model::TouchRecord*>> by_lead;
  for (const auto& touch : dataset.touches) {
    by_lead[touch.lead_id].push_back(&touch);
  }

  std::vector<LeadSequence> sequences;
  for (const auto& lead : dataset.leads) {
    if (!model::IsTerminal(lead.status)) continue;

    auto it = by_lead.find(lead.id);
    if (it == by_lead.end() || it->second.empty()) continue;

    sequences.push_back({&lead, it->second});
  }
  return sequences;
}

} // namespace convintel::detectors
