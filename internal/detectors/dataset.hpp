#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace convintel::detectors {

/*
  TenantDataset

  One consistent read of a tenant's outcome data over the lookback window.
  The orchestrator loads it once per tenant and hands the same snapshot to
  all four detectors, which only read it.

  Ordering is inherited from the repository contract: leads by id,
  touches by (lead_id, sent_at_ms, id).
*/

struct TenantDataset {
  std::string tenant_id;
  uint64_t    as_of_ms = 0;

  std::vector<db::model::LeadRecord>  leads;
  std::vector<db::model::TouchRecord> touches;
};

TenantDataset LoadDataset(db::Repository& repository, const std::string& tenant_id, uint64_t now_ms, uint32_t lookback_days);

// Touch history of one lead with a terminal status, in send order.
struct LeadSequence {
  const db::model::LeadRecord*                lead = nullptr;
  std::vector<const db::model::TouchRecord*> touches;

  bool Converted() const;
};

// Terminal leads that have at least one touch, ordered by lead id.
// Active leads are excluded from both pools.
std::vector<LeadSequence> BuildSequences(const TenantDataset& dataset);

} // namespace convintel::detectors
