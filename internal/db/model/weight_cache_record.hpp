#pragma once

#include <cstdint>
#include <string>

#include "internal/model/lead.hpp"

namespace convintel::db::model {

struct WeightCacheRecord {
  std::string tenant_id;

  convintel::model::ScoringWeights weights;

  uint32_t sample_count = 0;

  uint64_t updated_at_ms  = 0;
  uint64_t valid_until_ms = 0;
};

} // namespace convintel::db::model
