#pragma once

#include <cstdint>
#include <string>

#include "internal/model/pattern_type.hpp"

namespace convintel::db::model {

/*
  Current pattern row; one per (tenant_id, pattern_type).

  payload_json is the canonical JSON of convintel.v1.PatternPayload.
  version increases by one on every supersede.
*/

struct PatternRecord {
  std::string tenant_id;

  convintel::model::PatternType pattern_type = convintel::model::PatternType::kWho;

  uint64_t version = 0;

  std::string payload_json;

  uint32_t sample_size = 0;
  double   confidence  = 0.0;

  uint64_t computed_at_ms = 0;
  uint64_t valid_until_ms = 0;
};

// Insert-only audit row.
struct PatternHistoryRecord {
  uint64_t history_id = 0; // assigned by the repository

  PatternRecord pattern;

  // true when the row was moved here by expiry archival
  bool archived = false;

  uint64_t recorded_at_ms = 0;
};

} // namespace convintel::db::model
