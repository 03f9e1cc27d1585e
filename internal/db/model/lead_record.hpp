#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/lead.hpp"

namespace convintel::db::model {

/*
  Lead row as the scoring service writes it.

  components/weights_used are the scorer's snapshot at scored_at; leads
  scored before snapshots existed carry neither until backfill rebuilds them.
*/

struct LeadRecord {
  std::string id;
  std::string tenant_id;

  std::string first_name;
  std::string company;
  std::string title;
  std::string industry;
  std::string country;
  uint32_t    employee_count = 0; // 0 = unknown

  // timing signals
  bool new_role = false;
  bool hiring   = false;
  bool funded   = false;

  // contact data quality
  bool has_email          = false;
  bool email_verified     = false;
  bool has_phone          = false;
  bool phone_verified     = false;
  bool has_linkedin       = false;
  bool has_personal_email = false;

  convintel::model::LeadStatus status = convintel::model::LeadStatus::kActive;

  double score = 0.0; // 0-100

  std::optional<convintel::model::ComponentScores> components;
  std::optional<convintel::model::ScoringWeights>  weights_used;

  uint64_t scored_at_ms    = 0;
  uint64_t created_at_ms   = 0;
  uint64_t converted_at_ms = 0; // 0 = not converted
};

} // namespace convintel::db::model
