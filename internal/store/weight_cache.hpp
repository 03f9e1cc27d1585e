#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/lead.hpp"
#include "internal/util/time.hpp"

namespace convintel::store {

/*
  WeightCache

  Read side of the learned scoring weights consumed by the lead scorer.
  Only PatternStore writes the table. Absent, expired or out-of-bounds
  entries fall back to the default weights so scoring never blocks on
  learning.
*/
class WeightCache {
 public:
  WeightCache(std::shared_ptr<db::Repository> repository, double sum_tolerance);

  model::ScoringWeights GetWeightsForScoring(const std::string& tenant_id, util::TimePoint now) const;

  // Raw entry, expired or not.
  std::optional<db::model::WeightCacheRecord> GetEntry(const std::string& tenant_id) const;

 private:
  std::shared_ptr<db::Repository> repository_;
  double                          sum_tolerance_;
};

} // namespace convintel::store
