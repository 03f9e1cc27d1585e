#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/lead.hpp"
#include "internal/util/time.hpp"

namespace convintel::scoring {

/*
  Write-back of the scorer's component snapshot onto the lead row.

  The WHO optimizer learns from these snapshots, so every scoring pass
  in the product should call Record().
*/

class ScoreSnapshotWriter {
 public:
  explicit ScoreSnapshotWriter(std::shared_ptr<db::Repository> repository);

  // Throws util::NotFound for an unknown lead, util::StoreWriteFailure otherwise.
  void Record(const std::string& tenant_id, const std::string& lead_id, const model::ComponentScores& components,
              const model::ScoringWeights& weights, double score, util::TimePoint scored_at);

  // Same, inside a caller-owned transaction.
  static void Record(db::Repository& repository, db::Transaction& tx, const std::string& tenant_id, const std::string& lead_id,
                     const model::ComponentScores& components, const model::ScoringWeights& weights, double score,
                     util::TimePoint scored_at);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace convintel::scoring
