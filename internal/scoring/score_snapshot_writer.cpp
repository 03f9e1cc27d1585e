#include "score_snapshot_writer.hpp"

#include "internal/util/errors.hpp"

namespace convintel::scoring {

ScoreSnapshotWriter::ScoreSnapshotWriter(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void ScoreSnapshotWriter::Record(const std::string& tenant_id, const std::string& lead_id, const model::ComponentScores& components,
                                 const model::ScoringWeights& weights, double score, util::TimePoint scored_at) {
  auto tx = repository_->Begin();
  Record(*repository_, *tx, tenant_id, lead_id, components, weights, score, scored_at);
  tx->Commit();
}

void ScoreSnapshotWriter::Record(db::Repository& repository, db::Transaction& tx, const std::string& tenant_id,
                                 const std::string& lead_id, const model::ComponentScores& components,
                                 const model::ScoringWeights& weights, double score, util::TimePoint scored_at) {
  if (score < 0.0 || score > 100.0) {
    throw util::InvalidArgument("score must be within [0,100]");
  }
  const auto result = repository.UpdateLeadScoreSnapshot(tx, tenant_id, lead_id, components, weights, score, util::ToUnixMillis(scored_at));
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound("lead not found: " + tenant_id + "/" + lead_id);
  }
  if (!result) {
    throw util::StoreWriteFailure("score snapshot write failed: " + result.message);
  }
}

} // namespace convintel::scoring
