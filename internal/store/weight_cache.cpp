#include "weight_cache.hpp"

#include "internal/observability/logging.hpp"

namespace convintel::store {

WeightCache::WeightCache(std::shared_ptr<db::Repository> repository, double sum_tolerance)
    : repository_(std::move(repository)), sum_tolerance_(sum_tolerance) {
}

std::optional<db::model::WeightCacheRecord> WeightCache::GetEntry(const std::string& tenant_id) const {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetWeightCache(*tx, tenant_id);
  tx->Commit();
  return entry;
}

model::ScoringWeights WeightCache::GetWeightsForScoring(const std::string& tenant_id, util::TimePoint now) const {
  const auto entry = GetEntry(tenant_id);
  if (!entry) {
    return model::DefaultWeights();
  }
  if (entry->valid_until_ms <= util::ToUnixMillis(now)) {
    CONVINTEL_LOG_DEBUG("Learned weights expired; using defaults", {observability::StringField("tenant", tenant_id)});
    return model::DefaultWeights();
  }
  if (!model::WeightsWithinBounds(entry->weights, sum_tolerance_)) {
    CONVINTEL_LOG_WARN("Learned weights out of bounds; using defaults", {observability::StringField("tenant", tenant_id),
                                                                         observability::DoubleField("sum", entry->weights.Sum())});
    return model::DefaultWeights();
  }
  return entry->weights;
}

} // namespace convintel::store
