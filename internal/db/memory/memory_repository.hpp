#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace convintel::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertTenant(Transaction&, const model::TenantRecord&) override;
  std::optional<model::TenantRecord> GetTenant(Transaction&, const std::string&) override;
  std::vector<model::TenantRecord>   ListTenants(Transaction&) override;
  uint64_t                           CountConversionsSince(Transaction&, const std::string&, uint64_t) override;

  Result                           UpsertLead(Transaction&, const model::LeadRecord&) override;
  std::optional<model::LeadRecord> GetLead(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::LeadRecord>   ListLeads(Transaction&, const std::string&, uint64_t) override;
  Result UpdateLeadScoreSnapshot(Transaction&, const std::string&, const std::string&, const convintel::model::ComponentScores&,
                                 const convintel::model::ScoringWeights&, double, uint64_t) override;

  Result                          InsertTouch(Transaction&, const model::TouchRecord&) override;
  std::vector<model::TouchRecord> ListTouches(Transaction&, const std::string&, uint64_t) override;
  Result UpdateTouchSnapshot(Transaction&, const std::string&, const std::string&, const std::string&) override;
  Result SetLedToBooking(Transaction&, const std::string&, const std::string&) override;

  std::optional<model::PatternRecord> GetPattern(Transaction&, const std::string&, convintel::model::PatternType) override;
  std::vector<model::PatternRecord>   ListPatterns(Transaction&, const std::string&) override;
  std::vector<model::PatternRecord>   ListAllPatterns(Transaction&) override;
  Result                              UpsertPattern(Transaction&, const model::PatternRecord&) override;
  Result                              DeletePattern(Transaction&, const std::string&, convintel::model::PatternType) override;

  Result                                   AppendPatternHistory(Transaction&, model::PatternHistoryRecord&) override;
  std::vector<model::PatternHistoryRecord> ListPatternHistory(Transaction&, const std::string&, convintel::model::PatternType,
                                                              uint32_t) override;

  Result                                  UpsertWeightCache(Transaction&, const model::WeightCacheRecord&) override;
  std::optional<model::WeightCacheRecord> GetWeightCache(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  using TenantKey  = std::pair<std::string, std::string>;                   // (tenant, id)
  using PatternKey = std::pair<std::string, convintel::model::PatternType>; // (tenant, type)

  // Ordered maps give the stable iteration order the interface promises.
  struct State {
    std::map<std::string, model::TenantRecord>      tenants;
    std::map<TenantKey, model::LeadRecord>          leads;
    std::map<TenantKey, model::TouchRecord>         touches;
    std::map<PatternKey, model::PatternRecord>      patterns;
    std::vector<model::PatternHistoryRecord>        history;
    std::map<std::string, model::WeightCacheRecord> weight_cache;
    uint64_t                                        next_history_id = 1;
  };

  // held by a MemoryTransaction for its whole lifetime
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace convintel::db::memory
