#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace convintel::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace convintel::db::postgres
