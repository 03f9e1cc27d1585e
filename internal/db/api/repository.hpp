#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/lead_record.hpp"
#include "internal/db/model/pattern_record.hpp"
#include "internal/db/model/tenant_record.hpp"
#include "internal/db/model/touch_record.hpp"
#include "internal/db/model/weight_cache_record.hpp"

namespace convintel::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - List operations return rows in a stable order so that learning runs
    over identical data produce identical payloads

  The DB is the source of truth for:
    tenants, leads, touches (outcome data, written by the product)
    current patterns, pattern history, weight cache (written by learning)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tenants
  // ---------------------------------------------------------------------

  virtual Result UpsertTenant(Transaction&, const model::TenantRecord&) = 0;

  virtual std::optional<model::TenantRecord> GetTenant(Transaction&, const std::string& tenant_id) = 0;

  // Ordered by id.
  virtual std::vector<model::TenantRecord> ListTenants(Transaction&) = 0;

  // Leads of the tenant with status converted and converted_at >= since_ms.
  virtual uint64_t CountConversionsSince(Transaction&, const std::string& tenant_id, uint64_t since_ms) = 0;

  // ---------------------------------------------------------------------
  // Leads
  // ---------------------------------------------------------------------

  virtual Result UpsertLead(Transaction&, const model::LeadRecord&) = 0;

  virtual std::optional<model::LeadRecord> GetLead(Transaction&, const std::string& tenant_id, const std::string& lead_id) = 0;

  // Leads created at or after since_ms, ordered by id.
  virtual std::vector<model::LeadRecord> ListLeads(Transaction&, const std::string& tenant_id, uint64_t since_ms) = 0;

  virtual Result UpdateLeadScoreSnapshot(Transaction&, const std::string& tenant_id, const std::string& lead_id,
                                         const convintel::model::ComponentScores& components,
                                         const convintel::model::ScoringWeights& weights, double score,
                                         uint64_t scored_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Touches
  // ---------------------------------------------------------------------

  virtual Result InsertTouch(Transaction&, const model::TouchRecord&) = 0;

  // Touches sent at or after since_ms, ordered by (lead_id, sent_at_ms, id).
  virtual std::vector<model::TouchRecord> ListTouches(Transaction&, const std::string& tenant_id, uint64_t since_ms) = 0;

  virtual Result UpdateTouchSnapshot(Transaction&, const std::string& tenant_id, const std::string& touch_id,
                                     const std::string& snapshot_json) = 0;

  // AlreadyExists when another touch of the same lead is flagged.
  virtual Result SetLedToBooking(Transaction&, const std::string& tenant_id, const std::string& touch_id) = 0;

  // ---------------------------------------------------------------------
  // Patterns (current snapshot)
  // ---------------------------------------------------------------------

  virtual std::optional<model::PatternRecord> GetPattern(Transaction&, const std::string& tenant_id,
                                                         convintel::model::PatternType type) = 0;

  // Ordered by pattern type.
  virtual std::vector<model::PatternRecord> ListPatterns(Transaction&, const std::string& tenant_id) = 0;

  // Ordered by (tenant_id, pattern type).
  virtual std::vector<model::PatternRecord> ListAllPatterns(Transaction&) = 0;

  virtual Result UpsertPattern(Transaction&, const model::PatternRecord&) = 0;

  virtual Result DeletePattern(Transaction&, const std::string& tenant_id, convintel::model::PatternType type) = 0;

  // ---------------------------------------------------------------------
  // Pattern history (insert-only)
  // ---------------------------------------------------------------------

  // Assigns record.history_id.
  virtual Result AppendPatternHistory(Transaction&, model::PatternHistoryRecord& record) = 0;

  // Newest first; limit 0 = unlimited.
  virtual std::vector<model::PatternHistoryRecord> ListPatternHistory(Transaction&, const std::string& tenant_id,
                                                                      convintel::model::PatternType type,
                                                                      uint32_t limit) = 0;

  // ---------------------------------------------------------------------
  // Weight cache
  // ---------------------------------------------------------------------

  virtual Result UpsertWeightCache(Transaction&, const model::WeightCacheRecord&) = 0;

  virtual std::optional<model::WeightCacheRecord> GetWeightCache(Transaction&, const std::string& tenant_id) = 0;
};

} // namespace convintel::db
