#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace convintel::db::memory {

using convintel::model::PatternType;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------------
// Tenants
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertTenant(Transaction& t, const model::TenantRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "tenant id required");
  TX(t).Mutable().tenants[r.id] = r;
  return Result::Ok();
}

std::optional<model::TenantRecord> MemoryRepository::GetTenant(Transaction& t, const std::string& tenant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tenants.find(tenant_id);
  if (it == s.tenants.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TenantRecord> MemoryRepository::ListTenants(Transaction& t) {
  std::vector<model::TenantRecord> out;
  for (const auto& [_, record] : TX(t).View().tenants) {
    out.push_back(record);
  }
  return out;
}

uint64_t MemoryRepository::CountConversionsSince(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  uint64_t count = 0;
  for (const auto& [key, lead] : TX(t).View().leads) {
    if (key.first == tenant_id && lead.status == convintel::model::LeadStatus::kConverted && lead.converted_at_ms >= since_ms) {
      ++count;
    }
  }
  return count;
}

// ---------------------------------------------------------------------------
// Leads
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertLead(Transaction& t, const model::LeadRecord& r) {
  if (r.id.empty() || r.tenant_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "lead id and tenant required");
  TX(t).Mutable().leads[{r.tenant_id, r.id}] = r;
  return Result::Ok();
}

std::optional<model::LeadRecord> MemoryRepository::GetLead(Transaction& t, const std::string& tenant_id, const std::string& lead_id) {
  const auto& s  = TX(t).View();
  auto        it = s.leads.find({tenant_id, lead_id});
  if (it == s.leads.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LeadRecord> MemoryRepository::ListLeads(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  std::vector<model::LeadRecord> out;
  const auto&                    leads = TX(t).View().leads;
  for (auto it = leads.lower_bound({tenant_id, std::string()}); it != leads.end() && it->first.first == tenant_id; ++it) {
    if (it->second.created_at_ms >= since_ms) out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpdateLeadScoreSnapshot(Transaction& t, const std::string& tenant_id, const std::string& lead_id,
                                                 const convintel::model::ComponentScores& components,
                                                 const convintel::model::ScoringWeights& weights, double score,
                                                 uint64_t scored_at_ms) {
  auto& leads = TX(t).Mutable().leads;
  auto  it    = leads.find({tenant_id, lead_id});
  if (it == leads.end()) return Result::Err(ErrorCode::NotFound);
  it->second.components   = components;
  it->second.weights_used = weights;
  it->second.score        = score;
  it->second.scored_at_ms = scored_at_ms;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Touches
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertTouch(Transaction& t, const model::TouchRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "touch id required");
  if (s.touches.contains({r.tenant_id, r.id})) return Result::Err(ErrorCode::AlreadyExists);
  s.touches[{r.tenant_id, r.id}] = r;
  return Result::Ok();
}

std::vector<model::TouchRecord> MemoryRepository::ListTouches(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  std::vector<model::TouchRecord> out;
  const auto&                     touches = TX(t).View().touches;
  for (auto it = touches.lower_bound({tenant_id, std::string()}); it != touches.end() && it->first.first == tenant_id; ++it) {
    if (it->second.sent_at_ms >= since_ms) out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(), [](const model::TouchRecord& a, const model::TouchRecord& b) {
    return std::tie(a.lead_id, a.sent_at_ms, a.id) < std::tie(b.lead_id, b.sent_at_ms, b.id);
  });
  return out;
}

Result MemoryRepository::UpdateTouchSnapshot(Transaction& t, const std::string& tenant_id, const std::string& touch_id,
                                             const std::string& snapshot_json) {
  auto& touches = TX(t).Mutable().touches;
  auto  it      = touches.find({tenant_id, touch_id});
  if (it == touches.end()) return Result::Err(ErrorCode::NotFound);
  it->second.content_snapshot = snapshot_json;
  return Result::Ok();
}

Result MemoryRepository::SetLedToBooking(Transaction& t, const std::string& tenant_id, const std::string& touch_id) {
  auto& touches = TX(t).Mutable().touches;
  auto  it      = touches.find({tenant_id, touch_id});
  if (it == touches.end()) return Result::Err(ErrorCode::NotFound);
  for (const auto& [key, other] : touches) {
    if (key.first == tenant_id && other.lead_id == it->second.lead_id && other.led_to_booking) {
      return other.id == touch_id ? Result::Ok() : Result::Err(ErrorCode::AlreadyExists, "lead already has a booking touch");
    }
  }
  it->second.led_to_booking = true;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Patterns
// ---------------------------------------------------------------------------

std::optional<model::PatternRecord> MemoryRepository::GetPattern(Transaction& t, const std::string& tenant_id, PatternType type) {
  const auto& s  = TX(t).View();
  auto        it = s.patterns.find({tenant_id, type});
  if (it == s.patterns.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PatternRecord> MemoryRepository::ListPatterns(Transaction& t, const std::string& tenant_id) {
  std::vector<model::PatternRecord> out;
  for (const auto& [key, record] : TX(t).View().patterns) {
    if (key.first == tenant_id) out.push_back(record);
  }
  return out;
}

std::vector<model::PatternRecord> MemoryRepository::ListAllPatterns(Transaction& t) {
  std::vector<model::PatternRecord> out;
  for (const auto& [_, record] : TX(t).View().patterns) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::UpsertPattern(Transaction& t, const model::PatternRecord& r) {
  if (r.valid_until_ms <= r.computed_at_ms) {
    return Result::Err(ErrorCode::ConstraintViolation, "valid_until must be after computed_at");
  }
  if (r.confidence < 0.0 || r.confidence > 1.0) {
    return Result::Err(ErrorCode::ConstraintViolation, "confidence out of range");
  }
  TX(t).Mutable().patterns[{r.tenant_id, r.pattern_type}] = r;
  return Result::Ok();
}

Result MemoryRepository::DeletePattern(Transaction& t, const std::string& tenant_id, PatternType type) {
  auto& patterns = TX(t).Mutable().patterns;
  if (patterns.erase({tenant_id, type}) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

Result MemoryRepository::AppendPatternHistory(Transaction& t, model::PatternHistoryRecord& r) {
  auto& s      = TX(t).Mutable();
  r.history_id = s.next_history_id++;
  s.history.push_back(r);
  return Result::Ok();
}

std::vector<model::PatternHistoryRecord> MemoryRepository::ListPatternHistory(Transaction& t, const std::string& tenant_id,
                                                                              PatternType type, uint32_t limit) {
  std::vector<model::PatternHistoryRecord> out;
  const auto&                              history = TX(t).View().history;
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (it->pattern.tenant_id != tenant_id || it->pattern.pattern_type != type) continue;
    out.push_back(*it);
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

// ---------------------------------------------------------------------------
// Weight cache
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertWeightCache(Transaction& t, const model::WeightCacheRecord& r) {
  TX(t).Mutable().weight_cache[r.tenant_id] = r;
  return Result::Ok();
}

std::optional<model::WeightCacheRecord> MemoryRepository::GetWeightCache(Transaction& t, const std::string& tenant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.weight_cache.find(tenant_id);
  if (it == s.weight_cache.end()) return std::nullopt;
  return it->second;
}

} // namespace convintel::db::memory
