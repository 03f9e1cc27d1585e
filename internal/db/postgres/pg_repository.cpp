#include "pg_repository.hpp"

namespace convintel::db::postgres {

using convintel::model::PatternType;

namespace {

constexpr const char* kLeadColumns =
    "tenant_id,id,first_name,company,title,industry,country,employee_count,new_role,hiring,funded,"
    "has_email,email_verified,has_phone,phone_verified,has_linkedin,has_personal_email,status,score,"
    "has_components,c_data_quality,c_authority,c_company_fit,c_timing,"
    "has_weights,w_data_quality,w_authority,w_company_fit,w_timing,scored_at_ms,created_at_ms,converted_at_ms";

constexpr const char* kTouchColumns =
    "tenant_id,id,lead_id,channel,sent_at_ms,touch_number,sequence_id,subject,body,template_id,content_snapshot,led_to_booking";

constexpr const char* kPatternColumns = "tenant_id,pattern_type,version,payload_json,sample_size,confidence,computed_at_ms,valid_until_ms";

bool AsBool(const pqxx::field& f) {
  return f.as<int>() != 0;
}

model::LeadRecord ReadLead(const pqxx::row& row) {
  model::LeadRecord r;
  r.tenant_id          = row[0].c_str();
  r.id                 = row[1].c_str();
  r.first_name         = row[2].c_str();
  r.company            = row[3].c_str();
  r.title              = row[4].c_str();
  r.industry           = row[5].c_str();
  r.country            = row[6].c_str();
  r.employee_count     = row[7].as<uint32_t>();
  r.new_role           = AsBool(row[8]);
  r.hiring             = AsBool(row[9]);
  r.funded             = AsBool(row[10]);
  r.has_email          = AsBool(row[11]);
  r.email_verified     = AsBool(row[12]);
  r.has_phone          = AsBool(row[13]);
  r.phone_verified     = AsBool(row[14]);
  r.has_linkedin       = AsBool(row[15]);
  r.has_personal_email = AsBool(row[16]);
  r.status             = static_cast<convintel::model::LeadStatus>(row[17].as<int>());
  r.score              = row[18].as<double>();
  if (AsBool(row[19])) {
    r.components = convintel::model::ComponentScores{row[20].as<double>(), row[21].as<double>(), row[22].as<double>(),
                                                     row[23].as<double>()};
  }
  if (AsBool(row[24])) {
    r.weights_used = convintel::model::ScoringWeights{row[25].as<double>(), row[26].as<double>(), row[27].as<double>(),
                                                      row[28].as<double>()};
  }
  r.scored_at_ms    = row[29].as<uint64_t>();
  r.created_at_ms   = row[30].as<uint64_t>();
  r.converted_at_ms = row[31].as<uint64_t>();
  return r;
}

model::TouchRecord ReadTouch(const pqxx::row& row) {
  model::TouchRecord r;
  r.tenant_id        = row[0].c_str();
  r.id               = row[1].c_str();
  r.lead_id          = row[2].c_str();
  r.channel          = static_cast<convintel::model::Channel>(row[3].as<int>());
  r.sent_at_ms       = row[4].as<uint64_t>();
  r.touch_number     = row[5].as<uint32_t>();
  r.sequence_id      = row[6].c_str();
  r.subject          = row[7].c_str();
  r.body             = row[8].c_str();
  r.template_id      = row[9].c_str();
  r.content_snapshot = row[10].c_str();
  r.led_to_booking   = AsBool(row[11]);
  return r;
}

model::PatternRecord ReadPattern(const pqxx::row& row, int first = 0) {
  model::PatternRecord r;
  r.tenant_id      = row[first + 0].c_str();
  r.pattern_type   = static_cast<PatternType>(row[first + 1].as<int>());
  r.version        = row[first + 2].as<uint64_t>();
  r.payload_json   = row[first + 3].c_str();
  r.sample_size    = row[first + 4].as<uint32_t>();
  r.confidence     = row[first + 5].as<double>();
  r.computed_at_ms = row[first + 6].as<uint64_t>();
  r.valid_until_ms = row[first + 7].as<uint64_t>();
  return r;
}

int B(bool v) {
  return v ? 1 : 0;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Tenants
// ------------------------------------------------------------------

Result PgRepository::UpsertTenant(Transaction& t, const model::TenantRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tenants(id,name,status,deleted) VALUES($1,$2,$3,$4)"
        " ON CONFLICT(id) DO UPDATE SET name=EXCLUDED.name,status=EXCLUDED.status,deleted=EXCLUDED.deleted;",
        r.id, r.name, static_cast<int>(r.status), B(r.deleted));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TenantRecord> PgRepository::GetTenant(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_params("SELECT id,name,status,deleted FROM tenants WHERE id=$1;", tenant_id);
  if (res.empty()) return std::nullopt;

  model::TenantRecord r;
  r.id      = res[0][0].c_str();
  r.name    = res[0][1].c_str();
  r.status  = static_cast<convintel::model::SubscriptionStatus>(res[0][2].as<int>());
  r.deleted = AsBool(res[0][3]);
  return r;
}

std::vector<model::TenantRecord> PgRepository::ListTenants(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT id,name,status,deleted FROM tenants ORDER BY id;");

  std::vector<model::TenantRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::TenantRecord r;
    r.id      = row[0].c_str();
    r.name    = row[1].c_str();
    r.status  = static_cast<convintel::model::SubscriptionStatus>(row[2].as<int>());
    r.deleted = AsBool(row[3]);
    out.push_back(std::move(r));
  }
  return out;
}

uint64_t PgRepository::CountConversionsSince(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM leads WHERE tenant_id=$1 AND status=$2 AND converted_at_ms>=$3;", tenant_id,
                                      static_cast<int>(convintel::model::LeadStatus::kConverted), since_ms);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Leads
// ------------------------------------------------------------------

Result PgRepository::UpsertLead(Transaction& t, const model::LeadRecord& r) {
  const auto c = r.components.value_or(convintel::model::ComponentScores{});
  const auto w = r.weights_used.value_or(convintel::model::ScoringWeights{});
  try {
    pqxx::params params;
    params.append(r.tenant_id);
    params.append(r.id);
    params.append(r.first_name);
    params.append(r.company);
    params.append(r.title);
    params.append(r.industry);
    params.append(r.country);
    params.append(static_cast<int64_t>(r.employee_count));
    params.append(B(r.new_role));
    params.append(B(r.hiring));
    params.append(B(r.funded));
    params.append(B(r.has_email));
    params.append(B(r.email_verified));
    params.append(B(r.has_phone));
    params.append(B(r.phone_verified));
    params.append(B(r.has_linkedin));
    params.append(B(r.has_personal_email));
    params.append(static_cast<int>(r.status));
    params.append(r.score);
    params.append(B(r.components.has_value()));
    params.append(c.data_quality);
    params.append(c.authority);
    params.append(c.company_fit);
    params.append(c.timing);
    params.append(B(r.weights_used.has_value()));
    params.append(w.data_quality);
    params.append(w.authority);
    params.append(w.company_fit);
    params.append(w.timing);
    params.append(r.scored_at_ms);
    params.append(r.created_at_ms);
    params.append(r.converted_at_ms);

    std::string placeholders;
    for (int i = 1; i <= 32; ++i) {
      placeholders += (i == 1 ? "$" : ",$") + std::to_string(i);
    }
    std::string updates;
    std::string columns = kLeadColumns;
    for (std::size_t pos = 0; pos < columns.size();) {
      const auto end  = columns.find(',', pos);
      const auto name = columns.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
      if (name != "tenant_id" && name != "id") {
        updates += (updates.empty() ? "" : ",") + name + "=EXCLUDED." + name;
      }
      if (end == std::string::npos) break;
      pos = end + 1;
    }

    TX(t).Work().exec_params(std::string("INSERT INTO leads(") + kLeadColumns + ") VALUES(" + placeholders +
                                 ") ON CONFLICT(tenant_id,id) DO UPDATE SET " + updates + ";",
                             params);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LeadRecord> PgRepository::GetLead(Transaction& t, const std::string& tenant_id, const std::string& lead_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kLeadColumns + " FROM leads WHERE tenant_id=$1 AND id=$2;", tenant_id,
                                      lead_id);
  if (res.empty()) return std::nullopt;
  return ReadLead(res[0]);
}

std::vector<model::LeadRecord> PgRepository::ListLeads(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kLeadColumns + " FROM leads WHERE tenant_id=$1 AND created_at_ms>=$2 ORDER BY id;", tenant_id, since_ms);

  std::vector<model::LeadRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadLead(row));
  }
  return out;
}

Result PgRepository::UpdateLeadScoreSnapshot(Transaction& t, const std::string& tenant_id, const std::string& lead_id,
                                             const convintel::model::ComponentScores& c, const convintel::model::ScoringWeights& w,
                                             double score, uint64_t scored_at_ms) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE leads SET has_components=1,c_data_quality=$1,c_authority=$2,c_company_fit=$3,c_timing=$4,"
        "has_weights=1,w_data_quality=$5,w_authority=$6,w_company_fit=$7,w_timing=$8,score=$9,scored_at_ms=$10"
        " WHERE tenant_id=$11 AND id=$12;",
        c.data_quality, c.authority, c.company_fit, c.timing, w.data_quality, w.authority, w.company_fit, w.timing, score, scored_at_ms,
        tenant_id, lead_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Touches
// ------------------------------------------------------------------

Result PgRepository::InsertTouch(Transaction& t, const model::TouchRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO touches(") + kTouchColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12);",
                             r.tenant_id, r.id, r.lead_id, static_cast<int>(r.channel), r.sent_at_ms, static_cast<int64_t>(r.touch_number),
                             r.sequence_id, r.subject, r.body, r.template_id, r.content_snapshot, B(r.led_to_booking));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TouchRecord> PgRepository::ListTouches(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kTouchColumns + " FROM touches WHERE tenant_id=$1 AND sent_at_ms>=$2 ORDER BY lead_id,sent_at_ms,id;",
      tenant_id, since_ms);

  std::vector<model::TouchRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadTouch(row));
  }
  return out;
}

Result PgRepository::UpdateTouchSnapshot(Transaction& t, const std::string& tenant_id, const std::string& touch_id,
                                         const std::string& snapshot_json) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE touches SET content_snapshot=$1 WHERE tenant_id=$2 AND id=$3;", snapshot_json, tenant_id,
                                        touch_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetLedToBooking(Transaction& t, const std::string& tenant_id, const std::string& touch_id) {
  try {
    auto& work  = TX(t).Work();
    auto  touch = work.exec_params("SELECT lead_id FROM touches WHERE tenant_id=$1 AND id=$2;", tenant_id, touch_id);
    if (touch.empty()) return Result::Err(ErrorCode::NotFound);
    const std::string lead_id = touch[0][0].c_str();

    auto flagged = work.exec_params("SELECT id FROM touches WHERE tenant_id=$1 AND lead_id=$2 AND led_to_booking=1;", tenant_id, lead_id);
    if (!flagged.empty()) {
      if (std::string(flagged[0][0].c_str()) == touch_id) return Result::Ok();
      return Result::Err(ErrorCode::AlreadyExists, "lead already has a booking touch");
    }
    work.exec_params("UPDATE touches SET led_to_booking=1 WHERE tenant_id=$1 AND id=$2;", tenant_id, touch_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Patterns
// ------------------------------------------------------------------

std::optional<model::PatternRecord> PgRepository::GetPattern(Transaction& t, const std::string& tenant_id, PatternType type) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kPatternColumns + " FROM conversion_patterns WHERE tenant_id=$1 AND pattern_type=$2;", tenant_id,
      static_cast<int>(type));
  if (res.empty()) return std::nullopt;
  return ReadPattern(res[0]);
}

std::vector<model::PatternRecord> PgRepository::ListPatterns(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kPatternColumns + " FROM conversion_patterns WHERE tenant_id=$1 ORDER BY pattern_type;", tenant_id);

  std::vector<model::PatternRecord> out;
  for (const auto& row : res) {
    out.push_back(ReadPattern(row));
  }
  return out;
}

std::vector<model::PatternRecord> PgRepository::ListAllPatterns(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kPatternColumns + " FROM conversion_patterns ORDER BY tenant_id,pattern_type;");

  std::vector<model::PatternRecord> out;
  for (const auto& row : res) {
    out.push_back(ReadPattern(row));
  }
  return out;
}

Result PgRepository::UpsertPattern(Transaction& t, const model::PatternRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO conversion_patterns(tenant_id,pattern_type,version,payload_json,sample_size,confidence,computed_at_ms,valid_until_ms)"
        " VALUES($1,$2,$3,$4,$5,$6,$7,$8)"
        " ON CONFLICT(tenant_id,pattern_type) DO UPDATE SET"
        " version=EXCLUDED.version,payload_json=EXCLUDED.payload_json,sample_size=EXCLUDED.sample_size,"
        " confidence=EXCLUDED.confidence,computed_at_ms=EXCLUDED.computed_at_ms,valid_until_ms=EXCLUDED.valid_until_ms;",
        r.tenant_id, static_cast<int>(r.pattern_type), r.version, r.payload_json, static_cast<int64_t>(r.sample_size), r.confidence,
        r.computed_at_ms, r.valid_until_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeletePattern(Transaction& t, const std::string& tenant_id, PatternType type) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM conversion_patterns WHERE tenant_id=$1 AND pattern_type=$2;", tenant_id,
                                        static_cast<int>(type));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result PgRepository::AppendPatternHistory(Transaction& t, model::PatternHistoryRecord& r) {
  try {
    const auto& p   = r.pattern;
    auto        res = TX(t).Work().exec_params(
        "INSERT INTO conversion_pattern_history(tenant_id,pattern_type,version,payload_json,sample_size,confidence,"
               "computed_at_ms,valid_until_ms,archived,recorded_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) RETURNING history_id;",
        p.tenant_id, static_cast<int>(p.pattern_type), p.version, p.payload_json, static_cast<int64_t>(p.sample_size), p.confidence,
        p.computed_at_ms, p.valid_until_ms, B(r.archived), r.recorded_at_ms);
    r.history_id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PatternHistoryRecord> PgRepository::ListPatternHistory(Transaction& t, const std::string& tenant_id, PatternType type,
                                                                          uint32_t limit) {
  std::string sql = std::string("SELECT history_id,archived,recorded_at_ms,") + kPatternColumns +
                    " FROM conversion_pattern_history WHERE tenant_id=$1 AND pattern_type=$2 ORDER BY history_id DESC";
  if (limit != 0) sql += " LIMIT " + std::to_string(limit);
  auto res = TX(t).Work().exec_params(sql, tenant_id, static_cast<int>(type));

  std::vector<model::PatternHistoryRecord> out;
  for (const auto& row : res) {
    model::PatternHistoryRecord r;
    r.history_id     = row[0].as<uint64_t>();
    r.archived       = AsBool(row[1]);
    r.recorded_at_ms = row[2].as<uint64_t>();
    r.pattern        = ReadPattern(row, 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Weight cache
// ------------------------------------------------------------------

Result PgRepository::UpsertWeightCache(Transaction& t, const model::WeightCacheRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO client_weight_cache(tenant_id,data_quality,authority,company_fit,timing,sample_count,updated_at_ms,valid_until_ms)"
        " VALUES($1,$2,$3,$4,$5,$6,$7,$8)"
        " ON CONFLICT(tenant_id) DO UPDATE SET data_quality=EXCLUDED.data_quality,authority=EXCLUDED.authority,"
        " company_fit=EXCLUDED.company_fit,timing=EXCLUDED.timing,sample_count=EXCLUDED.sample_count,"
        " updated_at_ms=EXCLUDED.updated_at_ms,valid_until_ms=EXCLUDED.valid_until_ms;",
        r.tenant_id, r.weights.data_quality, r.weights.authority, r.weights.company_fit, r.weights.timing,
        static_cast<int64_t>(r.sample_count), r.updated_at_ms, r.valid_until_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WeightCacheRecord> PgRepository::GetWeightCache(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT tenant_id,data_quality,authority,company_fit,timing,sample_count,updated_at_ms,valid_until_ms"
      " FROM client_weight_cache WHERE tenant_id=$1;",
      tenant_id);
  if (res.empty()) return std::nullopt;

  model::WeightCacheRecord r;
  r.tenant_id      = res[0][0].c_str();
  r.weights        = {res[0][1].as<double>(), res[0][2].as<double>(), res[0][3].as<double>(), res[0][4].as<double>()};
  r.sample_count   = res[0][5].as<uint32_t>();
  r.updated_at_ms  = res[0][6].as<uint64_t>();
  r.valid_until_ms = res[0][7].as<uint64_t>();
  return r;
}

} // namespace convintel::db::postgres
