#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace convintel::db::sqlite {

using convintel::model::PatternType;

namespace {

// Owns a prepared statement for the duration of one call.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

constexpr const char* kLeadColumns =
    "tenant_id,id,first_name,company,title,industry,country,employee_count,new_role,hiring,funded,"
    "has_email,email_verified,has_phone,phone_verified,has_linkedin,has_personal_email,status,score,"
    "has_components,c_data_quality,c_authority,c_company_fit,c_timing,"
    "has_weights,w_data_quality,w_authority,w_company_fit,w_timing,scored_at_ms,created_at_ms,converted_at_ms";

model::LeadRecord ReadLead(sqlite3_stmt* st) {
  model::LeadRecord r;
  r.tenant_id          = ColText(st, 0);
  r.id                 = ColText(st, 1);
  r.first_name         = ColText(st, 2);
  r.company            = ColText(st, 3);
  r.title              = ColText(st, 4);
  r.industry           = ColText(st, 5);
  r.country            = ColText(st, 6);
  r.employee_count     = static_cast<uint32_t>(ColI32(st, 7));
  r.new_role           = ColBool(st, 8);
  r.hiring             = ColBool(st, 9);
  r.funded             = ColBool(st, 10);
  r.has_email          = ColBool(st, 11);
  r.email_verified     = ColBool(st, 12);
  r.has_phone          = ColBool(st, 13);
  r.phone_verified     = ColBool(st, 14);
  r.has_linkedin       = ColBool(st, 15);
  r.has_personal_email = ColBool(st, 16);
  r.status             = static_cast<convintel::model::LeadStatus>(ColI32(st, 17));
  r.score              = ColDouble(st, 18);
  if (ColBool(st, 19)) {
    r.components = convintel::model::ComponentScores{ColDouble(st, 20), ColDouble(st, 21), ColDouble(st, 22), ColDouble(st, 23)};
  }
  if (ColBool(st, 24)) {
    r.weights_used = convintel::model::ScoringWeights{ColDouble(st, 25), ColDouble(st, 26), ColDouble(st, 27), ColDouble(st, 28)};
  }
  r.scored_at_ms    = ColU64(st, 29);
  r.created_at_ms   = ColU64(st, 30);
  r.converted_at_ms = ColU64(st, 31);
  return r;
}

constexpr const char* kTouchColumns =
    "tenant_id,id,lead_id,channel,sent_at_ms,touch_number,sequence_id,subject,body,template_id,content_snapshot,led_to_booking";

model::TouchRecord ReadTouch(sqlite3_stmt* st) {
  model::TouchRecord r;
  r.tenant_id        = ColText(st, 0);
  r.id               = ColText(st, 1);
  r.lead_id          = ColText(st, 2);
  r.channel          = static_cast<convintel::model::Channel>(ColI32(st, 3));
  r.sent_at_ms       = ColU64(st, 4);
  r.touch_number     = static_cast<uint32_t>(ColI32(st, 5));
  r.sequence_id      = ColText(st, 6);
  r.subject          = ColText(st, 7);
  r.body             = ColText(st, 8);
  r.template_id      = ColText(st, 9);
  r.content_snapshot = ColText(st, 10);
  r.led_to_booking   = ColBool(st, 11);
  return r;
}

constexpr const char* kPatternColumns = "tenant_id,pattern_type,version,payload_json,sample_size,confidence,computed_at_ms,valid_until_ms";

// Reads the pattern columns starting at `first`.
model::PatternRecord ReadPattern(sqlite3_stmt* st, int first = 0) {
  model::PatternRecord r;
  r.tenant_id      = ColText(st, first + 0);
  r.pattern_type   = static_cast<PatternType>(ColI32(st, first + 1));
  r.version        = ColU64(st, first + 2);
  r.payload_json   = ColText(st, first + 3);
  r.sample_size    = static_cast<uint32_t>(ColI32(st, first + 4));
  r.confidence     = ColDouble(st, first + 5);
  r.computed_at_ms = ColU64(st, first + 6);
  r.valid_until_ms = ColU64(st, first + 7);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Tenants
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTenant(Transaction& t, const model::TenantRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO tenants(id,name,status,deleted) VALUES(?,?,?,?)"
               " ON CONFLICT(id) DO UPDATE SET name=excluded.name,status=excluded.status,deleted=excluded.deleted;");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindI32(st.get(), 3, static_cast<int>(r.status));
  BindBool(st.get(), 4, r.deleted);
  return Translate(db, st.Step());
}

std::optional<model::TenantRecord> SqliteRepository::GetTenant(Transaction& t, const std::string& tenant_id) {
  Statement st(TX(t).Handle(), "SELECT id,name,status,deleted FROM tenants WHERE id=?;");
  BindText(st.get(), 1, tenant_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::TenantRecord r;
  r.id      = ColText(st.get(), 0);
  r.name    = ColText(st.get(), 1);
  r.status  = static_cast<convintel::model::SubscriptionStatus>(ColI32(st.get(), 2));
  r.deleted = ColBool(st.get(), 3);
  return r;
}

std::vector<model::TenantRecord> SqliteRepository::ListTenants(Transaction& t) {
  Statement                        st(TX(t).Handle(), "SELECT id,name,status,deleted FROM tenants ORDER BY id;");
  std::vector<model::TenantRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::TenantRecord r;
    r.id      = ColText(st.get(), 0);
    r.name    = ColText(st.get(), 1);
    r.status  = static_cast<convintel::model::SubscriptionStatus>(ColI32(st.get(), 2));
    r.deleted = ColBool(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

uint64_t SqliteRepository::CountConversionsSince(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM leads WHERE tenant_id=? AND status=? AND converted_at_ms>=?;");
  BindText(st.get(), 1, tenant_id);
  BindI32(st.get(), 2, static_cast<int>(convintel::model::LeadStatus::kConverted));
  BindU64(st.get(), 3, since_ms);
  if (st.Step() != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Leads
// ------------------------------------------------------------------

Result SqliteRepository::UpsertLead(Transaction& t, const model::LeadRecord& r) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("INSERT OR REPLACE INTO leads(") + kLeadColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  Statement st(db, sql.c_str());
  auto*     s          = st.get();
  const auto components = r.components.value_or(convintel::model::ComponentScores{});
  const auto weights    = r.weights_used.value_or(convintel::model::ScoringWeights{});
  BindText(s, 1, r.tenant_id);
  BindText(s, 2, r.id);
  BindText(s, 3, r.first_name);
  BindText(s, 4, r.company);
  BindText(s, 5, r.title);
  BindText(s, 6, r.industry);
  BindText(s, 7, r.country);
  BindI32(s, 8, static_cast<int>(r.employee_count));
  BindBool(s, 9, r.new_role);
  BindBool(s, 10, r.hiring);
  BindBool(s, 11, r.funded);
  BindBool(s, 12, r.has_email);
  BindBool(s, 13, r.email_verified);
  BindBool(s, 14, r.has_phone);
  BindBool(s, 15, r.phone_verified);
  BindBool(s, 16, r.has_linkedin);
  BindBool(s, 17, r.has_personal_email);
  BindI32(s, 18, static_cast<int>(r.status));
  BindDouble(s, 19, r.score);
  BindBool(s, 20, r.components.has_value());
  BindDouble(s, 21, components.data_quality);
  BindDouble(s, 22, components.authority);
  BindDouble(s, 23, components.company_fit);
  BindDouble(s, 24, components.timing);
  BindBool(s, 25, r.weights_used.has_value());
  BindDouble(s, 26, weights.data_quality);
  BindDouble(s, 27, weights.authority);
  BindDouble(s, 28, weights.company_fit);
  BindDouble(s, 29, weights.timing);
  BindU64(s, 30, r.scored_at_ms);
  BindU64(s, 31, r.created_at_ms);
  BindU64(s, 32, r.converted_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::LeadRecord> SqliteRepository::GetLead(Transaction& t, const std::string& tenant_id, const std::string& lead_id) {
  const std::string sql = std::string("SELECT ") + kLeadColumns + " FROM leads WHERE tenant_id=? AND id=?;";
  Statement         st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);
  BindText(st.get(), 2, lead_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadLead(st.get());
}

std::vector<model::LeadRecord> SqliteRepository::ListLeads(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  const std::string sql = std::string("SELECT ") + kLeadColumns + " FROM leads WHERE tenant_id=? AND created_at_ms>=? ORDER BY id;";
  Statement         st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);
  BindU64(st.get(), 2, since_ms);

  std::vector<model::LeadRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadLead(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateLeadScoreSnapshot(Transaction& t, const std::string& tenant_id, const std::string& lead_id,
                                                 const convintel::model::ComponentScores& c,
                                                 const convintel::model::ScoringWeights& w, double score, uint64_t scored_at_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE leads SET has_components=1,c_data_quality=?,c_authority=?,c_company_fit=?,c_timing=?,"
               "has_weights=1,w_data_quality=?,w_authority=?,w_company_fit=?,w_timing=?,score=?,scored_at_ms=?"
               " WHERE tenant_id=? AND id=?;");
  auto* s = st.get();
  BindDouble(s, 1, c.data_quality);
  BindDouble(s, 2, c.authority);
  BindDouble(s, 3, c.company_fit);
  BindDouble(s, 4, c.timing);
  BindDouble(s, 5, w.data_quality);
  BindDouble(s, 6, w.authority);
  BindDouble(s, 7, w.company_fit);
  BindDouble(s, 8, w.timing);
  BindDouble(s, 9, score);
  BindU64(s, 10, scored_at_ms);
  BindText(s, 11, tenant_id);
  BindText(s, 12, lead_id);
  const auto result = Translate(db, st.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Touches
// ------------------------------------------------------------------

Result SqliteRepository::InsertTouch(Transaction& t, const model::TouchRecord& r) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("INSERT INTO touches(") + kTouchColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";
  Statement         st(db, sql.c_str());
  auto*             s = st.get();
  BindText(s, 1, r.tenant_id);
  BindText(s, 2, r.id);
  BindText(s, 3, r.lead_id);
  BindI32(s, 4, static_cast<int>(r.channel));
  BindU64(s, 5, r.sent_at_ms);
  BindI32(s, 6, static_cast<int>(r.touch_number));
  BindText(s, 7, r.sequence_id);
  BindText(s, 8, r.subject);
  BindText(s, 9, r.body);
  BindText(s, 10, r.template_id);
  BindText(s, 11, r.content_snapshot);
  BindBool(s, 12, r.led_to_booking);
  const int rc = st.Step();
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  return Translate(db, rc);
}

std::vector<model::TouchRecord> SqliteRepository::ListTouches(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  const std::string sql =
      std::string("SELECT ") + kTouchColumns + " FROM touches WHERE tenant_id=? AND sent_at_ms>=? ORDER BY lead_id,sent_at_ms,id;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);
  BindU64(st.get(), 2, since_ms);

  std::vector<model::TouchRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadTouch(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateTouchSnapshot(Transaction& t, const std::string& tenant_id, const std::string& touch_id,
                                             const std::string& snapshot_json) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE touches SET content_snapshot=? WHERE tenant_id=? AND id=?;");
  BindText(st.get(), 1, snapshot_json);
  BindText(st.get(), 2, tenant_id);
  BindText(st.get(), 3, touch_id);
  const auto result = Translate(db, st.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::SetLedToBooking(Transaction& t, const std::string& tenant_id, const std::string& touch_id) {
  auto* db = TX(t).Handle();

  std::string lead_id;
  {
    Statement st(db, "SELECT lead_id FROM touches WHERE tenant_id=? AND id=?;");
    BindText(st.get(), 1, tenant_id);
    BindText(st.get(), 2, touch_id);
    if (st.Step() != SQLITE_ROW) return Result::Err(ErrorCode::NotFound);
    lead_id = ColText(st.get(), 0);
  }
  {
    Statement st(db, "SELECT id FROM touches WHERE tenant_id=? AND lead_id=? AND led_to_booking=1;");
    BindText(st.get(), 1, tenant_id);
    BindText(st.get(), 2, lead_id);
    if (st.Step() == SQLITE_ROW) {
      if (ColText(st.get(), 0) == touch_id) return Result::Ok();
      return Result::Err(ErrorCode::AlreadyExists, "lead already has a booking touch");
    }
  }
  Statement st(db, "UPDATE touches SET led_to_booking=1 WHERE tenant_id=? AND id=?;");
  BindText(st.get(), 1, tenant_id);
  BindText(st.get(), 2, touch_id);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Patterns
// ------------------------------------------------------------------

std::optional<model::PatternRecord> SqliteRepository::GetPattern(Transaction& t, const std::string& tenant_id, PatternType type) {
  const std::string sql = std::string("SELECT ") + kPatternColumns + " FROM conversion_patterns WHERE tenant_id=? AND pattern_type=?;";
  Statement         st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);
  BindI32(st.get(), 2, static_cast<int>(type));
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadPattern(st.get());
}

std::vector<model::PatternRecord> SqliteRepository::ListPatterns(Transaction& t, const std::string& tenant_id) {
  const std::string sql = std::string("SELECT ") + kPatternColumns + " FROM conversion_patterns WHERE tenant_id=? ORDER BY pattern_type;";
  Statement         st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);

  std::vector<model::PatternRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadPattern(st.get()));
  }
  return out;
}

std::vector<model::PatternRecord> SqliteRepository::ListAllPatterns(Transaction& t) {
  const std::string sql = std::string("SELECT ") + kPatternColumns + " FROM conversion_patterns ORDER BY tenant_id,pattern_type;";
  Statement         st(TX(t).Handle(), sql.c_str());

  std::vector<model::PatternRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadPattern(st.get()));
  }
  return out;
}

Result SqliteRepository::UpsertPattern(Transaction& t, const model::PatternRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO conversion_patterns(tenant_id,pattern_type,version,payload_json,sample_size,confidence,computed_at_ms,valid_until_ms)"
               " VALUES(?,?,?,?,?,?,?,?)"
               " ON CONFLICT(tenant_id,pattern_type) DO UPDATE SET"
               " version=excluded.version,payload_json=excluded.payload_json,sample_size=excluded.sample_size,"
               " confidence=excluded.confidence,computed_at_ms=excluded.computed_at_ms,valid_until_ms=excluded.valid_until_ms;");
  auto* s = st.get();
  BindText(s, 1, r.tenant_id);
  BindI32(s, 2, static_cast<int>(r.pattern_type));
  BindU64(s, 3, r.version);
  BindText(s, 4, r.payload_json);
  BindI32(s, 5, static_cast<int>(r.sample_size));
  BindDouble(s, 6, r.confidence);
  BindU64(s, 7, r.computed_at_ms);
  BindU64(s, 8, r.valid_until_ms);
  return Translate(db, st.Step());
}

Result SqliteRepository::DeletePattern(Transaction& t, const std::string& tenant_id, PatternType type) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM conversion_patterns WHERE tenant_id=? AND pattern_type=?;");
  BindText(st.get(), 1, tenant_id);
  BindI32(st.get(), 2, static_cast<int>(type));
  const auto result = Translate(db, st.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendPatternHistory(Transaction& t, model::PatternHistoryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO conversion_pattern_history(tenant_id,pattern_type,version,payload_json,sample_size,confidence,"
               "computed_at_ms,valid_until_ms,archived,recorded_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");
  auto*       s = st.get();
  const auto& p = r.pattern;
  BindText(s, 1, p.tenant_id);
  BindI32(s, 2, static_cast<int>(p.pattern_type));
  BindU64(s, 3, p.version);
  BindText(s, 4, p.payload_json);
  BindI32(s, 5, static_cast<int>(p.sample_size));
  BindDouble(s, 6, p.confidence);
  BindU64(s, 7, p.computed_at_ms);
  BindU64(s, 8, p.valid_until_ms);
  BindBool(s, 9, r.archived);
  BindU64(s, 10, r.recorded_at_ms);
  const auto result = Translate(db, st.Step());
  if (result) r.history_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::PatternHistoryRecord> SqliteRepository::ListPatternHistory(Transaction& t, const std::string& tenant_id,
                                                                              PatternType type, uint32_t limit) {
  const std::string sql = std::string("SELECT history_id,archived,recorded_at_ms,") + kPatternColumns +
                          " FROM conversion_pattern_history WHERE tenant_id=? AND pattern_type=? ORDER BY history_id DESC LIMIT ?;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);
  BindI32(st.get(), 2, static_cast<int>(type));
  sqlite3_bind_int64(st.get(), 3, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

  std::vector<model::PatternHistoryRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::PatternHistoryRecord r;
    r.history_id     = ColU64(st.get(), 0);
    r.archived       = ColBool(st.get(), 1);
    r.recorded_at_ms = ColU64(st.get(), 2);
    r.pattern        = ReadPattern(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Weight cache
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWeightCache(Transaction& t, const model::WeightCacheRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT OR REPLACE INTO client_weight_cache(tenant_id,data_quality,authority,company_fit,timing,sample_count,"
               "updated_at_ms,valid_until_ms) VALUES(?,?,?,?,?,?,?,?);");
  auto* s = st.get();
  BindText(s, 1, r.tenant_id);
  BindDouble(s, 2, r.weights.data_quality);
  BindDouble(s, 3, r.weights.authority);
  BindDouble(s, 4, r.weights.company_fit);
  BindDouble(s, 5, r.weights.timing);
  BindI32(s, 6, static_cast<int>(r.sample_count));
  BindU64(s, 7, r.updated_at_ms);
  BindU64(s, 8, r.valid_until_ms);
  return Translate(db, st.Step());
}

std::optional<model::WeightCacheRecord> SqliteRepository::GetWeightCache(Transaction& t, const std::string& tenant_id) {
  Statement st(TX(t).Handle(),
               "SELECT tenant_id,data_quality,authority,company_fit,timing,sample_count,updated_at_ms,valid_until_ms"
               " FROM client_weight_cache WHERE tenant_id=?;");
  BindText(st.get(), 1, tenant_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::WeightCacheRecord r;
  r.tenant_id      = ColText(st.get(), 0);
  r.weights        = {ColDouble(st.get(), 1), ColDouble(st.get(), 2), ColDouble(st.get(), 3), ColDouble(st.get(), 4)};
  r.sample_count   = static_cast<uint32_t>(ColI32(st.get(), 5));
  r.updated_at_ms  = ColU64(st.get(), 6);
  r.valid_until_ms = ColU64(st.get(), 7);
  return r;
}

} // namespace convintel::db::sqlite
