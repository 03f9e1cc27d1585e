#include "migrations.hpp"

#include <stdexcept>

#include "schema.hpp"

namespace convintel::db::sql {

namespace {

constexpr const char* kTenants =
    "CREATE TABLE IF NOT EXISTS tenants ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " status INTEGER NOT NULL,"
    " deleted INTEGER NOT NULL DEFAULT 0);";

constexpr const char* kLeads =
    "CREATE TABLE IF NOT EXISTS leads ("
    " tenant_id TEXT NOT NULL,"
    " id TEXT NOT NULL,"
    " first_name TEXT NOT NULL DEFAULT '',"
    " company TEXT NOT NULL DEFAULT '',"
    " title TEXT NOT NULL DEFAULT '',"
    " industry TEXT NOT NULL DEFAULT '',"
    " country TEXT NOT NULL DEFAULT '',"
    " employee_count INTEGER NOT NULL DEFAULT 0,"
    " new_role INTEGER NOT NULL DEFAULT 0,"
    " hiring INTEGER NOT NULL DEFAULT 0,"
    " funded INTEGER NOT NULL DEFAULT 0,"
    " has_email INTEGER NOT NULL DEFAULT 0,"
    " email_verified INTEGER NOT NULL DEFAULT 0,"
    " has_phone INTEGER NOT NULL DEFAULT 0,"
    " phone_verified INTEGER NOT NULL DEFAULT 0,"
    " has_linkedin INTEGER NOT NULL DEFAULT 0,"
    " has_personal_email INTEGER NOT NULL DEFAULT 0,"
    " status INTEGER NOT NULL,"
    " score DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " has_components INTEGER NOT NULL DEFAULT 0,"
    " c_data_quality DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " c_authority DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " c_company_fit DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " c_timing DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " has_weights INTEGER NOT NULL DEFAULT 0,"
    " w_data_quality DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " w_authority DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " w_company_fit DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " w_timing DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " scored_at_ms BIGINT NOT NULL DEFAULT 0,"
    " created_at_ms BIGINT NOT NULL,"
    " converted_at_ms BIGINT NOT NULL DEFAULT 0,"
    " PRIMARY KEY (tenant_id, id));";

constexpr const char* kLeadsCreatedIndex = "CREATE INDEX IF NOT EXISTS leads_created_idx ON leads(tenant_id, created_at_ms);";

constexpr const char* kTouches =
    "CREATE TABLE IF NOT EXISTS touches ("
    " tenant_id TEXT NOT NULL,"
    " id TEXT NOT NULL,"
    " lead_id TEXT NOT NULL,"
    " channel INTEGER NOT NULL,"
    " sent_at_ms BIGINT NOT NULL,"
    " touch_number INTEGER NOT NULL,"
    " sequence_id TEXT NOT NULL DEFAULT '',"
    " subject TEXT NOT NULL DEFAULT '',"
    " body TEXT NOT NULL DEFAULT '',"
    " template_id TEXT NOT NULL DEFAULT '',"
    " content_snapshot TEXT NOT NULL DEFAULT '',"
    " led_to_booking INTEGER NOT NULL DEFAULT 0,"
    " PRIMARY KEY (tenant_id, id));";

constexpr const char* kTouchesLeadIndex = "CREATE INDEX IF NOT EXISTS touches_lead_idx ON touches(tenant_id, lead_id, sent_at_ms);";

constexpr const char* kPatterns =
    "CREATE TABLE IF NOT EXISTS conversion_patterns ("
    " tenant_id TEXT NOT NULL,"
    " pattern_type INTEGER NOT NULL,"
    " version BIGINT NOT NULL,"
    " payload_json TEXT NOT NULL,"
    " sample_size INTEGER NOT NULL,"
    " confidence DOUBLE PRECISION NOT NULL CHECK (confidence >= 0 AND confidence <= 1),"
    " computed_at_ms BIGINT NOT NULL,"
    " valid_until_ms BIGINT NOT NULL CHECK (valid_until_ms > computed_at_ms),"
    " PRIMARY KEY (tenant_id, pattern_type));";

constexpr const char* kHistoryColumns =
    " tenant_id TEXT NOT NULL,"
    " pattern_type INTEGER NOT NULL,"
    " version BIGINT NOT NULL,"
    " payload_json TEXT NOT NULL,"
    " sample_size INTEGER NOT NULL,"
    " confidence DOUBLE PRECISION NOT NULL,"
    " computed_at_ms BIGINT NOT NULL,"
    " valid_until_ms BIGINT NOT NULL,"
    " archived INTEGER NOT NULL DEFAULT 0,"
    " recorded_at_ms BIGINT NOT NULL);";

constexpr const char* kHistoryIndex =
    "CREATE INDEX IF NOT EXISTS pattern_history_key_idx ON conversion_pattern_history(tenant_id, pattern_type, history_id);";

constexpr const char* kWeightCache =
    "CREATE TABLE IF NOT EXISTS client_weight_cache ("
    " tenant_id TEXT PRIMARY KEY,"
    " data_quality DOUBLE PRECISION NOT NULL,"
    " authority DOUBLE PRECISION NOT NULL,"
    " company_fit DOUBLE PRECISION NOT NULL,"
    " timing DOUBLE PRECISION NOT NULL,"
    " sample_count INTEGER NOT NULL,"
    " updated_at_ms BIGINT NOT NULL,"
    " valid_until_ms BIGINT NOT NULL);";

constexpr const char* kMigrations =
    "CREATE TABLE IF NOT EXISTS convintel_schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " applied_at_ms BIGINT NOT NULL);";

std::vector<std::string> CommonTables() {
  return {kTenants, kLeads, kLeadsCreatedIndex, kTouches, kTouchesLeadIndex, kPatterns, kWeightCache, kMigrations};
}

} // namespace

std::vector<std::string> SqliteSchema() {
  auto out = CommonTables();
  out.push_back(std::string("CREATE TABLE IF NOT EXISTS conversion_pattern_history (history_id INTEGER PRIMARY KEY AUTOINCREMENT,") +
                kHistoryColumns);
  out.push_back(kHistoryIndex);
  out.push_back("INSERT OR IGNORE INTO convintel_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
                ", CAST(strftime('%s','now') AS INTEGER) * 1000);");
  return out;
}

std::vector<std::string> PostgresSchema() {
  auto out = CommonTables();
  out.push_back(std::string("CREATE TABLE IF NOT EXISTS conversion_pattern_history (history_id BIGSERIAL PRIMARY KEY,") + kHistoryColumns);
  out.push_back(kHistoryIndex);
  out.push_back("INSERT INTO convintel_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
                ", (EXTRACT(EPOCH FROM now()) * 1000)::BIGINT) ON CONFLICT (version) DO NOTHING;");
  return out;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    try {
      executor.ExecuteSQL(statement);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration failed: " + std::string(e.what()) + " [" + statement.substr(0, 64) + "]");
    }
  }
}

} // namespace convintel::db::sql
