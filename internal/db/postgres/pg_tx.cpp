#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace convintel::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      observability::LogWarn("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    finished_ = true;
    throw TransactionConflict(e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  tx_->abort();
  finished_ = true;
}

} // namespace convintel::db::postgres
