#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace waypoint::db::postgres {

PgTransaction::PgTransaction(pqxx::connection& conn, const std::string& operation)
    : operation_(operation), tx_(std::make_unique<pqxx::work>(conn, operation)) {
}

PgTransaction::~PgTransaction() {
  if (!active_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    WAYPOINT_LOG_WARN("postgres rollback failed",
                      {observability::StringField("operation", operation_), observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  active_ = false;
}

void PgTransaction::Rollback() {
  active_ = false;
  tx_->abort();
}

} // namespace waypoint::db::postgres
