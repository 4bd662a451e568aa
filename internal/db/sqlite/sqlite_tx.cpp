#include "sqlite_tx.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace waypoint::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::string operation)
    : db_(std::move(db)), operation_(std::move(operation)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!active_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const util::StorageError& e) {
    WAYPOINT_LOG_WARN("sqlite rollback failed",
                      {observability::StringField("operation", operation_), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  active_ = false;
}

void SqliteTransaction::Rollback() {
  active_ = false;
  db_->Exec("ROLLBACK;");
}

} // namespace waypoint::db::sqlite
