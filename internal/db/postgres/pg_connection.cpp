#include "pg_connection.hpp"

#include "pg_queries.hpp"

namespace waypoint::db::postgres {

PgConnection::PgConnection(std::string conninfo) : conninfo_(std::move(conninfo)), conn_(std::make_unique<pqxx::connection>(conninfo_)) {
}

void PgConnection::PrepareStatements() {
  if (prepared_) return;

  conn_->prepare("select_latest", kSelectLatest);
  conn_->prepare("select_by_id", kSelectById);
  conn_->prepare("select_versions", kSelectVersions);
  conn_->prepare("upsert_checkpoint", kUpsertCheckpoint);
  conn_->prepare("insert_blob", kInsertBlob);
  conn_->prepare("insert_write", kInsertWrite);
  prepared_ = true;
}

Result Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) || dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

} // namespace waypoint::db::postgres
