#pragma once

#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace waypoint::db::sqlite {

/*
  BEGIN IMMEDIATE transaction around one saver call.

  The write lock is taken at BEGIN, so a put never has to upgrade a read
  lock while another connection to the same file is writing; contention
  shows up as Busy once busy_timeout_ms has elapsed.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::string operation);
  ~SqliteTransaction() override;

  void Commit() override;
  void Rollback() override;

  bool Active() const override {
    return active_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  std::string               operation_;
  bool                      active_ = true;
};

} // namespace waypoint::db::sqlite
