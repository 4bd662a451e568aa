#pragma once

namespace waypoint::db {

/*
  One unit of work of a checkpoint store call.

  A put covers the checkpoint row together with its blob rows, a put_writes
  covers the whole batch of one task, and a read sees a checkpoint and its
  pending writes from the same snapshot. Nothing is visible to other
  connections before Commit(). A transaction still Active() when destroyed
  is rolled back.

  SQLite: BEGIN IMMEDIATE ... COMMIT
  Postgres: pqxx::work
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  // false once Commit() or Rollback() ran
  virtual bool Active() const = 0;
};

} // namespace waypoint::db
