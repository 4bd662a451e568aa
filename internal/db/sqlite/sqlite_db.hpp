#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/api/result.hpp"

namespace waypoint::db::sqlite {

struct SqliteOptions {
  bool wal_mode        = true;
  int  busy_timeout_ms = 5000;
};

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  Failures are raised as util::StorageError carrying the translated code.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

// Maps an sqlite return code onto the portable result codes.
Result Translate(sqlite3* db, int rc);

// Raises util::StorageError unless rc is OK, ROW or DONE.
void Check(sqlite3* db, int rc, const std::string& context);

} // namespace waypoint::db::sqlite
