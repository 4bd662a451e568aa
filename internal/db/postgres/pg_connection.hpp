#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/result.hpp"

namespace waypoint::db::postgres {

/*
  PgConnection

  Owns the single pqxx::connection of a PostgresSaver.

  libpqxx connections are NOT thread-safe: the owner touches it from its
  I/O loop thread only. Prepared statements reference the checkpoint
  tables, so they are installed after the schema exists.
*/
class PgConnection {
 public:
  explicit PgConnection(std::string conninfo);

  pqxx::connection& Get() {
    return *conn_;
  }

  // Idempotent.
  void PrepareStatements();

 private:
  std::string                       conninfo_;
  std::unique_ptr<pqxx::connection> conn_;
  bool                              prepared_ = false;
};

// Maps a libpqxx exception onto the portable result codes.
Result Translate(const std::exception& e);

} // namespace waypoint::db::postgres
