#pragma once

#include <memory>
#include <string>

#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"

namespace waypoint::db::postgres {

/*
  pqxx::work named after the saver call it serves, so pqxx errors and
  server logs say which operation failed. Loop thread only.
*/
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(pqxx::connection& conn, const std::string& operation);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;

  bool Active() const override {
    return active_;
  }

 private:
  std::string                 operation_;
  std::unique_ptr<pqxx::work> tx_;
  bool                        active_ = true;
};

} // namespace waypoint::db::postgres
