#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace runvault::db::postgres {

/*
  One pooled connection and one pqxx::work.

  Every write transaction takes the same transaction-scoped advisory lock
  before its first statement, so writers on a database run one at a time
  as they do under SQLite's BEGIN IMMEDIATE. Run-scoped log ids and
  revision checks rely on it. Read transactions skip the lock and are
  declared READ ONLY, so a stray write in one fails.
*/
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;

 private:
  // declared first: the work must be gone before the connection returns
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              finished_ = false;
};

} // namespace runvault::db::postgres
