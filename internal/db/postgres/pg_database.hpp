#pragma once

#include <memory>

#include "internal/db/api/database.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace runvault::db::postgres {

/*
  Postgres backend.

  Canonical '?' SQL is rewritten to $n and executed as a parameterized
  statement. A failed statement poisons the surrounding transaction, so
  callers must not continue using it after an error Result.
*/
class PgDatabase final : public db::Database {
public:
  explicit PgDatabase(std::shared_ptr<PgPool> pool);

  Dialect dialect() const override { return Dialect::kPostgres; }

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) override;

  Result Exec(Transaction&, const std::string& sql, const sql::Params& params = {}) override;
  Result Insert(Transaction&, const std::string& sql, const sql::Params& params, int64_t* inserted_id) override;
  Result Query(Transaction&, const std::string& sql, const sql::Params& params, const RowCallback& on_row) override;

  std::vector<std::string> ListTables(Transaction&) override;
  std::vector<std::string> ListColumns(Transaction&, const std::string& table) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
  static pqxx::result Run(Transaction& t, const std::string& sql, const sql::Params& params);
};

}
