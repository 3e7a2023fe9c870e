#pragma once

#include <memory>

#include "internal/db/api/database.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace runvault::db::sqlite {

class SqliteDatabase final : public db::Database {
public:
  explicit SqliteDatabase(std::shared_ptr<SqliteDB> db);

  Dialect dialect() const override { return Dialect::kSqlite; }

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) override;

  Result Exec(Transaction&, const std::string& sql, const sql::Params& params = {}) override;
  Result Insert(Transaction&, const std::string& sql, const sql::Params& params, int64_t* inserted_id) override;
  Result Query(Transaction&, const std::string& sql, const sql::Params& params, const RowCallback& on_row) override;

  std::vector<std::string> ListTables(Transaction&) override;
  std::vector<std::string> ListColumns(Transaction&, const std::string& table) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
