#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace runvault::db {

enum class Dialect { kSqlite, kPostgres };

/*
  Database abstraction.

  Stores own their SQL and talk to one of these; each backend hides its
  driver (sqlite3 / libpqxx) and translates driver failures into Result.

  Rules:
    - every call runs inside a caller-owned Transaction
    - SQL is written with '?' placeholders
    - DDL is transactional on both backends
*/

class Database {
 public:
  using RowCallback = std::function<void(const sql::Row&)>;

  virtual ~Database() = default;

  virtual Dialect dialect() const = 0;

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) = 0;

  // Statement without a result set. With no params a multi-statement
  // script is accepted.
  virtual Result Exec(Transaction& tx, const std::string& sql, const sql::Params& params = {}) = 0;

  // INSERT into a table with an integer `id` primary key; reports the new id.
  virtual Result Insert(Transaction& tx, const std::string& sql, const sql::Params& params,
                        int64_t* inserted_id) = 0;

  virtual Result Query(Transaction& tx, const std::string& sql, const sql::Params& params,
                       const RowCallback& on_row) = 0;

  // Schema introspection used by migrations and dual-path readers.
  virtual std::vector<std::string> ListTables(Transaction& tx) = 0;
  virtual std::vector<std::string> ListColumns(Transaction& tx, const std::string& table) = 0;

  bool HasTable(Transaction& tx, const std::string& table);
  bool HasColumn(Transaction& tx, const std::string& table, const std::string& column);
};

// Maps a failed Result to the util error hierarchy.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace runvault::db
