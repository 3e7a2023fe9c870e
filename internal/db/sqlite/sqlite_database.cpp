#include "sqlite_database.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>

namespace runvault::db::sqlite {

using runvault::db::ErrorCode;
using runvault::db::Result;

namespace {

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

class SqliteRow final : public sql::Row {
public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {}

  std::string GetText(int col) const override { return ColText(st_, col); }
  int64_t GetInt64(int col) const override { return sqlite3_column_int64(st_, col); }
  double GetDouble(int col) const override { return sqlite3_column_double(st_, col); }
  bool IsNull(int col) const override { return sqlite3_column_type(st_, col) == SQLITE_NULL; }

private:
  sqlite3_stmt* st_;
};

int Bind(sqlite3_stmt* st, const sql::Params& params) {
  int idx = 1;
  for (const auto& p : params) {
    int rc = std::visit(
        [&](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(st, idx);
          } else if constexpr (std::is_same_v<T, int32_t>) {
            return sqlite3_bind_int(st, idx, v);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(st, idx, v);
          } else {
            return sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
          }
        },
        p);
    if (rc != SQLITE_OK) return rc;
    ++idx;
  }
  return SQLITE_OK;
}

} // namespace

SqliteDatabase::SqliteDatabase(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteDatabase::Begin(TxMode mode) {
  return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteDatabase::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteDatabase::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteDatabase::Exec(Transaction& t, const std::string& sql, const sql::Params& params) {
  auto& conn = TX(t).Db();
  auto* db   = conn.Handle();

  if (params.empty()) {
    char* err = nullptr;
    int   rc  = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
      auto result = Translate(db, rc);
      if (err) {
        result.message = err;
        sqlite3_free(err);
      }
      return result;
    }
    return Result::Ok();
  }

  StmtPtr st;
  int     rc = conn.Prepare(sql, &st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  rc = Bind(st.get(), params);
  if (rc != SQLITE_OK) return Translate(db, rc);

  do {
    rc = sqlite3_step(st.get());
  } while (rc == SQLITE_ROW);

  return Translate(db, rc);
}

Result SqliteDatabase::Insert(Transaction& t, const std::string& sql, const sql::Params& params,
                              int64_t* inserted_id) {
  auto& conn = TX(t).Db();
  auto* db   = conn.Handle();

  StmtPtr st;
  int     rc = conn.Prepare(sql, &st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  rc = Bind(st.get(), params);
  if (rc != SQLITE_OK) return Translate(db, rc);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (inserted_id) *inserted_id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

Result SqliteDatabase::Query(Transaction& t, const std::string& sql, const sql::Params& params,
                             const RowCallback& on_row) {
  auto& conn = TX(t).Db();
  auto* db   = conn.Handle();

  StmtPtr st;
  int     rc = conn.Prepare(sql, &st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  rc = Bind(st.get(), params);
  if (rc != SQLITE_OK) return Translate(db, rc);

  SqliteRow row(st.get());
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    on_row(row);
  }

  return Translate(db, rc);
}

std::vector<std::string> SqliteDatabase::ListTables(Transaction& t) {
  std::vector<std::string> out;
  ThrowIfDbError(Query(t, "SELECT name FROM sqlite_master WHERE type='table' ORDER BY name;", {},
                       [&](const sql::Row& row) { out.push_back(row.GetText(0)); }),
                 "list tables");
  return out;
}

std::vector<std::string> SqliteDatabase::ListColumns(Transaction& t, const std::string& table) {
  std::vector<std::string> out;
  // pragma arguments cannot be bound; table names come from store code only
  ThrowIfDbError(Query(t, "PRAGMA table_info(\"" + table + "\");", {},
                       [&](const sql::Row& row) { out.push_back(row.GetText(1)); }),
                 "list columns of " + table);
  return out;
}

} // namespace runvault::db::sqlite
