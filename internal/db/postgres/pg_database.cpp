#include "pg_database.hpp"

#include <type_traits>

#include "internal/db/sql/dialect.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace runvault::db::postgres {

namespace {

class PgRow final : public sql::Row {
public:
  explicit PgRow(const pqxx::row& row) : row_(row) {}

  std::string GetText(int col) const override { return row_[col].is_null() ? "" : row_[col].c_str(); }
  int64_t GetInt64(int col) const override { return row_[col].as<int64_t>(); }
  double GetDouble(int col) const override { return row_[col].as<double>(); }
  bool IsNull(int col) const override { return row_[col].is_null(); }

private:
  const pqxx::row& row_;
};

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else {
            out.append(v);
          }
        },
        p);
  }
  return out;
}

} // namespace

PgDatabase::PgDatabase(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgDatabase::Begin(TxMode mode) {
  return std::make_unique<PgTransaction>(pool_, mode);
}

PgTransaction& PgDatabase::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgDatabase::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

pqxx::result PgDatabase::Run(Transaction& t, const std::string& sql, const sql::Params& params) {
  auto& work = TX(t).Work();
  if (params.empty()) {
    return work.exec(sql);
  }
  return work.exec_params(sql::ToPostgresPlaceholders(sql), ToPqxx(params));
}

Result PgDatabase::Exec(Transaction& t, const std::string& sql, const sql::Params& params) {
  try {
    Run(t, sql, params);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgDatabase::Insert(Transaction& t, const std::string& sql, const sql::Params& params,
                          int64_t* inserted_id) {
  std::string returning = sql;
  while (!returning.empty() && (returning.back() == ';' || returning.back() == ' ')) {
    returning.pop_back();
  }
  returning += " RETURNING id";

  try {
    auto res = TX(t).Work().exec_params(sql::ToPostgresPlaceholders(returning), ToPqxx(params));
    if (inserted_id && !res.empty()) *inserted_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgDatabase::Query(Transaction& t, const std::string& sql, const sql::Params& params,
                         const RowCallback& on_row) {
  pqxx::result res;
  try {
    res = Run(t, sql, params);
  } catch (const std::exception& e) {
    return Translate(e);
  }

  for (const auto& r : res) {
    PgRow row(r);
    on_row(row);
  }
  return Result::Ok();
}

std::vector<std::string> PgDatabase::ListTables(Transaction& t) {
  std::vector<std::string> out;
  ThrowIfDbError(Query(t,
                       "SELECT table_name FROM information_schema.tables "
                       "WHERE table_schema = current_schema() ORDER BY table_name",
                       {}, [&](const sql::Row& row) { out.push_back(row.GetText(0)); }),
                 "list tables");
  return out;
}

std::vector<std::string> PgDatabase::ListColumns(Transaction& t, const std::string& table) {
  std::vector<std::string> out;
  ThrowIfDbError(Query(t,
                       "SELECT column_name FROM information_schema.columns "
                       "WHERE table_schema = current_schema() AND table_name = ? ORDER BY ordinal_position",
                       {table}, [&](const sql::Row& row) { out.push_back(row.GetText(0)); }),
                 "list columns of " + table);
  return out;
}

}
