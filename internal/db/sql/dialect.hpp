#pragma once

#include <string>

#include "internal/db/api/database.hpp"

namespace runvault::db::sql {

/*
  The few DDL/DML spellings that differ between backends. Everything
  else (ON CONFLICT, ADD/DROP COLUMN, IF NOT EXISTS) is shared SQL.
  Placeholder rewriting lives with the parameters in sql_params.hpp.
*/

inline std::string AutoIncrementPrimaryKey(Dialect dialect) {
  return dialect == Dialect::kPostgres ? "BIGSERIAL PRIMARY KEY" : "INTEGER PRIMARY KEY AUTOINCREMENT";
}

// Numeric top-level field of a JSON text column; NULL when absent.
inline std::string JsonNumberField(Dialect dialect, const std::string& column, const std::string& field) {
  if (dialect == Dialect::kPostgres) {
    return "CAST(CAST(" + column + " AS JSON) ->> '" + field + "' AS DOUBLE PRECISION)";
  }
  return "json_extract(" + column + ", '$." + field + "')";
}

} // namespace runvault::db::sql
