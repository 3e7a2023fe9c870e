#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace runvault::db::sql {

/*
  Bind parameters.

  Store SQL is written once with '?' placeholders and ordered binding.
  SQLite binds them as-is; PgDatabase rewrites them to $1..$n first.
  Absent optional columns (partition, end_time, asset_key, ...) bind as
  NULL through OptionalParam.
*/

using Param = std::variant<std::nullptr_t, int32_t, int64_t, double, std::string>;

using Params = std::vector<Param>;

template <typename T>
Param OptionalParam(const std::optional<T>& value) {
  if (!value) return nullptr;
  return *value;
}

// Rewrites '?' placeholders to $1..$n, skipping quoted literals.
inline std::string ToPostgresPlaceholders(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 8);
  int  n      = 0;
  bool quoted = false;
  for (char c : sql) {
    if (c == '\'') {
      quoted = !quoted;
    }
    if (c == '?' && !quoted) {
      out += '$';
      out += std::to_string(++n);
      continue;
    }
    out += c;
  }
  return out;
}

} // namespace runvault::db::sql
