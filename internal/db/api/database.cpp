#include "internal/db/api/database.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace runvault::db {

bool Database::HasTable(Transaction& tx, const std::string& table) {
  const auto tables = ListTables(tx);
  return std::find(tables.begin(), tables.end(), table) != tables.end();
}

bool Database::HasColumn(Transaction& tx, const std::string& table, const std::string& column) {
  const auto columns = ListColumns(tx, table);
  return std::find(columns.begin(), columns.end(), column) != columns.end();
}

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (!result.Failed()) {
    return;
  }

  auto message = context + " (" + ErrorCodeName(result.code) + ")";
  if (!result.message.empty()) message += ": " + result.message;

  // a constraint hit on insert is a duplicate key for every store
  if (result.code == ErrorCode::ConstraintViolation) {
    throw runvault::util::AlreadyExists(message);
  }
  throw std::runtime_error(message);
}

} // namespace runvault::db
