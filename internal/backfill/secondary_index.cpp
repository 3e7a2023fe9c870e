#include "internal/backfill/secondary_index.hpp"

#include "internal/util/time.hpp"

namespace runvault::backfill {

SecondaryIndexTable::SecondaryIndexTable(std::shared_ptr<db::Database> database, std::string table)
    : database_(std::move(database)), table_(std::move(table)) {
}

bool SecondaryIndexTable::Exists(db::Transaction& tx) const {
  return database_->HasTable(tx, table_);
}

bool SecondaryIndexTable::IsBuilt(db::Transaction& tx, const std::string& name) const {
  if (!Exists(tx)) return false;

  bool built = false;
  db::ThrowIfDbError(database_->Query(tx, "SELECT migration_completed FROM " + table_ + " WHERE name = ?;", {name},
                                      [&](const db::sql::Row& row) { built = !row.IsNull(0); }),
                     "read " + table_);
  return built;
}

std::optional<int64_t> SecondaryIndexTable::LastProcessedId(db::Transaction& tx, const std::string& name) const {
  std::optional<int64_t> last;
  db::ThrowIfDbError(database_->Query(tx, "SELECT last_processed_id FROM " + table_ + " WHERE name = ?;", {name},
                                      [&](const db::sql::Row& row) {
                                        if (!row.IsNull(0)) last = row.GetInt64(0);
                                      }),
                     "read " + table_);
  return last;
}

void SecondaryIndexTable::EnsureRow(db::Transaction& tx, const std::string& name) {
  db::ThrowIfDbError(
      database_->Exec(tx,
                      "INSERT INTO " + table_ +
                          " (name, create_timestamp) VALUES (?, ?) ON CONFLICT (name) DO NOTHING;",
                      {name, util::NowSeconds()}),
      "insert " + table_);
}

void SecondaryIndexTable::SaveProgress(db::Transaction& tx, const std::string& name, int64_t last_processed_id) {
  EnsureRow(tx, name);
  db::ThrowIfDbError(database_->Exec(tx, "UPDATE " + table_ + " SET last_processed_id = ? WHERE name = ?;",
                                     {last_processed_id, name}),
                     "update " + table_);
}

void SecondaryIndexTable::MarkBuilt(db::Transaction& tx, const std::string& name) {
  EnsureRow(tx, name);
  db::ThrowIfDbError(database_->Exec(tx, "UPDATE " + table_ + " SET migration_completed = ? WHERE name = ?;",
                                     {util::NowSeconds(), name}),
                     "update " + table_);
}

void SecondaryIndexTable::Reset(db::Transaction& tx, const std::string& name) {
  db::ThrowIfDbError(database_->Exec(tx, "DELETE FROM " + table_ + " WHERE name = ?;", {name}),
                     "reset " + table_);
}

} // namespace runvault::backfill
