#include "internal/storage/event/event_data_migrations.hpp"

#include <map>
#include <optional>

#include "internal/model/event.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/storage/common/sql_where.hpp"
#include "internal/storage/event/event_index.hpp"
#include "internal/storage/event/event_log_storage.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace runvault::storage {

namespace {

std::vector<int64_t> ScanIds(db::Database& database, db::Transaction& tx, const std::string& table, int64_t after_id,
                             int batch_size) {
  std::vector<int64_t> ids;
  db::ThrowIfDbError(database.Query(tx, "SELECT id FROM " + table + " WHERE id > ? ORDER BY id ASC LIMIT ?;",
                                    {after_id, static_cast<int64_t>(batch_size)},
                                    [&](const db::sql::Row& row) { ids.push_back(row.GetInt64(0)); }),
                     "scan " + table);
  return ids;
}

} // namespace

// ------------------------------------------------------------------
// event_index_columns
// ------------------------------------------------------------------

EventIndexColumnsMigration::EventIndexColumnsMigration(std::shared_ptr<db::Database> database,
                                                       backfill::SecondaryIndexTable& index_table,
                                                       const serdes::Registry& registry)
    : database_(std::move(database)), index_table_(index_table), registry_(registry) {
}

std::string EventIndexColumnsMigration::name() const {
  return EventLogStorage::kEventIndexColumns;
}

std::vector<int64_t> EventIndexColumnsMigration::CandidateIds(db::Transaction& tx, int64_t after_id,
                                                              int batch_size) {
  return ScanIds(*database_, tx, "event_logs", after_id, batch_size);
}

void EventIndexColumnsMigration::MigrateRow(db::Transaction& tx, int64_t id) {
  std::string body;
  db::ThrowIfDbError(database_->Query(tx, "SELECT event FROM event_logs WHERE id = ?;", {id},
                                      [&](const db::sql::Row& row) { body = row.GetText(0); }),
                     "read event");

  model::EventLogEntry entry;
  EventIndexColumns    columns;
  try {
    entry   = serdes::Deserialize<model::EventLogEntry>(body, registry_);
    columns = ExtractIndexColumns(entry, registry_);
  } catch (const util::SerializationError& e) {
    throw util::MalformedRecord(id, e.what());
  }

  std::optional<std::string> asset_key;
  if (columns.asset_key) asset_key = columns.asset_key->ToDbString();

  db::ThrowIfDbError(database_->Exec(tx, "UPDATE event_logs SET step_key = ?, asset_key = ?, partition = ? WHERE id = ?;",
                                     {OptionalParam(columns.step_key), OptionalParam(asset_key),
                                      OptionalParam(columns.partition), id}),
                     "update event index columns");

  if (!asset_key) return;

  // events stored before asset_keys existed
  db::ThrowIfDbError(database_->Exec(tx,
                                     "INSERT INTO asset_keys (asset_key, last_materialization, last_run_id,"
                                     " create_timestamp) VALUES (?, ?, ?, ?) ON CONFLICT (asset_key) DO NOTHING;",
                                     {*asset_key, body, entry.run_id, util::NowSeconds()}),
                     "insert asset key");
}

// ------------------------------------------------------------------
// asset_key_index_columns
// ------------------------------------------------------------------

AssetKeyIndexColumnsMigration::AssetKeyIndexColumnsMigration(std::shared_ptr<db::Database> database,
                                                             backfill::SecondaryIndexTable& index_table,
                                                             const serdes::Registry& registry)
    : database_(std::move(database)), index_table_(index_table), registry_(registry) {
}

std::string AssetKeyIndexColumnsMigration::name() const {
  return EventLogStorage::kAssetKeyIndexColumns;
}

std::vector<int64_t> AssetKeyIndexColumnsMigration::CandidateIds(db::Transaction& tx, int64_t after_id,
                                                                 int batch_size) {
  return ScanIds(*database_, tx, "asset_keys", after_id, batch_size);
}

void AssetKeyIndexColumnsMigration::MigrateRow(db::Transaction& tx, int64_t id) {
  std::optional<std::string> last_materialization;
  std::optional<std::string> details;
  db::ThrowIfDbError(database_->Query(tx, "SELECT last_materialization, asset_details FROM asset_keys WHERE id = ?;",
                                      {id},
                                      [&](const db::sql::Row& row) {
                                        last_materialization = row.GetOptionalText(0);
                                        details              = row.GetOptionalText(1);
                                      }),
                     "read asset key");

  std::optional<double>      materialized_at;
  std::optional<double>      wiped_at;
  std::optional<std::string> tags;
  try {
    if (last_materialization) {
      auto entry      = serdes::Deserialize<model::EventLogEntry>(*last_materialization, registry_);
      materialized_at = entry.timestamp;
      auto columns    = ExtractIndexColumns(entry, registry_);
      if (columns.materialization) {
        tags = serdes::Serialize(columns.materialization->tags, registry_);
      }
    }
    if (details) {
      wiped_at = serdes::Deserialize<model::AssetDetails>(*details, registry_).last_wipe_timestamp;
    }
  } catch (const util::SerializationError& e) {
    throw util::MalformedRecord(id, e.what());
  }

  db::ThrowIfDbError(database_->Exec(tx,
                                     "UPDATE asset_keys SET"
                                     " last_materialization_timestamp = COALESCE(last_materialization_timestamp, ?),"
                                     " wipe_timestamp = COALESCE(wipe_timestamp, ?),"
                                     " tags = COALESCE(tags, ?) WHERE id = ?;",
                                     {OptionalParam(materialized_at), OptionalParam(wiped_at), OptionalParam(tags), id}),
                     "update asset key columns");
}

} // namespace runvault::storage
