#include "internal/storage/event/event_log_storage.hpp"

#include <algorithm>

#include "internal/migration/schema/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/storage/common/sql_where.hpp"
#include "internal/storage/event/event_data_migrations.hpp"
#include "internal/storage/event/event_index.hpp"
#include "internal/util/time.hpp"

namespace runvault::storage {

using migration::StorageDomain;
using observability::DoubleField;
using observability::StringField;

// ------------------------------------------------------------------
// EventLogReader
// ------------------------------------------------------------------

EventLogReader::EventLogReader(EventLogStorage& storage, std::string run_id, std::optional<int64_t> cursor,
                               int page_size)
    : storage_(storage), run_id_(std::move(run_id)), cursor_(cursor), page_size_(page_size) {
}

std::optional<model::EventLogRecord> EventLogReader::Next() {
  if (buffer_.empty()) {
    for (auto& record : storage_.GetLogsForRun(run_id_, cursor_, page_size_)) {
      buffer_.push_back(std::move(record));
    }
  }
  if (buffer_.empty()) {
    return std::nullopt;
  }

  auto record = std::move(buffer_.front());
  buffer_.pop_front();
  cursor_ = record.log_id;
  return record;
}

// ------------------------------------------------------------------
// EventLogStorage
// ------------------------------------------------------------------

EventLogStorage::EventLogStorage(std::shared_ptr<db::Database> database,
                                 std::shared_ptr<migration::MigrationManager> migrations,
                                 const serdes::Registry& registry)
    : database_(std::move(database)),
      migrations_(std::move(migrations)),
      registry_(registry),
      index_table_(database_, "event_logs_secondary_indexes") {
  if (!migrations_->HasDomain(StorageDomain::kEventLogs)) {
    migrations_->RegisterDomain(StorageDomain::kEventLogs, database_, migration::schema::EventLogsChain());
  }

  if (migrations_->EnsureInitialized(StorageDomain::kEventLogs)) {
    auto tx = database_->Begin();
    index_table_.MarkBuilt(*tx, kEventIndexColumns);
    index_table_.MarkBuilt(*tx, kAssetKeyIndexColumns);
    tx->Commit();
  }
}

bool EventLogStorage::HasAssetIndexColumns(db::Transaction& tx) {
  return database_->HasColumn(tx, "asset_keys", "wipe_timestamp");
}

model::EventLogRecord EventLogStorage::StoreEvent(const model::EventLogEntry& entry) {
  auto       tx    = database_->Begin();
  const auto state = migrations_->CheckWritable(StorageDomain::kEventLogs, *tx);

  const auto columns = ExtractIndexColumns(entry, registry_);

  int64_t log_id = 1;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT MAX(log_id) FROM event_logs WHERE run_id = ?;", {entry.run_id},
                                      [&](const db::sql::Row& row) {
                                        if (!row.IsNull(0)) log_id = row.GetInt64(0) + 1;
                                      }),
                     "next log id");

  std::optional<std::string> asset_key;
  if (columns.asset_key) asset_key = columns.asset_key->ToDbString();

  int64_t storage_id = 0;
  db::ThrowIfDbError(
      database_->Insert(*tx,
                        "INSERT INTO event_logs (run_id, log_id, event, dagster_event_type, timestamp, step_key,"
                        " asset_key, partition) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                        {entry.run_id, log_id, serdes::Serialize(entry, registry_), OptionalParam(entry.event_type()),
                         entry.timestamp, OptionalParam(columns.step_key), OptionalParam(asset_key),
                         OptionalParam(columns.partition)},
                        &storage_id),
      "append event for run " + entry.run_id);

  if (columns.materialization) {
    UpsertAssetRecord(*tx, state.IsApplied(migration::schema::kEventLogsAssetIndexColumns),
                      columns.materialization->asset_key, entry, columns.materialization->tags);
  }

  tx->Commit();
  return model::EventLogRecord{storage_id, log_id, entry};
}

void EventLogStorage::UpsertAssetRecord(db::Transaction& tx, bool index_columns, const model::AssetKey& asset_key,
                                        const model::EventLogEntry& entry,
                                        const std::map<std::string, std::string>& tags) {
  const auto key  = asset_key.ToDbString();
  const auto body = serdes::Serialize(entry, registry_);

  if (!index_columns) {
    db::ThrowIfDbError(database_->Exec(tx,
                                       "INSERT INTO asset_keys (asset_key, last_materialization, last_run_id,"
                                       " create_timestamp) VALUES (?, ?, ?, ?)"
                                       " ON CONFLICT (asset_key) DO UPDATE SET"
                                       " last_materialization = excluded.last_materialization,"
                                       " last_run_id = excluded.last_run_id;",
                                       {key, body, entry.run_id, util::NowSeconds()}),
                       "upsert asset " + key);
    return;
  }

  db::ThrowIfDbError(database_->Exec(tx,
                                     "INSERT INTO asset_keys (asset_key, last_materialization, last_run_id,"
                                     " create_timestamp, last_materialization_timestamp, tags)"
                                     " VALUES (?, ?, ?, ?, ?, ?)"
                                     " ON CONFLICT (asset_key) DO UPDATE SET"
                                     " last_materialization = excluded.last_materialization,"
                                     " last_run_id = excluded.last_run_id,"
                                     " last_materialization_timestamp = excluded.last_materialization_timestamp,"
                                     " tags = excluded.tags;",
                                     {key, body, entry.run_id, util::NowSeconds(), entry.timestamp,
                                      serdes::Serialize(tags, registry_)}),
                     "upsert asset " + key);
}

void EventLogStorage::DeleteEvents(const std::string& run_id) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kEventLogs, *tx);
  db::ThrowIfDbError(database_->Exec(*tx, "DELETE FROM event_logs WHERE run_id = ?;", {run_id}),
                     "delete events " + run_id);
  tx->Commit();
}

void EventLogStorage::CheckWritable() const {
  migrations_->CheckWritable(StorageDomain::kEventLogs);
}

// ------------------------------------------------------------------
// Event reads
// ------------------------------------------------------------------

std::vector<model::EventLogRecord> EventLogStorage::QueryEvents(db::Transaction& tx, const std::string& sql,
                                                                const db::sql::Params& params) {
  std::vector<model::EventLogRecord> out;
  db::ThrowIfDbError(database_->Query(tx, sql, params,
                                      [&](const db::sql::Row& row) {
                                        model::EventLogRecord record;
                                        record.storage_id = row.GetInt64(0);
                                        record.log_id     = row.GetInt64(1);
                                        record.entry =
                                            serdes::Deserialize<model::EventLogEntry>(row.GetText(2), registry_);
                                        out.push_back(std::move(record));
                                      }),
                     "query events");
  return out;
}

std::vector<model::EventLogRecord> EventLogStorage::GetLogsForRun(const std::string& run_id,
                                                                  std::optional<int64_t> cursor,
                                                                  std::optional<int> limit) {
  SqlWhere where;
  where.Add("run_id = ?", {run_id});
  if (cursor) where.Add("log_id > ?", {*cursor});

  std::string sql    = "SELECT id, log_id, event FROM event_logs" + where.Render() + " ORDER BY log_id ASC";
  auto        params = where.params();
  if (limit) {
    sql += " LIMIT ?";
    params.emplace_back(static_cast<int64_t>(*limit));
  }

  auto tx  = database_->Begin(db::TxMode::kRead);
  auto out = QueryEvents(*tx, sql + ";", params);
  tx->Commit();
  return out;
}

EventLogReader EventLogStorage::LogReader(const std::string& run_id, std::optional<int64_t> cursor, int page_size) {
  return EventLogReader(*this, run_id, cursor, page_size);
}

std::vector<model::EventLogRecord> EventLogStorage::GetEventRecords(const model::EventRecordsFilter& filter,
                                                                    std::optional<int> limit, bool ascending) {
  auto tx = database_->Begin(db::TxMode::kRead);

  SqlWhere where;
  if (filter.event_type) where.Add("dagster_event_type = ?", {*filter.event_type});
  if (filter.asset_key) where.Add("asset_key = ?", {filter.asset_key->ToDbString()});
  if (!filter.asset_partitions.empty()) where.AddIn("partition", filter.asset_partitions);
  if (filter.after_storage_id) where.Add("id > ?", {*filter.after_storage_id});
  if (filter.before_storage_id) where.Add("id < ?", {*filter.before_storage_id});

  if ((filter.asset_key || !filter.asset_partitions.empty()) && !index_table_.IsBuilt(*tx, kEventIndexColumns)) {
    RUNVAULT_LOG_WARN("asset event query before event_index_columns is built; legacy rows are not matched",
                      {StringField("remediation", "runvaultctl reindex")});
  }

  std::string sql = "SELECT id, log_id, event FROM event_logs" + where.Render() + " ORDER BY id " +
                    (ascending ? "ASC" : "DESC");
  auto params = where.params();
  if (limit) {
    sql += " LIMIT ?";
    params.emplace_back(static_cast<int64_t>(*limit));
  }

  auto out = QueryEvents(*tx, sql + ";", params);
  tx->Commit();
  return out;
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

void EventLogStorage::RecordMaterialization(const model::AssetKey& asset_key, const std::string& run_id,
                                            const std::map<std::string, std::string>& tags, double timestamp) {
  model::AssetMaterialization materialization;
  materialization.asset_key = asset_key;
  materialization.tags      = tags;

  model::DagsterEvent event;
  event.event_type_value    = model::event_type::kAssetMaterialization;
  event.event_specific_data = serdes::Pack(model::StepMaterializationData{materialization}, registry_);

  model::EventLogEntry entry;
  entry.run_id        = run_id;
  entry.timestamp     = timestamp;
  entry.dagster_event = std::move(event);

  auto       tx    = database_->Begin();
  const auto state = migrations_->CheckWritable(StorageDomain::kEventLogs, *tx);
  UpsertAssetRecord(*tx, state.IsApplied(migration::schema::kEventLogsAssetIndexColumns), asset_key, entry, tags);
  tx->Commit();
}

void EventLogStorage::WipeAsset(const model::AssetKey& asset_key) {
  auto       tx    = database_->Begin();
  const auto state = migrations_->CheckWritable(StorageDomain::kEventLogs, *tx);

  const auto   key     = asset_key.ToDbString();
  const double now     = util::NowSeconds();
  const auto   details = serdes::Serialize(model::AssetDetails{now}, registry_);

  if (state.IsApplied(migration::schema::kEventLogsAssetIndexColumns)) {
    db::ThrowIfDbError(database_->Exec(*tx,
                                       "INSERT INTO asset_keys (asset_key, asset_details, create_timestamp,"
                                       " wipe_timestamp) VALUES (?, ?, ?, ?)"
                                       " ON CONFLICT (asset_key) DO UPDATE SET"
                                       " asset_details = excluded.asset_details,"
                                       " wipe_timestamp = excluded.wipe_timestamp;",
                                       {key, details, now, now}),
                       "wipe asset " + key);
  } else {
    db::ThrowIfDbError(database_->Exec(*tx,
                                       "INSERT INTO asset_keys (asset_key, asset_details, create_timestamp)"
                                       " VALUES (?, ?, ?)"
                                       " ON CONFLICT (asset_key) DO UPDATE SET"
                                       " asset_details = excluded.asset_details;",
                                       {key, details, now}),
                       "wipe asset " + key);
  }

  tx->Commit();
  RUNVAULT_LOG_INFO("asset wiped", {StringField("asset_key", key), DoubleField("wipe_timestamp", now)});
}

std::vector<model::AssetKeyRecord> EventLogStorage::QueryAssetRecords(
    db::Transaction& tx, const std::optional<model::AssetKey>& asset_key) {
  const bool index_columns = HasAssetIndexColumns(tx);

  std::string sql = "SELECT asset_key, last_materialization, last_run_id, asset_details";
  if (index_columns) sql += ", last_materialization_timestamp, wipe_timestamp, tags";
  sql += " FROM asset_keys";

  db::sql::Params params;
  if (asset_key) {
    sql += " WHERE asset_key = ?";
    params.emplace_back(asset_key->ToDbString());
  }

  std::vector<model::AssetKeyRecord> out;
  db::ThrowIfDbError(
      database_->Query(tx, sql + ";", params,
                       [&](const db::sql::Row& row) {
                         model::AssetKeyRecord record;
                         record.asset_key        = model::AssetKey::FromDbString(row.GetText(0));
                         auto last_materialization = row.GetOptionalText(1);
                         record.last_run_id      = row.GetOptionalText(2);
                         auto details            = row.GetOptionalText(3);

                         std::optional<std::string> tags;
                         if (index_columns) {
                           record.last_materialization_timestamp = row.GetOptionalDouble(4);
                           record.wipe_timestamp                 = row.GetOptionalDouble(5);
                           tags                                  = row.GetOptionalText(6);
                         }

                         // rows written before the index columns existed
                         if (last_materialization && (!record.last_materialization_timestamp || !tags)) {
                           auto entry = serdes::Deserialize<model::EventLogEntry>(*last_materialization, registry_);
                           if (!record.last_materialization_timestamp) {
                             record.last_materialization_timestamp = entry.timestamp;
                           }
                           if (!tags) {
                             auto columns = ExtractIndexColumns(entry, registry_);
                             if (columns.materialization) record.tags = columns.materialization->tags;
                           }
                         }
                         if (tags) {
                           record.tags = serdes::Deserialize<std::map<std::string, std::string>>(*tags, registry_);
                         }
                         if (!record.wipe_timestamp && details) {
                           record.wipe_timestamp =
                               serdes::Deserialize<model::AssetDetails>(*details, registry_).last_wipe_timestamp;
                         }
                         out.push_back(std::move(record));
                       }),
      "query asset keys");
  return out;
}

std::optional<model::AssetKeyRecord> EventLogStorage::GetAssetRecord(const model::AssetKey& asset_key) {
  auto tx      = database_->Begin(db::TxMode::kRead);
  auto records = QueryAssetRecords(*tx, asset_key);
  tx->Commit();
  if (records.empty()) return std::nullopt;
  return std::move(records.front());
}

bool EventLogStorage::HasAssetKey(const model::AssetKey& asset_key) {
  auto record = GetAssetRecord(asset_key);
  return record && record->IsPresent();
}

std::vector<model::AssetKey> EventLogStorage::AllAssetKeys() {
  auto tx      = database_->Begin(db::TxMode::kRead);
  auto records = QueryAssetRecords(*tx, std::nullopt);
  tx->Commit();

  std::vector<model::AssetKey> out;
  for (auto& record : records) {
    if (record.IsPresent()) out.push_back(std::move(record.asset_key));
  }
  std::sort(out.begin(), out.end());
  return out;
}

// ------------------------------------------------------------------
// Secondary indexes
// ------------------------------------------------------------------

bool EventLogStorage::HasBuiltIndex(const std::string& name) {
  auto tx    = database_->Begin(db::TxMode::kRead);
  bool built = index_table_.IsBuilt(*tx, name);
  tx->Commit();
  return built;
}

backfill::BackfillSummary EventLogStorage::Reindex(bool force_rebuild_all, int batch_size) {
  const auto state = migrations_->CheckWritable(StorageDomain::kEventLogs);

  EventIndexColumnsMigration    event_columns(database_, index_table_, registry_);
  AssetKeyIndexColumnsMigration asset_columns(database_, index_table_, registry_);

  std::vector<backfill::DataMigration*> migrations = {&event_columns};
  if (state.IsApplied(migration::schema::kEventLogsAssetIndexColumns)) {
    migrations.push_back(&asset_columns);
  } else {
    RUNVAULT_LOG_INFO("asset index columns not present, skipping backfill",
                      {StringField("migration", kAssetKeyIndexColumns),
                       StringField("revision", migration::schema::kEventLogsAssetIndexColumns)});
  }

  backfill::BackfillCoordinator coordinator(batch_size);
  return coordinator.Run(migrations, force_rebuild_all);
}

} // namespace runvault::storage
