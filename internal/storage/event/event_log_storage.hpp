#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/backfill/backfill_coordinator.hpp"
#include "internal/backfill/secondary_index.hpp"
#include "internal/db/api/database.hpp"
#include "internal/migration/migration_manager.hpp"
#include "internal/model/event.hpp"
#include "internal/serdes/registry.hpp"

namespace runvault::storage {

class EventLogStorage;

/*
  Lazy, restartable reader over one run's events in log_id order.

  Rows are fetched a page at a time. Next() returning nullopt only means
  "nothing more for now": events appended later are returned by later
  calls, so a reader can tail a live run.
*/
class EventLogReader {
 public:
  EventLogReader(EventLogStorage& storage, std::string run_id, std::optional<int64_t> cursor, int page_size);

  std::optional<model::EventLogRecord> Next();

  // log_id of the last record returned, or the starting cursor.
  std::optional<int64_t> cursor() const {
    return cursor_;
  }

 private:
  EventLogStorage&                  storage_;
  std::string                       run_id_;
  std::optional<int64_t>            cursor_;
  int                               page_size_;
  std::deque<model::EventLogRecord> buffer_;
};

/*
  EventLogStorage

  Append-only structured events over the `event_logs` domain, plus the
  per-asset index in `asset_keys`.

  log_id is run-scoped and assigned inside the insert transaction;
  storage_id (the row id) is global. step_key / asset_key / partition are
  parsed from the payload on write.

  Until event_logs_0005_asset_index_columns is applied, wipe state and
  last materialization live only in the asset_details /
  last_materialization payload columns. Reads merge both shapes.
*/
class EventLogStorage {
 public:
  static constexpr const char* kEventIndexColumns    = "event_index_columns";
  static constexpr const char* kAssetKeyIndexColumns = "asset_key_index_columns";

  EventLogStorage(std::shared_ptr<db::Database> database, std::shared_ptr<migration::MigrationManager> migrations,
                  const serdes::Registry& registry);

  // Returns the stored record (storage_id and log_id filled in).
  model::EventLogRecord StoreEvent(const model::EventLogEntry& entry);

  // Drops every event of the run. Asset records are left as they are.
  void DeleteEvents(const std::string& run_id);

  // Throws util::SchemaMismatch when the event_logs domain is not writable.
  void CheckWritable() const;

  // Events with log_id > cursor, ascending.
  std::vector<model::EventLogRecord> GetLogsForRun(const std::string& run_id,
                                                   std::optional<int64_t> cursor = std::nullopt,
                                                   std::optional<int> limit = std::nullopt);

  EventLogReader LogReader(const std::string& run_id, std::optional<int64_t> cursor = std::nullopt,
                           int page_size = 1000);

  std::vector<model::EventLogRecord> GetEventRecords(const model::EventRecordsFilter& filter = {},
                                                     std::optional<int> limit = std::nullopt, bool ascending = false);

  // ------------------------------------------------------------
  // Assets
  // ------------------------------------------------------------

  void RecordMaterialization(const model::AssetKey& asset_key, const std::string& run_id,
                             const std::map<std::string, std::string>& tags, double timestamp);

  void WipeAsset(const model::AssetKey& asset_key);

  bool HasAssetKey(const model::AssetKey& asset_key);

  // Present assets only, sorted.
  std::vector<model::AssetKey> AllAssetKeys();

  // Wiped assets are returned too; see AssetKeyRecord::IsPresent.
  std::optional<model::AssetKeyRecord> GetAssetRecord(const model::AssetKey& asset_key);

  // ------------------------------------------------------------
  // Secondary indexes
  // ------------------------------------------------------------

  bool HasBuiltIndex(const std::string& name);

  backfill::BackfillSummary Reindex(bool force_rebuild_all = false, int batch_size = 500);

  backfill::BackfillSummary MigrateEventLogData(int batch_size = 500) {
    return Reindex(false, batch_size);
  }

  db::Database& database() {
    return *database_;
  }

 private:
  bool HasAssetIndexColumns(db::Transaction& tx);

  void UpsertAssetRecord(db::Transaction& tx, bool index_columns, const model::AssetKey& asset_key,
                         const model::EventLogEntry& entry, const std::map<std::string, std::string>& tags);

  std::vector<model::AssetKeyRecord> QueryAssetRecords(db::Transaction& tx,
                                                       const std::optional<model::AssetKey>& asset_key);

  std::vector<model::EventLogRecord> QueryEvents(db::Transaction& tx, const std::string& sql,
                                                 const db::sql::Params& params);

  std::shared_ptr<db::Database>                database_;
  std::shared_ptr<migration::MigrationManager> migrations_;
  const serdes::Registry&                      registry_;
  backfill::SecondaryIndexTable                index_table_;
};

} // namespace runvault::storage
