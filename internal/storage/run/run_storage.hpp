#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/backfill/backfill_coordinator.hpp"
#include "internal/backfill/secondary_index.hpp"
#include "internal/db/api/database.hpp"
#include "internal/migration/migration_manager.hpp"
#include "internal/model/bulk_action.hpp"
#include "internal/model/run.hpp"
#include "internal/serdes/registry.hpp"

namespace runvault::storage {

class EventLogStorage;
class SqlWhere;

/*
  RunStorage

  Run metadata over the `runs` domain.

  Tables:
    runs       one row per run; body is the serialized Run, status /
               job name / snapshot / partition columns are derived
    run_tags   one row per (run, tag)
    snapshots  content-addressed job and execution plan snapshots
    bulk_actions  partition backfill requests, keyed by backfill id

  Every mutating call checks the domain revision first and throws
  util::SchemaMismatch before touching any row. Reads return empty
  optionals for absent runs.

  runs.mode is written once the optional mode column step is applied.

  Partition filters use runs.partition / runs.partition_set once the
  run_partitions index is built and scan run_tags before that; both
  paths return the same rows.
*/
class RunStorage {
 public:
  static constexpr const char* kRunPartitionsIndex = "run_partitions";
  static constexpr const char* kRunStartEndIndex   = "run_start_end_overwritten";

  RunStorage(std::shared_ptr<db::Database> database, std::shared_ptr<migration::MigrationManager> migrations,
             const serdes::Registry& registry);

  // ------------------------------------------------------------
  // Writes
  // ------------------------------------------------------------

  // Assigns a fresh run id when none is set. Throws util::AlreadyExists for
  // a duplicate run id.
  model::Run AddRun(model::Run run);

  // Out-of-order transitions are logged and applied. Throws
  // util::NotFound for an unknown run.
  void UpdateRunStatus(const std::string& run_id, model::RunStatus status,
                       std::optional<double> timestamp = std::nullopt);

  void AddRunTags(const std::string& run_id, const std::map<std::string, std::string>& tags);

  // Removes the run and its tags. Snapshots stay; they may be shared.
  void DeleteRun(const std::string& run_id);

  // Throws util::SchemaMismatch when the runs domain is not writable.
  void CheckWritable() const;

  // Returns the snapshot id (SHA-1 of the snapshot unless given).
  std::string AddSnapshot(const serdes::PackedValue& snapshot, const std::string& snapshot_type,
                          const std::optional<std::string>& snapshot_id = std::nullopt);

  // ------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------

  bool HasRun(const std::string& run_id);
  std::optional<model::Run>       GetRun(const std::string& run_id);
  std::optional<model::RunRecord> GetRunRecord(const std::string& run_id);

  // Newest first. `cursor` is the run id of the last row of the previous
  // page; an unknown cursor throws util::NotFound.
  std::vector<model::Run>       GetRuns(const model::RunsFilter& filter = {},
                                        const std::optional<std::string>& cursor = std::nullopt,
                                        std::optional<int> limit = std::nullopt);
  std::vector<model::RunRecord> GetRunRecords(const model::RunsFilter& filter = {},
                                              const std::optional<std::string>& cursor = std::nullopt,
                                              std::optional<int> limit = std::nullopt);
  int64_t GetRunsCount(const model::RunsFilter& filter = {});

  // tag key -> distinct values
  std::map<std::string, std::set<std::string>> GetRunTags();

  // Root run id and every run sharing it (retry lineage).
  std::optional<std::pair<std::string, std::vector<model::Run>>> GetRunGroup(const std::string& run_id);

  bool HasSnapshot(const std::string& snapshot_id);
  std::optional<serdes::PackedValue> GetSnapshot(const std::string& snapshot_id);

  // ------------------------------------------------------------
  // Bulk actions
  // ------------------------------------------------------------

  // Throws util::AlreadyExists for a duplicate backfill id.
  void AddBackfill(const model::PartitionBackfill& backfill);

  // Throws util::NotFound for an unknown backfill id.
  void UpdateBackfill(const model::PartitionBackfill& backfill);

  std::optional<model::PartitionBackfill> GetBackfill(const std::string& backfill_id);

  // Newest first. `cursor` is the backfill id of the last row of the previous page.
  std::vector<model::PartitionBackfill> GetBackfills(std::optional<model::BulkActionStatus> status = std::nullopt,
                                                     const std::optional<std::string>& cursor = std::nullopt,
                                                     std::optional<int> limit = std::nullopt);

  // ------------------------------------------------------------
  // Secondary indexes
  // ------------------------------------------------------------

  bool HasBuiltIndex(const std::string& name);

  // Rebuilds the partition columns over every run row.
  backfill::MigrationSummary Migrate(bool force_rebuild_all = false, int batch_size = 500);

  // Fills start_time / end_time from each run's events. Needs
  // runs_0006_run_stats; throws util::InvariantViolation before it.
  backfill::MigrationSummary MigrateRunStats(EventLogStorage& events, bool force_rebuild_all = false,
                                             int batch_size = 500);

  db::Database& database() {
    return *database_;
  }

 private:
  std::vector<model::RunRecord> QueryRunRecords(db::Transaction& tx, const model::RunsFilter& filter,
                                                const std::optional<std::string>& cursor, std::optional<int> limit);
  void ApplyFilter(db::Transaction& tx, const model::RunsFilter& filter, SqlWhere& where);
  void WriteTags(db::Transaction& tx, const std::string& run_id, const std::map<std::string, std::string>& tags);
  bool HasStatsColumns(db::Transaction& tx);

  std::shared_ptr<db::Database>               database_;
  std::shared_ptr<migration::MigrationManager> migrations_;
  const serdes::Registry&                     registry_;
  backfill::SecondaryIndexTable               index_table_;
};

} // namespace runvault::storage
