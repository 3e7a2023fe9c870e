#include "internal/storage/run/run_storage.hpp"

#include "internal/migration/schema/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/storage/common/sql_where.hpp"
#include "internal/storage/run/run_data_migrations.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace runvault::storage {

using migration::StorageDomain;
using observability::StringField;

namespace {

constexpr const char* kSnapshotTable = "snapshots";

} // namespace

RunStorage::RunStorage(std::shared_ptr<db::Database> database,
                       std::shared_ptr<migration::MigrationManager> migrations, const serdes::Registry& registry)
    : database_(std::move(database)),
      migrations_(std::move(migrations)),
      registry_(registry),
      index_table_(database_, "runs_secondary_indexes") {
  if (!migrations_->HasDomain(StorageDomain::kRuns)) {
    migrations_->RegisterDomain(StorageDomain::kRuns, database_, migration::schema::RunsChain());
  }

  if (migrations_->EnsureInitialized(StorageDomain::kRuns)) {
    // a fresh database has no rows to backfill
    auto tx = database_->Begin();
    index_table_.MarkBuilt(*tx, kRunPartitionsIndex);
    index_table_.MarkBuilt(*tx, kRunStartEndIndex);
    tx->Commit();
  }
}

bool RunStorage::HasStatsColumns(db::Transaction& tx) {
  return database_->HasColumn(tx, "runs", "start_time");
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

model::Run RunStorage::AddRun(model::Run run) {
  if (run.run_id.empty()) {
    run.run_id = util::MakeNewRunId();
  }

  auto       tx    = database_->Begin();
  const auto state = migrations_->CheckWritable(StorageDomain::kRuns, *tx);

  if (run.job_snapshot_id) {
    bool found = false;
    db::ThrowIfDbError(database_->Query(*tx, "SELECT 1 FROM snapshots WHERE snapshot_id = ?;", {*run.job_snapshot_id},
                                        [&](const db::sql::Row&) { found = true; }),
                       "check snapshot");
    if (!found) {
      throw util::InvariantViolation("snapshot " + *run.job_snapshot_id + " does not exist in run storage");
    }
  }

  bool exists = false;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT 1 FROM runs WHERE run_id = ?;", {run.run_id},
                                      [&](const db::sql::Row&) { exists = true; }),
                     "check run");
  if (exists) {
    throw util::AlreadyExists("run " + run.run_id + " already exists");
  }

  const double    now     = util::NowSeconds();
  std::string     columns = "run_id, snapshot_id, pipeline_name, status, run_body, create_timestamp,"
                            " update_timestamp, partition, partition_set";
  std::string     marks   = "?, ?, ?, ?, ?, ?, ?, ?, ?";
  db::sql::Params params  = {run.run_id,
                             OptionalParam(run.job_snapshot_id),
                             run.job_name,
                             model::RunStatusName(run.status),
                             serdes::Serialize(run, registry_),
                             now,
                             now,
                             OptionalParam(run.partition()),
                             OptionalParam(run.partition_set())};
  if (state.IsApplied(migration::schema::kRunsModeColumn)) {
    columns += ", mode";
    marks += ", ?";
    params.emplace_back(OptionalParam(run.mode));
  }
  db::ThrowIfDbError(
      database_->Exec(*tx, "INSERT INTO runs (" + columns + ") VALUES (" + marks + ");", params),
      "insert run " + run.run_id);

  WriteTags(*tx, run.run_id, run.TagsForStorage());
  tx->Commit();
  return run;
}

void RunStorage::WriteTags(db::Transaction& tx, const std::string& run_id,
                           const std::map<std::string, std::string>& tags) {
  for (const auto& [key, value] : tags) {
    db::ThrowIfDbError(database_->Exec(tx, "DELETE FROM run_tags WHERE run_id = ? AND key = ?;", {run_id, key}),
                       "replace run tag");
    db::ThrowIfDbError(
        database_->Exec(tx, "INSERT INTO run_tags (run_id, key, value) VALUES (?, ?, ?);", {run_id, key, value}),
        "insert run tag");
  }
}

void RunStorage::UpdateRunStatus(const std::string& run_id, model::RunStatus status, std::optional<double> timestamp) {
  auto       tx    = database_->Begin();
  const auto state = migrations_->CheckWritable(StorageDomain::kRuns, *tx);

  std::optional<std::string> body;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT run_body FROM runs WHERE run_id = ?;", {run_id},
                                      [&](const db::sql::Row& row) { body = row.GetText(0); }),
                     "read run " + run_id);
  if (!body) {
    throw util::NotFound("run " + run_id + " not found");
  }

  auto run = serdes::Deserialize<model::Run>(*body, registry_);
  if (!model::IsExpectedTransition(run.status, status)) {
    RUNVAULT_LOG_WARN("out-of-order run status transition", {StringField("run_id", run_id),
                                                              StringField("from", model::RunStatusName(run.status)),
                                                              StringField("to", model::RunStatusName(status))});
  }

  const double now = timestamp.value_or(util::NowSeconds());
  run.status       = status;

  std::string     sql    = "UPDATE runs SET status = ?, run_body = ?, update_timestamp = ?";
  db::sql::Params params = {model::RunStatusName(status), serdes::Serialize(run, registry_), now};

  // run stats columns arrive with an optional step
  if (state.IsApplied(migration::schema::kRunsRunStats)) {
    if (status == model::RunStatus::kStarted) {
      sql += ", start_time = ?";
      params.emplace_back(now);
    } else if (model::IsTerminal(status)) {
      sql += ", end_time = ?";
      params.emplace_back(now);
    }
  }
  sql += " WHERE run_id = ?;";
  params.emplace_back(run_id);

  db::ThrowIfDbError(database_->Exec(*tx, sql, params), "update run " + run_id);
  tx->Commit();
}

void RunStorage::AddRunTags(const std::string& run_id, const std::map<std::string, std::string>& tags) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kRuns, *tx);

  std::optional<std::string> body;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT run_body FROM runs WHERE run_id = ?;", {run_id},
                                      [&](const db::sql::Row& row) { body = row.GetText(0); }),
                     "read run " + run_id);
  if (!body) {
    throw util::NotFound("run " + run_id + " not found");
  }

  auto run = serdes::Deserialize<model::Run>(*body, registry_);
  for (const auto& [key, value] : tags) {
    run.tags[key] = value;
  }

  db::ThrowIfDbError(database_->Exec(*tx,
                                     "UPDATE runs SET run_body = ?, update_timestamp = ?, partition = ?,"
                                     " partition_set = ? WHERE run_id = ?;",
                                     {serdes::Serialize(run, registry_), util::NowSeconds(),
                                      OptionalParam(run.partition()), OptionalParam(run.partition_set()), run_id}),
                     "update run tags " + run_id);
  WriteTags(*tx, run_id, tags);
  tx->Commit();
}

void RunStorage::DeleteRun(const std::string& run_id) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kRuns, *tx);
  db::ThrowIfDbError(database_->Exec(*tx, "DELETE FROM run_tags WHERE run_id = ?;", {run_id}),
                     "delete run tags " + run_id);
  db::ThrowIfDbError(database_->Exec(*tx, "DELETE FROM runs WHERE run_id = ?;", {run_id}), "delete run " + run_id);
  tx->Commit();
}

void RunStorage::CheckWritable() const {
  migrations_->CheckWritable(StorageDomain::kRuns);
}

std::string RunStorage::AddSnapshot(const serdes::PackedValue& snapshot, const std::string& snapshot_type,
                                    const std::optional<std::string>& snapshot_id) {
  const auto id = snapshot_id.value_or(serdes::CreateSnapshotId(snapshot));

  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kRuns, *tx);
  db::ThrowIfDbError(database_->Exec(*tx,
                                     std::string("INSERT INTO ") + kSnapshotTable +
                                         " (snapshot_id, snapshot_body, snapshot_type) VALUES (?, ?, ?)"
                                         " ON CONFLICT (snapshot_id) DO NOTHING;",
                                     {id, snapshot.ToJson(), snapshot_type}),
                     "insert snapshot " + id);
  tx->Commit();
  return id;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

void RunStorage::ApplyFilter(db::Transaction& tx, const model::RunsFilter& filter, SqlWhere& where) {
  if (!filter.run_ids.empty()) {
    where.AddIn("run_id", filter.run_ids);
  }
  if (filter.job_name) {
    where.Add("pipeline_name = ?", {*filter.job_name});
  }
  if (!filter.statuses.empty()) {
    std::vector<std::string> names;
    for (auto status : filter.statuses) names.emplace_back(model::RunStatusName(status));
    where.AddIn("status", names);
  }
  if (filter.snapshot_id) {
    where.Add("snapshot_id = ?", {*filter.snapshot_id});
  }
  for (const auto& [key, value] : filter.tags) {
    where.Add("run_id IN (SELECT run_id FROM run_tags WHERE key = ? AND value = ?)", {key, value});
  }

  if (!filter.partition && !filter.partition_set) {
    return;
  }

  if (index_table_.IsBuilt(tx, kRunPartitionsIndex)) {
    if (filter.partition) where.Add("partition = ?", {*filter.partition});
    if (filter.partition_set) where.Add("partition_set = ?", {*filter.partition_set});
    return;
  }

  // columns not backfilled yet: partitions are still in the tags
  if (filter.partition) {
    where.Add("run_id IN (SELECT run_id FROM run_tags WHERE key = ? AND value = ?)",
              {std::string(model::kPartitionTag), *filter.partition});
  }
  if (filter.partition_set) {
    where.Add("run_id IN (SELECT run_id FROM run_tags WHERE key = ? AND value = ?)",
              {std::string(model::kPartitionSetTag), *filter.partition_set});
  }
}

std::vector<model::RunRecord> RunStorage::QueryRunRecords(db::Transaction& tx, const model::RunsFilter& filter,
                                                          const std::optional<std::string>& cursor,
                                                          std::optional<int> limit) {
  SqlWhere where;
  ApplyFilter(tx, filter, where);
  if (cursor) {
    bool known = false;
    db::ThrowIfDbError(database_->Query(tx, "SELECT 1 FROM runs WHERE run_id = ?;", {*cursor},
                                        [&](const db::sql::Row&) { known = true; }),
                       "check cursor");
    if (!known) {
      throw util::NotFound("cursor run " + *cursor + " not found");
    }
    where.Add("id < (SELECT id FROM runs WHERE run_id = ?)", {*cursor});
  }

  const bool stats = HasStatsColumns(tx);

  std::string sql = "SELECT id, run_body, status, create_timestamp, update_timestamp";
  if (stats) sql += ", start_time, end_time";
  sql += " FROM runs" + where.Render() + " ORDER BY id DESC";

  auto params = where.params();
  if (limit) {
    sql += " LIMIT ?";
    params.emplace_back(static_cast<int64_t>(*limit));
  }

  std::vector<model::RunRecord> out;
  db::ThrowIfDbError(database_->Query(tx, sql + ";", params,
                                      [&](const db::sql::Row& row) {
                                        model::RunRecord record;
                                        record.storage_id = row.GetInt64(0);
                                        record.run        = serdes::Deserialize<model::Run>(row.GetText(1), registry_);
                                        if (auto status = model::RunStatusFromName(row.GetText(2))) {
                                          record.run.status = *status;
                                        }
                                        record.create_timestamp = row.GetDouble(3);
                                        record.update_timestamp = row.GetDouble(4);
                                        if (stats) {
                                          record.start_time = row.GetOptionalDouble(5);
                                          record.end_time   = row.GetOptionalDouble(6);
                                        }
                                        out.push_back(std::move(record));
                                      }),
                     "query runs");
  return out;
}

std::vector<model::RunRecord> RunStorage::GetRunRecords(const model::RunsFilter& filter,
                                                        const std::optional<std::string>& cursor,
                                                        std::optional<int> limit) {
  auto tx  = database_->Begin(db::TxMode::kRead);
  auto out = QueryRunRecords(*tx, filter, cursor, limit);
  tx->Commit();
  return out;
}

std::vector<model::Run> RunStorage::GetRuns(const model::RunsFilter& filter, const std::optional<std::string>& cursor,
                                            std::optional<int> limit) {
  std::vector<model::Run> out;
  for (auto& record : GetRunRecords(filter, cursor, limit)) {
    out.push_back(std::move(record.run));
  }
  return out;
}

int64_t RunStorage::GetRunsCount(const model::RunsFilter& filter) {
  auto     tx = database_->Begin(db::TxMode::kRead);
  SqlWhere where;
  ApplyFilter(*tx, filter, where);

  int64_t count = 0;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT COUNT(*) FROM runs" + where.Render() + ";", where.params(),
                                      [&](const db::sql::Row& row) { count = row.GetInt64(0); }),
                     "count runs");
  tx->Commit();
  return count;
}

std::optional<model::RunRecord> RunStorage::GetRunRecord(const std::string& run_id) {
  model::RunsFilter filter;
  filter.run_ids = {run_id};
  auto records   = GetRunRecords(filter, std::nullopt, 1);
  if (records.empty()) return std::nullopt;
  return std::move(records.front());
}

std::optional<model::Run> RunStorage::GetRun(const std::string& run_id) {
  auto record = GetRunRecord(run_id);
  if (!record) return std::nullopt;
  return std::move(record->run);
}

bool RunStorage::HasRun(const std::string& run_id) {
  auto tx     = database_->Begin(db::TxMode::kRead);
  bool exists = false;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT 1 FROM runs WHERE run_id = ?;", {run_id},
                                      [&](const db::sql::Row&) { exists = true; }),
                     "check run");
  tx->Commit();
  return exists;
}

std::map<std::string, std::set<std::string>> RunStorage::GetRunTags() {
  auto tx = database_->Begin(db::TxMode::kRead);

  std::map<std::string, std::set<std::string>> out;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT DISTINCT key, value FROM run_tags;", {},
                                      [&](const db::sql::Row& row) {
                                        out[row.GetText(0)].insert(row.GetText(1));
                                      }),
                     "read run tags");
  tx->Commit();
  return out;
}

std::optional<std::pair<std::string, std::vector<model::Run>>> RunStorage::GetRunGroup(const std::string& run_id) {
  auto run = GetRun(run_id);
  if (!run) return std::nullopt;

  const std::string root = run->root_run_id.value_or(run->run_id);

  model::RunsFilter filter;
  filter.tags[model::kRootRunIdTag] = root;
  auto group                        = GetRuns(filter);

  if (auto root_run = GetRun(root)) {
    group.push_back(std::move(*root_run));
  }
  return std::make_pair(root, std::move(group));
}

bool RunStorage::HasSnapshot(const std::string& snapshot_id) {
  return GetSnapshot(snapshot_id).has_value();
}

std::optional<serdes::PackedValue> RunStorage::GetSnapshot(const std::string& snapshot_id) {
  auto tx = database_->Begin(db::TxMode::kRead);

  std::optional<std::string> body;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT snapshot_body FROM snapshots WHERE snapshot_id = ?;",
                                      {snapshot_id}, [&](const db::sql::Row& row) { body = row.GetText(0); }),
                     "read snapshot " + snapshot_id);
  tx->Commit();

  if (!body) return std::nullopt;
  return serdes::PackedValue::FromJson(*body);
}

// ------------------------------------------------------------------
// Bulk actions
// ------------------------------------------------------------------

void RunStorage::AddBackfill(const model::PartitionBackfill& backfill) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kRuns, *tx);

  bool exists = false;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT 1 FROM bulk_actions WHERE key = ?;", {backfill.backfill_id},
                                      [&](const db::sql::Row&) { exists = true; }),
                     "check backfill");
  if (exists) {
    throw util::AlreadyExists("backfill " + backfill.backfill_id + " already exists");
  }

  db::ThrowIfDbError(database_->Exec(*tx, "INSERT INTO bulk_actions (key, status, timestamp, body) VALUES (?, ?, ?, ?);",
                                     {backfill.backfill_id, model::BulkActionStatusName(backfill.status),
                                      backfill.backfill_timestamp, serdes::Serialize(backfill, registry_)}),
                     "insert backfill " + backfill.backfill_id);
  tx->Commit();
}

void RunStorage::UpdateBackfill(const model::PartitionBackfill& backfill) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kRuns, *tx);

  bool exists = false;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT 1 FROM bulk_actions WHERE key = ?;", {backfill.backfill_id},
                                      [&](const db::sql::Row&) { exists = true; }),
                     "check backfill");
  if (!exists) {
    throw util::NotFound("backfill " + backfill.backfill_id + " not found");
  }

  db::ThrowIfDbError(database_->Exec(*tx, "UPDATE bulk_actions SET status = ?, body = ? WHERE key = ?;",
                                     {model::BulkActionStatusName(backfill.status),
                                      serdes::Serialize(backfill, registry_), backfill.backfill_id}),
                     "update backfill " + backfill.backfill_id);
  tx->Commit();
}

std::optional<model::PartitionBackfill> RunStorage::GetBackfill(const std::string& backfill_id) {
  auto tx = database_->Begin(db::TxMode::kRead);

  std::optional<std::string> body;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT body FROM bulk_actions WHERE key = ?;", {backfill_id},
                                      [&](const db::sql::Row& row) { body = row.GetText(0); }),
                     "read backfill " + backfill_id);
  tx->Commit();

  if (!body) return std::nullopt;
  return serdes::Deserialize<model::PartitionBackfill>(*body, registry_);
}

std::vector<model::PartitionBackfill> RunStorage::GetBackfills(std::optional<model::BulkActionStatus> status,
                                                               const std::optional<std::string>& cursor,
                                                               std::optional<int> limit) {
  auto tx = database_->Begin(db::TxMode::kRead);

  SqlWhere where;
  if (status) {
    where.Add("status = ?", {std::string(model::BulkActionStatusName(*status))});
  }
  if (cursor) {
    where.Add("id < (SELECT id FROM bulk_actions WHERE key = ?)", {*cursor});
  }

  std::string sql    = "SELECT body FROM bulk_actions" + where.Render() + " ORDER BY id DESC";
  auto        params = where.params();
  if (limit) {
    sql += " LIMIT ?";
    params.emplace_back(static_cast<int64_t>(*limit));
  }

  std::vector<model::PartitionBackfill> out;
  db::ThrowIfDbError(database_->Query(*tx, sql + ";", params,
                                      [&](const db::sql::Row& row) {
                                        out.push_back(
                                            serdes::Deserialize<model::PartitionBackfill>(row.GetText(0), registry_));
                                      }),
                     "query backfills");
  tx->Commit();
  return out;
}

// ------------------------------------------------------------------
// Secondary indexes
// ------------------------------------------------------------------

bool RunStorage::HasBuiltIndex(const std::string& name) {
  auto tx    = database_->Begin(db::TxMode::kRead);
  bool built = index_table_.IsBuilt(*tx, name);
  tx->Commit();
  return built;
}

backfill::MigrationSummary RunStorage::Migrate(bool force_rebuild_all, int batch_size) {
  migrations_->CheckWritable(StorageDomain::kRuns);

  RunPartitionsMigration     partitions(database_, index_table_, registry_);
  backfill::BackfillCoordinator coordinator(batch_size);
  return coordinator.RunOne(partitions, force_rebuild_all);
}

backfill::MigrationSummary RunStorage::MigrateRunStats(EventLogStorage& events, bool force_rebuild_all,
                                                       int batch_size) {
  const auto state = migrations_->CheckWritable(StorageDomain::kRuns);
  if (!state.IsApplied(migration::schema::kRunsRunStats)) {
    throw util::InvariantViolation(std::string("cannot run ") + kRunStartEndIndex + ": " +
                                   migration::schema::kRunsRunStats + " is not applied, run `runvaultctl migrate`");
  }

  RunStartEndMigration          start_end(database_, index_table_, events);
  backfill::BackfillCoordinator coordinator(batch_size);
  return coordinator.RunOne(start_end, force_rebuild_all);
}

} // namespace runvault::storage
