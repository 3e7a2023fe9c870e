#include "internal/storage/run/run_data_migrations.hpp"

#include "internal/model/event.hpp"
#include "internal/model/run.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/storage/common/sql_where.hpp"
#include "internal/storage/event/event_log_storage.hpp"
#include "internal/storage/run/run_storage.hpp"
#include "internal/util/errors.hpp"

namespace runvault::storage {

namespace {

std::vector<int64_t> ScanRunIds(db::Database& database, db::Transaction& tx, int64_t after_id, int batch_size) {
  std::vector<int64_t> ids;
  db::ThrowIfDbError(database.Query(tx, "SELECT id FROM runs WHERE id > ? ORDER BY id ASC LIMIT ?;",
                                    {after_id, static_cast<int64_t>(batch_size)},
                                    [&](const db::sql::Row& row) { ids.push_back(row.GetInt64(0)); }),
                     "scan runs");
  return ids;
}

bool IsRunEnd(const std::string& event_type) {
  return event_type == model::event_type::kRunSuccess || event_type == model::event_type::kRunFailure ||
         event_type == model::event_type::kRunCanceled;
}

} // namespace

RunPartitionsMigration::RunPartitionsMigration(std::shared_ptr<db::Database> database,
                                               backfill::SecondaryIndexTable& index_table,
                                               const serdes::Registry& registry)
    : database_(std::move(database)), index_table_(index_table), registry_(registry) {
}

std::string RunPartitionsMigration::name() const {
  return RunStorage::kRunPartitionsIndex;
}

std::vector<int64_t> RunPartitionsMigration::CandidateIds(db::Transaction& tx, int64_t after_id, int batch_size) {
  return ScanRunIds(*database_, tx, after_id, batch_size);
}

void RunPartitionsMigration::MigrateRow(db::Transaction& tx, int64_t id) {
  std::string body;
  db::ThrowIfDbError(database_->Query(tx, "SELECT run_body FROM runs WHERE id = ?;", {id},
                                      [&](const db::sql::Row& row) { body = row.GetText(0); }),
                     "read run body");

  model::Run run;
  try {
    run = serdes::Deserialize<model::Run>(body, registry_);
  } catch (const util::SerializationError& e) {
    throw util::MalformedRecord(id, e.what());
  }

  db::ThrowIfDbError(database_->Exec(tx, "UPDATE runs SET partition = ?, partition_set = ? WHERE id = ?;",
                                     {OptionalParam(run.partition()), OptionalParam(run.partition_set()), id}),
                     "update run partition");
}

RunStartEndMigration::RunStartEndMigration(std::shared_ptr<db::Database> database,
                                           backfill::SecondaryIndexTable& index_table, EventLogStorage& events)
    : database_(std::move(database)), index_table_(index_table), events_(events) {
}

std::string RunStartEndMigration::name() const {
  return RunStorage::kRunStartEndIndex;
}

std::vector<int64_t> RunStartEndMigration::CandidateIds(db::Transaction& tx, int64_t after_id, int batch_size) {
  return ScanRunIds(*database_, tx, after_id, batch_size);
}

void RunStartEndMigration::PrepareBatch(const std::vector<int64_t>& ids) {
  batch_times_.clear();
  if (ids.empty()) return;

  std::map<int64_t, std::string> run_ids;
  {
    auto tx = database_->Begin(db::TxMode::kRead);
    db::ThrowIfDbError(database_->Query(*tx, "SELECT id, run_id FROM runs WHERE id >= ? AND id <= ?;",
                                        {ids.front(), ids.back()},
                                        [&](const db::sql::Row& row) { run_ids[row.GetInt64(0)] = row.GetText(1); }),
                       "read run ids");
    tx->Commit();
  }

  for (const auto& [id, run_id] : run_ids) {
    RunTimes times;
    auto     reader = events_.LogReader(run_id);
    while (auto record = reader.Next()) {
      const auto type = record->entry.event_type();
      if (!type) continue;
      if (*type == model::event_type::kRunStart && !times.start_time) {
        times.start_time = record->entry.timestamp;
      } else if (IsRunEnd(*type)) {
        times.end_time = record->entry.timestamp;
      }
    }
    batch_times_[id] = times;
  }
}

void RunStartEndMigration::MigrateRow(db::Transaction& tx, int64_t id) {
  auto it = batch_times_.find(id);
  if (it == batch_times_.end()) {
    // deleted since the scan
    return;
  }

  const auto& times = it->second;
  db::ThrowIfDbError(database_->Exec(tx,
                                     "UPDATE runs SET start_time = COALESCE(?, start_time),"
                                     " end_time = COALESCE(?, end_time) WHERE id = ?;",
                                     {OptionalParam(times.start_time), OptionalParam(times.end_time), id}),
                     "update run times");
}

} // namespace runvault::storage
