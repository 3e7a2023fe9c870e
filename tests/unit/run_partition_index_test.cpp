#include "internal/backfill/backfill_coordinator.hpp"
#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/migration/migration_manager.hpp"
#include "internal/model/registry.hpp"
#include "internal/storage/run/run_data_migrations.hpp"
#include "internal/storage/run/run_storage.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using runvault::backfill::BackfillCoordinator;
using runvault::backfill::BatchOutcome;
using runvault::backfill::DataMigration;
using runvault::backfill::SecondaryIndexTable;
using runvault::migration::MigrationManager;
using runvault::storage::RunPartitionsMigration;
using runvault::storage::RunStorage;
namespace db    = runvault::db;
namespace model = runvault::model;

struct Fixture {
  std::shared_ptr<db::Database> database =
      std::make_shared<db::sqlite::SqliteDatabase>(std::make_shared<db::sqlite::SqliteDB>(":memory:"));
  std::shared_ptr<MigrationManager> migrations = std::make_shared<MigrationManager>();
  RunStorage                        runs{database, migrations, model::DefaultRegistry()};

  void Exec(const std::string& sql) {
    auto tx = database->Begin();
    db::ThrowIfDbError(database->Exec(*tx, sql), sql);
    tx->Commit();
  }

  // what a database written before the partition columns looks like
  void ForgetPartitionIndex() {
    Exec("UPDATE runs SET partition = NULL, partition_set = NULL");
    Exec("DELETE FROM runs_secondary_indexes");
  }
};

void AddPartitionedRuns(RunStorage& runs) {
  const std::vector<std::pair<std::string, std::string>> rows = {
      {"r1", "2024-01-01"}, {"r2", "2024-01-02"}, {"r3", "2024-01-01"}, {"r4", ""}, {"r5", "2024-01-01"},
  };
  for (const auto& [run_id, partition] : rows) {
    model::Run run;
    run.run_id   = run_id;
    run.job_name = "partitioned_job";
    if (!partition.empty()) {
      run.tags[model::kPartitionTag]    = partition;
      run.tags[model::kPartitionSetTag] = run_id == "r5" ? "other_set" : "daily";
    }
    runs.AddRun(run);
  }
}

std::vector<std::string> RunIds(const std::vector<model::Run>& runs) {
  std::vector<std::string> out;
  for (const auto& run : runs) out.push_back(run.run_id);
  return out;
}

void TestPartitionQueriesMatchOnBothPaths() {
  Fixture f;
  AddPartitionedRuns(f.runs);
  assert(f.runs.HasBuiltIndex(RunStorage::kRunPartitionsIndex));

  model::RunsFilter by_partition;
  by_partition.partition = "2024-01-01";

  model::RunsFilter by_set_and_partition;
  by_set_and_partition.partition     = "2024-01-01";
  by_set_and_partition.partition_set = "daily";

  const auto indexed     = RunIds(f.runs.GetRuns(by_partition));
  const auto indexed_set = RunIds(f.runs.GetRuns(by_set_and_partition));
  assert(indexed == (std::vector<std::string>{"r5", "r3", "r1"}));
  assert(indexed_set == (std::vector<std::string>{"r3", "r1"}));

  f.ForgetPartitionIndex();
  assert(!f.runs.HasBuiltIndex(RunStorage::kRunPartitionsIndex));
  assert(RunIds(f.runs.GetRuns(by_partition)) == indexed);
  assert(RunIds(f.runs.GetRuns(by_set_and_partition)) == indexed_set);
  assert(f.runs.GetRunsCount(by_partition) == 3);

  auto summary = f.runs.Migrate();
  assert(!summary.skipped);
  assert(summary.migrated == 5);
  assert(summary.malformed == 0);
  assert(f.runs.HasBuiltIndex(RunStorage::kRunPartitionsIndex));

  assert(RunIds(f.runs.GetRuns(by_partition)) == indexed);
  assert(RunIds(f.runs.GetRuns(by_set_and_partition)) == indexed_set);

  // the columns really were filled
  int64_t filled = 0;
  auto    tx     = f.database->Begin();
  db::ThrowIfDbError(f.database->Query(*tx, "SELECT COUNT(*) FROM runs WHERE partition IS NOT NULL;", {},
                                       [&](const db::sql::Row& row) { filled = row.GetInt64(0); }),
                     "count partitions");
  tx->Commit();
  assert(filled == 4);
}

void TestCompletedMigrationIsSkippedUnlessForced() {
  Fixture f;
  AddPartitionedRuns(f.runs);

  auto skipped = f.runs.Migrate();
  assert(skipped.skipped);
  assert(skipped.migrated == 0);

  auto forced = f.runs.Migrate(true, 2);
  assert(!forced.skipped);
  assert(forced.migrated == 5);
  assert(forced.batches == 3);
}

// Fails on a chosen batch, as a crash would.
class InterruptedMigration final : public DataMigration {
 public:
  InterruptedMigration(DataMigration& inner, int fail_on_batch) : inner_(inner), fail_on_batch_(fail_on_batch) {
  }

  std::string name() const override {
    return inner_.name();
  }
  db::Database& database() override {
    return inner_.database();
  }
  SecondaryIndexTable& index_table() override {
    return inner_.index_table();
  }
  std::vector<int64_t> CandidateIds(db::Transaction& tx, int64_t after_id, int batch_size) override {
    return inner_.CandidateIds(tx, after_id, batch_size);
  }
  BatchOutcome ApplyBatch(db::Transaction& tx, const std::vector<int64_t>& ids) override {
    if (++batches_ == fail_on_batch_) {
      throw std::runtime_error("process killed");
    }
    return inner_.ApplyBatch(tx, ids);
  }

 protected:
  void MigrateRow(db::Transaction&, int64_t) override {
  }

 private:
  DataMigration& inner_;
  int            fail_on_batch_;
  int            batches_ = 0;
};

void TestInterruptedBackfillResumes() {
  Fixture f;
  AddPartitionedRuns(f.runs);
  f.ForgetPartitionIndex();

  SecondaryIndexTable    index(f.database, "runs_secondary_indexes");
  RunPartitionsMigration partitions(f.database, index, model::DefaultRegistry());
  InterruptedMigration   interrupted(partitions, 2);

  bool threw = false;
  try {
    BackfillCoordinator(2).RunOne(interrupted);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto records = f.runs.GetRunRecords();
  // newest first: the second oldest row closes the first batch
  const int64_t first_batch_end = records[records.size() - 2].storage_id;

  {
    auto tx = f.database->Begin();
    assert(index.LastProcessedId(*tx, RunStorage::kRunPartitionsIndex) == std::optional<int64_t>(first_batch_end));
    assert(!index.IsBuilt(*tx, RunStorage::kRunPartitionsIndex));
    tx->Commit();
  }
  assert(!f.runs.HasBuiltIndex(RunStorage::kRunPartitionsIndex));

  auto resumed = f.runs.Migrate(false, 2);
  assert(resumed.migrated == 3);
  assert(resumed.batches == 2);
  assert(f.runs.HasBuiltIndex(RunStorage::kRunPartitionsIndex));

  model::RunsFilter filter;
  filter.partition = "2024-01-02";
  assert(RunIds(f.runs.GetRuns(filter)) == std::vector<std::string>{"r2"});
}

void TestMalformedRunBodyIsCountedAndSkipped() {
  Fixture f;
  AddPartitionedRuns(f.runs);
  f.ForgetPartitionIndex();
  f.Exec("UPDATE runs SET run_body = '{\"__class__\": \"NotARun\"}' WHERE run_id = 'r2'");

  auto summary = f.runs.Migrate();
  assert(summary.malformed == 1);
  assert(summary.migrated == 4);
  assert(f.runs.HasBuiltIndex(RunStorage::kRunPartitionsIndex));

  model::RunsFilter filter;
  filter.partition = "2024-01-01";
  assert(f.runs.GetRunsCount(filter) == 3);
}

void TestCoordinatorRunsSeveralMigrations() {
  Fixture f;
  AddPartitionedRuns(f.runs);
  f.ForgetPartitionIndex();

  SecondaryIndexTable    index(f.database, "runs_secondary_indexes");
  RunPartitionsMigration partitions(f.database, index, model::DefaultRegistry());

  auto summary = BackfillCoordinator(100).Run({&partitions});
  assert(summary.migrations.size() == 1);
  assert(summary.TotalMigrated() == 5);
  assert(summary.TotalMalformed() == 0);
  assert(summary.migrations[0].name == RunStorage::kRunPartitionsIndex);
}

} // namespace

int main() {
  TestPartitionQueriesMatchOnBothPaths();
  TestCompletedMigrationIsSkippedUnlessForced();
  TestInterruptedBackfillResumes();
  TestMalformedRunBodyIsCountedAndSkipped();
  TestCoordinatorRunsSeveralMigrations();

  std::cout << "runvault_unit_run_partition_index: pass\n";
  return 0;
}
