#include "internal/db/sql/dialect.hpp"
#include "internal/migration/schema/schema.hpp"

namespace runvault::migration::schema {

using db::sql::AutoIncrementPrimaryKey;

MigrationChain RunsChain() {
  std::vector<MigrationStep> steps;

  steps.push_back(MigrationStep{
      .revision      = kRunsInitial,
      .down_revision = "",
      .description   = "runs and run_tags",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            const auto pk = AutoIncrementPrimaryKey(db.dialect());
            ExecStatements(db, tx,
                           {
                               "CREATE TABLE runs ("
                               " id " + pk + ","
                               " run_id VARCHAR(255) NOT NULL UNIQUE,"
                               " snapshot_id VARCHAR(255),"
                               " pipeline_name TEXT,"
                               " status VARCHAR(63),"
                               " run_body TEXT NOT NULL,"
                               " create_timestamp DOUBLE PRECISION NOT NULL,"
                               " update_timestamp DOUBLE PRECISION NOT NULL)",
                               "CREATE TABLE run_tags ("
                               " id " + pk + ","
                               " run_id VARCHAR(255) REFERENCES runs(run_id) ON DELETE CASCADE,"
                               " key TEXT NOT NULL,"
                               " value TEXT)",
                               "CREATE INDEX idx_run_tags ON run_tags(key, value)",
                               "CREATE INDEX idx_run_tags_run_id ON run_tags(run_id)",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx, {"DROP TABLE run_tags", "DROP TABLE runs"});
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kRunsSnapshots,
      .down_revision = kRunsInitial,
      .description   = "content-addressed job and plan snapshots",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "CREATE TABLE snapshots ("
                               " id " + AutoIncrementPrimaryKey(db.dialect()) + ","
                               " snapshot_id VARCHAR(255) NOT NULL UNIQUE,"
                               " snapshot_body TEXT NOT NULL,"
                               " snapshot_type VARCHAR(63) NOT NULL)",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx, {"DROP TABLE snapshots"});
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kRunsPartitionColumns,
      .down_revision = kRunsSnapshots,
      .description   = "partition columns on runs, backfilled by the run_partitions data migration",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "ALTER TABLE runs ADD COLUMN partition TEXT",
                               "ALTER TABLE runs ADD COLUMN partition_set TEXT",
                               "CREATE INDEX idx_run_partitions ON runs(partition_set, partition)",
                               "CREATE TABLE runs_secondary_indexes ("
                               " id " + AutoIncrementPrimaryKey(db.dialect()) + ","
                               " name VARCHAR(512) NOT NULL UNIQUE,"
                               " create_timestamp DOUBLE PRECISION NOT NULL,"
                               " migration_completed DOUBLE PRECISION,"
                               " last_processed_id BIGINT)",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "DROP TABLE runs_secondary_indexes",
                               "DROP INDEX idx_run_partitions",
                               "ALTER TABLE runs DROP COLUMN partition_set",
                               "ALTER TABLE runs DROP COLUMN partition",
                           });
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kRunsBulkActions,
      .down_revision = kRunsPartitionColumns,
      .description   = "bulk_actions: partition backfill requests",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "CREATE TABLE bulk_actions ("
                               " id " + AutoIncrementPrimaryKey(db.dialect()) + ","
                               " key VARCHAR(32) NOT NULL UNIQUE,"
                               " status VARCHAR(255) NOT NULL,"
                               " timestamp DOUBLE PRECISION NOT NULL,"
                               " body TEXT)",
                               "CREATE INDEX idx_bulk_actions_status ON bulk_actions(status)",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx, {"DROP TABLE bulk_actions"});
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kRunsModeColumn,
      .down_revision = kRunsBulkActions,
      .description   = "mode column on runs",
      .optional      = true,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx, {"ALTER TABLE runs ADD COLUMN mode TEXT"});
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx, {"ALTER TABLE runs DROP COLUMN mode"});
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kRunsRunStats,
      .down_revision = kRunsModeColumn,
      .description   = "start_time / end_time on runs, backfilled by the run_start_end_overwritten data migration",
      .optional      = true,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "ALTER TABLE runs ADD COLUMN start_time DOUBLE PRECISION",
                               "ALTER TABLE runs ADD COLUMN end_time DOUBLE PRECISION",
                               // new columns are empty whatever an earlier backfill recorded
                               "DELETE FROM runs_secondary_indexes WHERE name = 'run_start_end_overwritten'",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "ALTER TABLE runs DROP COLUMN end_time",
                               "ALTER TABLE runs DROP COLUMN start_time",
                           });
          },
  });

  return MigrationChain(std::move(steps));
}

MigrationChain ChainFor(StorageDomain domain) {
  switch (domain) {
    case StorageDomain::kRuns:
      return RunsChain();
    case StorageDomain::kEventLogs:
      return EventLogsChain();
    case StorageDomain::kInstigators:
      return InstigatorsChain();
  }
  return RunsChain();
}

} // namespace runvault::migration::schema
