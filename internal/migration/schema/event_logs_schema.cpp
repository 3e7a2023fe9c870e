#include "internal/db/sql/dialect.hpp"
#include "internal/migration/schema/schema.hpp"

namespace runvault::migration::schema {

using db::sql::AutoIncrementPrimaryKey;

MigrationChain EventLogsChain() {
  std::vector<MigrationStep> steps;

  steps.push_back(MigrationStep{
      .revision      = kEventLogsInitial,
      .down_revision = "",
      .description   = "append-only event_logs",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "CREATE TABLE event_logs ("
                               " id " + AutoIncrementPrimaryKey(db.dialect()) + ","
                               " run_id VARCHAR(255) NOT NULL,"
                               " log_id BIGINT NOT NULL,"
                               " event TEXT NOT NULL,"
                               " dagster_event_type TEXT,"
                               " timestamp DOUBLE PRECISION)",
                               "CREATE UNIQUE INDEX idx_event_logs_run_log ON event_logs(run_id, log_id)",
                               "CREATE INDEX idx_event_type ON event_logs(dagster_event_type, id)",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx, {"DROP TABLE event_logs"});
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kEventLogsStepKey,
      .down_revision = kEventLogsInitial,
      .description   = "step_key index column",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "ALTER TABLE event_logs ADD COLUMN step_key TEXT",
                               "CREATE INDEX idx_step_key ON event_logs(step_key)",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "DROP INDEX idx_step_key",
                               "ALTER TABLE event_logs DROP COLUMN step_key",
                           });
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kEventLogsAssetKeys,
      .down_revision = kEventLogsStepKey,
      .description   = "asset_key index column and asset_keys table",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "ALTER TABLE event_logs ADD COLUMN asset_key TEXT",
                               "CREATE INDEX idx_asset_key ON event_logs(asset_key)",
                               "CREATE TABLE asset_keys ("
                               " id " + AutoIncrementPrimaryKey(db.dialect()) + ","
                               " asset_key VARCHAR(512) NOT NULL UNIQUE,"
                               " last_materialization TEXT,"
                               " last_run_id VARCHAR(255),"
                               " asset_details TEXT,"
                               " create_timestamp DOUBLE PRECISION)",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "DROP TABLE asset_keys",
                               "DROP INDEX idx_asset_key",
                               "ALTER TABLE event_logs DROP COLUMN asset_key",
                           });
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kEventLogsPartition,
      .down_revision = kEventLogsAssetKeys,
      .description   = "partition index column, backfilled by the event_index_columns data migration",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "ALTER TABLE event_logs ADD COLUMN partition TEXT",
                               "CREATE INDEX idx_asset_partition ON event_logs(asset_key, partition)",
                               "CREATE TABLE event_logs_secondary_indexes ("
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
                               "DROP TABLE event_logs_secondary_indexes",
                               "DROP INDEX idx_asset_partition",
                               "ALTER TABLE event_logs DROP COLUMN partition",
                           });
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kEventLogsAssetIndexColumns,
      .down_revision = kEventLogsPartition,
      .description   = "asset_keys wipe / materialization columns, backfilled by asset_key_index_columns",
      .optional      = true,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "ALTER TABLE asset_keys ADD COLUMN last_materialization_timestamp DOUBLE PRECISION",
                               "ALTER TABLE asset_keys ADD COLUMN wipe_timestamp DOUBLE PRECISION",
                               "ALTER TABLE asset_keys ADD COLUMN tags TEXT",
                               // new columns start empty; any earlier backfill no longer counts
                               "DELETE FROM event_logs_secondary_indexes WHERE name = 'asset_key_index_columns'",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "ALTER TABLE asset_keys DROP COLUMN tags",
                               "ALTER TABLE asset_keys DROP COLUMN wipe_timestamp",
                               "ALTER TABLE asset_keys DROP COLUMN last_materialization_timestamp",
                           });
          },
  });

  return MigrationChain(std::move(steps));
}

} // namespace runvault::migration::schema
