#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/backfill/data_migration.hpp"
#include "internal/serdes/registry.hpp"

namespace runvault::storage {

/*
  event_index_columns

  Recomputes event_logs.step_key / asset_key / partition from each event
  payload and makes sure every materialized asset has an asset_keys row.
*/
class EventIndexColumnsMigration final : public backfill::DataMigration {
 public:
  EventIndexColumnsMigration(std::shared_ptr<db::Database> database, backfill::SecondaryIndexTable& index_table,
                             const serdes::Registry& registry);

  std::string name() const override;

  db::Database& database() override {
    return *database_;
  }
  backfill::SecondaryIndexTable& index_table() override {
    return index_table_;
  }

  std::vector<int64_t> CandidateIds(db::Transaction& tx, int64_t after_id, int batch_size) override;

 protected:
  void MigrateRow(db::Transaction& tx, int64_t id) override;

 private:
  std::shared_ptr<db::Database>  database_;
  backfill::SecondaryIndexTable& index_table_;
  const serdes::Registry&        registry_;
};

/*
  asset_key_index_columns

  Copies the legacy asset_keys.last_materialization / asset_details
  payloads into last_materialization_timestamp, wipe_timestamp and tags.
  Columns already set are left alone.
*/
class AssetKeyIndexColumnsMigration final : public backfill::DataMigration {
 public:
  AssetKeyIndexColumnsMigration(std::shared_ptr<db::Database> database, backfill::SecondaryIndexTable& index_table,
                                const serdes::Registry& registry);

  std::string name() const override;

  db::Database& database() override {
    return *database_;
  }
  backfill::SecondaryIndexTable& index_table() override {
    return index_table_;
  }

  std::vector<int64_t> CandidateIds(db::Transaction& tx, int64_t after_id, int batch_size) override;

 protected:
  void MigrateRow(db::Transaction& tx, int64_t id) override;

 private:
  std::shared_ptr<db::Database>  database_;
  backfill::SecondaryIndexTable& index_table_;
  const serdes::Registry&        registry_;
};

} // namespace runvault::storage
