#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/backfill/data_migration.hpp"
#include "internal/serdes/registry.hpp"

namespace runvault::storage {

class EventLogStorage;

// Recomputes runs.partition / runs.partition_set from each run body.
class RunPartitionsMigration final : public backfill::DataMigration {
 public:
  RunPartitionsMigration(std::shared_ptr<db::Database> database, backfill::SecondaryIndexTable& index_table,
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
  Overwrites runs.start_time / runs.end_time from the event log: the run
  start event gives start_time, the last success, failure or cancel event
  gives end_time. A run with neither keeps what its columns hold.

  The event log may live in another database, so events are read in
  PrepareBatch and only the UPDATEs run in the batch transaction.
*/
class RunStartEndMigration final : public backfill::DataMigration {
 public:
  RunStartEndMigration(std::shared_ptr<db::Database> database, backfill::SecondaryIndexTable& index_table,
                       EventLogStorage& events);

  std::string name() const override;

  db::Database& database() override {
    return *database_;
  }
  backfill::SecondaryIndexTable& index_table() override {
    return index_table_;
  }

  std::vector<int64_t> CandidateIds(db::Transaction& tx, int64_t after_id, int batch_size) override;

  void PrepareBatch(const std::vector<int64_t>& ids) override;

 protected:
  void MigrateRow(db::Transaction& tx, int64_t id) override;

 private:
  struct RunTimes {
    std::optional<double> start_time;
    std::optional<double> end_time;
  };

  std::shared_ptr<db::Database>  database_;
  backfill::SecondaryIndexTable& index_table_;
  EventLogStorage&               events_;
  std::map<int64_t, RunTimes>    batch_times_;
};

} // namespace runvault::storage
