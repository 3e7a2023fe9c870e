#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/backfill/data_migration.hpp"

namespace runvault::backfill {

struct MigrationSummary {
  std::string name;
  int64_t     migrated  = 0;
  int64_t     malformed = 0;
  int64_t     batches   = 0;
  bool        skipped   = false; // already built, not forced
};

struct BackfillSummary {
  std::vector<MigrationSummary> migrations;

  int64_t TotalMigrated() const;
  int64_t TotalMalformed() const;
};

/*
  BackfillCoordinator

  Runs data migrations batch by batch. Each batch commits its rows
  together with the migration's cursor, so an interrupted run resumes
  after the last committed batch. Candidates are scanned in their own
  transaction; DataMigration::PrepareBatch runs between the scan and the
  batch. Completed migrations are skipped
  unless force_rebuild_all, which restarts them from the first row.
*/
class BackfillCoordinator {
 public:
  explicit BackfillCoordinator(int batch_size = 500);

  BackfillSummary Run(const std::vector<DataMigration*>& migrations, bool force_rebuild_all = false);

  MigrationSummary RunOne(DataMigration& migration, bool force_rebuild_all = false);

 private:
  int batch_size_;
};

} // namespace runvault::backfill
