#include "internal/backfill/backfill_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runvault::backfill {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

int64_t BackfillSummary::TotalMigrated() const {
  int64_t total = 0;
  for (const auto& m : migrations) total += m.migrated;
  return total;
}

int64_t BackfillSummary::TotalMalformed() const {
  int64_t total = 0;
  for (const auto& m : migrations) total += m.malformed;
  return total;
}

BackfillCoordinator::BackfillCoordinator(int batch_size) : batch_size_(batch_size > 0 ? batch_size : 500) {
}

BackfillSummary BackfillCoordinator::Run(const std::vector<DataMigration*>& migrations, bool force_rebuild_all) {
  BackfillSummary summary;
  for (auto* migration : migrations) {
    summary.migrations.push_back(RunOne(*migration, force_rebuild_all));
  }
  return summary;
}

MigrationSummary BackfillCoordinator::RunOne(DataMigration& migration, bool force_rebuild_all) {
  MigrationSummary out;
  out.name = migration.name();

  auto& db    = migration.database();
  auto& index = migration.index_table();

  int64_t cursor = 0;
  {
    auto tx = db.Begin();
    if (!index.Exists(*tx)) {
      throw util::InvariantViolation("cannot run " + out.name + ": " + index.table() +
                                     " does not exist, upgrade the schema first");
    }
    if (force_rebuild_all) {
      index.Reset(*tx, out.name);
    } else if (index.IsBuilt(*tx, out.name)) {
      tx->Commit();
      out.skipped = true;
      RUNVAULT_LOG_DEBUG("data migration already complete", {StringField("migration", out.name)});
      return out;
    }
    cursor = index.LastProcessedId(*tx, out.name).value_or(0);
    tx->Commit();
  }

  if (cursor > 0) {
    RUNVAULT_LOG_INFO("resuming data migration", {StringField("migration", out.name), IntField("after_id", cursor)});
  }

  for (;;) {
    std::vector<int64_t> ids;
    {
      auto scan = db.Begin();
      ids       = migration.CandidateIds(*scan, cursor, batch_size_);
      if (ids.empty()) {
        index.MarkBuilt(*scan, out.name);
        scan->Commit();
        break;
      }
      scan->Commit();
    }

    migration.PrepareBatch(ids);

    auto tx      = db.Begin();
    auto outcome = migration.ApplyBatch(*tx, ids);
    cursor       = ids.back();
    index.SaveProgress(*tx, out.name, cursor);
    tx->Commit();

    out.migrated += outcome.migrated;
    out.malformed += outcome.malformed;
    ++out.batches;
    RUNVAULT_LOG_DEBUG("data migration batch", {StringField("migration", out.name), IntField("last_id", cursor),
                                                IntField("rows", static_cast<int64_t>(ids.size()))});
  }

  RUNVAULT_LOG_INFO("data migration complete", {StringField("migration", out.name),
                                                 IntField("migrated", out.migrated),
                                                 IntField("malformed", out.malformed),
                                                 IntField("batches", out.batches),
                                                 BoolField("forced", force_rebuild_all)});
  return out;
}

} // namespace runvault::backfill
