#include "internal/backfill/data_migration.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runvault::backfill {

BatchOutcome DataMigration::ApplyBatch(db::Transaction& tx, const std::vector<int64_t>& ids) {
  BatchOutcome outcome;
  for (auto id : ids) {
    try {
      MigrateRow(tx, id);
      ++outcome.migrated;
    } catch (const util::MalformedRecord& e) {
      ++outcome.malformed;
      RUNVAULT_LOG_WARN("skipping malformed row", {observability::StringField("migration", name()),
                                                   observability::IntField("row_id", e.row_id()),
                                                   observability::StringField("error", e.what())});
    }
  }
  return outcome;
}

} // namespace runvault::backfill
