#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/backfill/secondary_index.hpp"
#include "internal/db/api/database.hpp"

namespace runvault::backfill {

struct BatchOutcome {
  int64_t migrated  = 0;
  int64_t malformed = 0;
};

/*
  One resumable recomputation over a table's rows, walked in ascending
  id order. Implementations must be idempotent per row: a batch may be
  replayed after a crash between ApplyBatch and the cursor commit.
*/
class DataMigration {
 public:
  virtual ~DataMigration() = default;

  virtual std::string name() const = 0;

  virtual db::Database&        database()     = 0;
  virtual SecondaryIndexTable& index_table()  = 0;

  virtual std::vector<int64_t> CandidateIds(db::Transaction& tx, int64_t after_id, int batch_size) = 0;

  // Runs between the candidate scan and the batch transaction, with no
  // transaction open on database(). Reads other stores here, never inside
  // ApplyBatch: they may share this database's connection.
  virtual void PrepareBatch(const std::vector<int64_t>& ids) {
    (void)ids;
  }

  // Default: MigrateRow per id; util::MalformedRecord is counted and the
  // row skipped.
  virtual BatchOutcome ApplyBatch(db::Transaction& tx, const std::vector<int64_t>& ids);

 protected:
  virtual void MigrateRow(db::Transaction& tx, int64_t id) = 0;
};

} // namespace runvault::backfill
