#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/database.hpp"

namespace runvault::backfill {

/*
  Rows of a domain's `<domain>_secondary_indexes` table.

  One row per named data migration: created on the first committed
  batch, last_processed_id advanced with every batch, migration_completed
  stamped once the whole table has been walked.
*/
class SecondaryIndexTable {
 public:
  SecondaryIndexTable(std::shared_ptr<db::Database> database, std::string table);

  const std::string& table() const {
    return table_;
  }

  // False until the schema step creating the table has run.
  bool Exists(db::Transaction& tx) const;

  bool IsBuilt(db::Transaction& tx, const std::string& name) const;
  std::optional<int64_t> LastProcessedId(db::Transaction& tx, const std::string& name) const;

  void SaveProgress(db::Transaction& tx, const std::string& name, int64_t last_processed_id);
  void MarkBuilt(db::Transaction& tx, const std::string& name);
  void Reset(db::Transaction& tx, const std::string& name);

 private:
  void EnsureRow(db::Transaction& tx, const std::string& name);

  std::shared_ptr<db::Database> database_;
  std::string                   table_;
};

} // namespace runvault::backfill
