#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/database.hpp"
#include "internal/migration/migration_manager.hpp"
#include "internal/model/instigator.hpp"
#include "internal/serdes/registry.hpp"

namespace runvault::storage {

/*
  InstigatorStorage

  Schedule and sensor state plus their tick history, over the
  `instigators` domain (`jobs`, `job_ticks`).

  Ticks follow STARTED -> {SUCCESS, FAILURE, SKIPPED}. The terminal
  transition stamps end_timestamp; a terminal tick cannot change.
  Concurrent evaluation of one origin is not prevented here.
*/
class InstigatorStorage {
 public:
  InstigatorStorage(std::shared_ptr<db::Database> database, std::shared_ptr<migration::MigrationManager> migrations,
                    const serdes::Registry& registry);

  // Snapshot ids, stable across field and tag renames.
  std::string OriginId(const model::ExternalInstigatorOrigin& origin) const;
  std::string RepositoryOriginId(const model::ExternalRepositoryOrigin& origin) const;

  // ------------------------------------------------------------
  // State
  // ------------------------------------------------------------

  std::vector<model::InstigatorState> AllInstigatorState(
      const std::optional<std::string>& repository_origin_id = std::nullopt,
      std::optional<model::InstigatorType> instigator_type = std::nullopt);

  std::optional<model::InstigatorState> GetInstigatorState(const std::string& origin_id);

  // Throws util::AlreadyExists when the origin already has state.
  model::InstigatorState AddInstigatorState(const model::InstigatorState& state);

  // Throws util::NotFound when the origin has no state.
  model::InstigatorState UpdateInstigatorState(const model::InstigatorState& state);

  void DeleteInstigatorState(const std::string& origin_id);

  // ------------------------------------------------------------
  // Ticks
  // ------------------------------------------------------------

  model::InstigatorTick CreateTick(const model::TickData& data);

  // Validates the transition against the persisted tick.
  model::InstigatorTick UpdateTick(const model::InstigatorTick& tick);

  // Most recent first.
  std::vector<model::InstigatorTick> GetTicks(const std::string& origin_id, const model::TicksFilter& filter = {},
                                              std::optional<int> limit = std::nullopt);

  // Deletes the origin's ticks with `status` older than `before`. Returns
  // the number of ticks removed.
  int64_t PurgeTicks(const std::string& origin_id, model::TickStatus status, double before);

  db::Database& database() {
    return *database_;
  }

 private:
  std::vector<model::InstigatorTick> QueryTicks(db::Transaction& tx, const std::string& sql,
                                                const db::sql::Params& params);

  std::shared_ptr<db::Database>                database_;
  std::shared_ptr<migration::MigrationManager> migrations_;
  const serdes::Registry&                      registry_;
};

} // namespace runvault::storage
