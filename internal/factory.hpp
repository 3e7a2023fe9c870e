#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/migration/migration_manager.hpp"
#include "internal/serdes/registry.hpp"
#include "internal/storage/event/event_log_storage.hpp"
#include "internal/storage/instigator/instigator_storage.hpp"
#include "internal/storage/run/run_storage.hpp"

namespace runvault::factory {

/*
  Instance

  The three stores over their configured databases, sharing one
  migration manager. Domains configured with the same SQLite path or
  PostgreSQL URI share one database handle.
*/
struct Instance {
  std::shared_ptr<migration::MigrationManager> migrations;

  std::shared_ptr<storage::RunStorage>        run_storage;
  std::shared_ptr<storage::EventLogStorage>   event_log_storage;
  std::shared_ptr<storage::InstigatorStorage> instigator_storage;

  int backfill_batch_size = 500;
};

/*
  BuildInstance

  Composition root: the only place that knows concrete database types.
  An unset domain defaults to in-memory SQLite.
*/
Instance BuildInstance(const runvault::runtime::config::RuntimeConfig& config,
                       const serdes::Registry&                         registry);

Instance BuildInstance(const runvault::runtime::config::RuntimeConfig& config);

} // namespace runvault::factory
