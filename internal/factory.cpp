#include "factory.hpp"

#include <map>
#include <stdexcept>
#include <string>

#include "internal/model/registry.hpp"
#include "internal/observability/logging.hpp"
#if RUNVAULT_DB_SQLITE
#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif
#if RUNVAULT_DB_POSTGRES
#include "internal/db/postgres/pg_database.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace runvault::factory {

namespace {

constexpr int kDefaultBatchSize = 500;

using DatabaseConfig = runvault::runtime::config::DatabaseConfig;

// One handle per distinct backend location.
class DatabaseCache {
 public:
  std::shared_ptr<db::Database> Get(const DatabaseConfig& config) {
    const auto key = Key(config);
    if (auto it = cache_.find(key); it != cache_.end()) {
      return it->second;
    }
    auto database = Open(config);
    cache_.emplace(key, database);
    return database;
  }

 private:
  static std::string Key(const DatabaseConfig& config) {
    if (config.has_postgres()) return "postgres:" + config.postgres().connection_uri();
    return "sqlite:" + SqlitePath(config);
  }

  static std::string SqlitePath(const DatabaseConfig& config) {
    if (config.has_sqlite() && !config.sqlite().path().empty()) return config.sqlite().path();
    return ":memory:";
  }

  static std::shared_ptr<db::Database> Open(const DatabaseConfig& config) {
    if (config.has_postgres()) {
#if RUNVAULT_DB_POSTGRES
      const auto& pg              = config.postgres();
      const auto  max_connections = pg.max_connections() ? pg.max_connections() : 16u;
      auto        pool            = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), max_connections);
      return std::make_shared<db::postgres::PgDatabase>(std::move(pool));
#else
      throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
    }

#if RUNVAULT_DB_SQLITE
    const auto path = SqlitePath(config);
    RUNVAULT_LOG_INFO("opening sqlite database", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteDatabase>(std::make_shared<db::sqlite::SqliteDB>(path));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  std::map<std::string, std::shared_ptr<db::Database>> cache_;
};

} // namespace

Instance BuildInstance(const runvault::runtime::config::RuntimeConfig& config, const serdes::Registry& registry) {
  Instance      instance;
  DatabaseCache databases;

  const auto& storage = config.storage();

  instance.migrations = std::make_shared<migration::MigrationManager>();

  // ------------------------------------------------------------------
  // Stores (each registers and initializes its own domain)
  // ------------------------------------------------------------------
  instance.run_storage = std::make_shared<storage::RunStorage>(databases.Get(storage.run_storage()),
                                                               instance.migrations, registry);
  instance.event_log_storage = std::make_shared<storage::EventLogStorage>(
      databases.Get(storage.event_log_storage()), instance.migrations, registry);
  instance.instigator_storage = std::make_shared<storage::InstigatorStorage>(
      databases.Get(storage.instigator_storage()), instance.migrations, registry);

  instance.backfill_batch_size =
      config.backfill().batch_size() ? static_cast<int>(config.backfill().batch_size()) : kDefaultBatchSize;

  return instance;
}

Instance BuildInstance(const runvault::runtime::config::RuntimeConfig& config) {
  return BuildInstance(config, model::DefaultRegistry());
}

} // namespace runvault::factory
