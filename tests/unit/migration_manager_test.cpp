#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/migration/migration_manager.hpp"
#include "internal/migration/schema/schema.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

using runvault::migration::MigrationChain;
using runvault::migration::MigrationManager;
using runvault::migration::MigrationStep;
using runvault::migration::StorageDomain;
namespace db     = runvault::db;
namespace schema = runvault::migration::schema;
namespace util   = runvault::util;

std::shared_ptr<db::Database> MakeDatabase() {
  return std::make_shared<db::sqlite::SqliteDatabase>(std::make_shared<db::sqlite::SqliteDB>(":memory:"));
}

using Layout = std::map<std::string, std::vector<std::string>>;

Layout DescribeSchema(db::Database& database) {
  Layout layout;
  auto   tx = database.Begin();
  for (const auto& table : database.ListTables(*tx)) {
    layout[table] = database.ListColumns(*tx, table);
  }
  tx->Commit();
  return layout;
}

void Exec(db::Database& database, const std::string& sql, const db::sql::Params& params = {}) {
  auto tx = database.Begin();
  db::ThrowIfDbError(database.Exec(*tx, sql, params), sql);
  tx->Commit();
}

void TestFreshUpgradeReachesHead() {
  auto             database = MakeDatabase();
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kRuns, database, schema::RunsChain());

  assert(!manager.CurrentRevision(StorageDomain::kRuns));
  auto state = manager.State(StorageDomain::kRuns);
  assert(state.current_revision.empty());
  assert(state.pending_required);
  assert(state.pending.size() == 6);

  auto applied = manager.Upgrade(StorageDomain::kRuns);
  assert(applied.size() == 6);
  assert(applied.front() == schema::kRunsInitial);
  assert(applied.back() == schema::kRunsRunStats);
  assert(manager.CurrentRevision(StorageDomain::kRuns) == std::optional<std::string>(schema::kRunsRunStats));
  assert(manager.HeadRevision(StorageDomain::kRuns) == schema::kRunsRunStats);

  state = manager.CheckWritable(StorageDomain::kRuns);
  assert(state.AtHead());
  assert(state.IsApplied(schema::kRunsPartitionColumns));

  auto layout = DescribeSchema(*database);
  assert(layout.count("runs"));
  assert(layout.count("run_tags"));
  assert(layout.count("snapshots"));
  assert(layout.count("runs_secondary_indexes"));
  assert(layout.count("runs_schema_revision"));
}

void TestUpgradeIsIdempotent() {
  auto             database = MakeDatabase();
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kEventLogs, database, schema::EventLogsChain());

  assert(manager.EnsureInitialized(StorageDomain::kEventLogs));
  const auto before = DescribeSchema(*database);

  assert(!manager.EnsureInitialized(StorageDomain::kEventLogs));
  assert(manager.Upgrade(StorageDomain::kEventLogs).empty());
  assert(DescribeSchema(*database) == before);
}

void TestDowngradeRestoresPriorLayout() {
  auto             database = MakeDatabase();
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kEventLogs, database, schema::EventLogsChain());

  manager.Upgrade(StorageDomain::kEventLogs, std::string(schema::kEventLogsStepKey));
  const auto at_step_key = DescribeSchema(*database);

  manager.Upgrade(StorageDomain::kEventLogs);
  assert(DescribeSchema(*database) != at_step_key);

  auto reverted = manager.Downgrade(StorageDomain::kEventLogs, schema::kEventLogsStepKey);
  assert(reverted.size() == 3);
  assert(reverted.front() == schema::kEventLogsAssetIndexColumns);
  assert(DescribeSchema(*database) == at_step_key);

  // and forward again
  manager.Upgrade(StorageDomain::kEventLogs);
  assert(manager.State(StorageDomain::kEventLogs).AtHead());
}

void TestDowngradeToBaseDropsEverything() {
  auto             database = MakeDatabase();
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kInstigators, database, schema::InstigatorsChain());
  manager.Upgrade(StorageDomain::kInstigators);

  manager.Downgrade(StorageDomain::kInstigators, "");
  assert(!manager.CurrentRevision(StorageDomain::kInstigators));

  auto tx = database->Begin();
  assert(!database->HasTable(*tx, "jobs"));
  assert(!database->HasTable(*tx, "job_ticks"));
  assert(!database->HasTable(*tx, "schedules"));
  assert(!database->HasTable(*tx, "instigators_schema_revision"));
  tx->Commit();
}

void TestBehindRequiredStepIsNotWritable() {
  auto             database = MakeDatabase();
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kRuns, database, schema::RunsChain());
  manager.Upgrade(StorageDomain::kRuns, std::string(schema::kRunsSnapshots));

  bool threw = false;
  try {
    manager.CheckWritable(StorageDomain::kRuns);
  } catch (const util::SchemaMismatch& e) {
    threw = true;
    assert(e.domain() == "runs");
    assert(e.current_revision() == schema::kRunsSnapshots);
    assert(e.head_revision() == schema::kRunsRunStats);
    assert(std::string(e.what()).find(util::SchemaMismatch::kRemediation) != std::string::npos);
  }
  assert(threw);
}

void TestPendingOptionalStepIsWritable() {
  auto             database = MakeDatabase();
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kRuns, database, schema::RunsChain());
  manager.Upgrade(StorageDomain::kRuns, std::string(schema::kRunsBulkActions));

  auto state = manager.CheckWritable(StorageDomain::kRuns);
  assert(!state.AtHead());
  assert(!state.pending_required);
  assert((state.pending == std::vector<std::string>{schema::kRunsModeColumn, schema::kRunsRunStats}));
  assert(!state.IsApplied(schema::kRunsRunStats));
}

void TestUnknownRevisionIsNotWritable() {
  auto             database = MakeDatabase();
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kRuns, database, schema::RunsChain());
  manager.Upgrade(StorageDomain::kRuns);

  // stamped by a newer binary
  Exec(*database, "UPDATE runs_schema_revision SET revision = ?", {std::string("runs_9999_future")});

  bool threw = false;
  try {
    manager.CheckWritable(StorageDomain::kRuns);
  } catch (const util::SchemaMismatch&) {
    threw = true;
  }
  assert(threw);

  bool refused = false;
  try {
    manager.Upgrade(StorageDomain::kRuns);
  } catch (const std::runtime_error&) {
    refused = true;
  }
  assert(refused);
}

void TestFailingStepKeepsPreviousRevision() {
  std::vector<MigrationStep> steps;
  steps.push_back(MigrationStep{
      .revision      = "t_0001",
      .down_revision = "",
      .description   = "table",
      .optional      = false,
      .upgrade =
          [](db::Database& d, db::Transaction& tx) {
            runvault::migration::ExecStatements(d, tx, {"CREATE TABLE t (id INTEGER)"});
          },
      .downgrade =
          [](db::Database& d, db::Transaction& tx) {
            runvault::migration::ExecStatements(d, tx, {"DROP TABLE t"});
          },
  });
  steps.push_back(MigrationStep{
      .revision      = "t_0002",
      .down_revision = "t_0001",
      .description   = "broken",
      .optional      = false,
      .upgrade =
          [](db::Database& d, db::Transaction& tx) {
            runvault::migration::ExecStatements(d, tx,
                                                {"ALTER TABLE t ADD COLUMN a TEXT", "ALTER TABLE missing ADD COLUMN b"});
          },
      .downgrade = [](db::Database&, db::Transaction&) {},
  });

  auto             database = MakeDatabase();
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kRuns, database, MigrationChain(std::move(steps)));

  bool threw = false;
  try {
    manager.Upgrade(StorageDomain::kRuns);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(manager.CurrentRevision(StorageDomain::kRuns) == std::optional<std::string>("t_0001"));

  auto tx = database->Begin();
  assert(!database->HasColumn(*tx, "t", "a"));
  tx->Commit();
}

void TestChainValidation() {
  auto noop = [](db::Database&, db::Transaction&) {};

  bool threw = false;
  try {
    MigrationChain chain({
        MigrationStep{.revision = "a", .down_revision = "", .upgrade = noop, .downgrade = noop},
        MigrationStep{.revision = "b", .down_revision = "x", .upgrade = noop, .downgrade = noop},
    });
  } catch (const util::InvariantViolation&) {
    threw = true;
  }
  assert(threw);

  MigrationChain chain({
      MigrationStep{.revision = "a", .down_revision = "", .upgrade = noop, .downgrade = noop},
      MigrationStep{.revision = "b", .down_revision = "a", .upgrade = noop, .downgrade = noop},
  });
  assert(chain.head() == "b");
  assert(chain.IndexOf("") == std::optional<int>(-1));
  assert(chain.IndexOf("b") == std::optional<int>(1));
  assert(!chain.IndexOf("c"));
}

void TestUpgradeAllAndDomainNames() {
  MigrationManager manager;
  manager.RegisterDomain(StorageDomain::kRuns, MakeDatabase(), schema::RunsChain());
  manager.RegisterDomain(StorageDomain::kEventLogs, MakeDatabase(), schema::EventLogsChain());
  manager.RegisterDomain(StorageDomain::kInstigators, MakeDatabase(), schema::InstigatorsChain());

  auto applied = manager.UpgradeAll();
  assert(applied.size() == 3);
  assert(applied[StorageDomain::kEventLogs].size() == 5);
  assert(applied[StorageDomain::kInstigators].size() == 3);
  for (auto domain : manager.Domains()) {
    assert(manager.State(domain).AtHead());
    assert(runvault::migration::DomainFromName(runvault::migration::DomainName(domain)) == domain);
  }
  assert(!runvault::migration::DomainFromName("snapshots"));
}

} // namespace

int main() {
  TestFreshUpgradeReachesHead();
  TestUpgradeIsIdempotent();
  TestDowngradeRestoresPriorLayout();
  TestDowngradeToBaseDropsEverything();
  TestBehindRequiredStepIsNotWritable();
  TestPendingOptionalStepIsWritable();
  TestUnknownRevisionIsNotWritable();
  TestFailingStepKeepsPreviousRevision();
  TestChainValidation();
  TestUpgradeAllAndDomainNames();

  std::cout << "runvault_unit_migration_manager: pass\n";
  return 0;
}
