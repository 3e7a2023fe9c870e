#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/migration/migration_manager.hpp"
#include "internal/migration/schema/schema.hpp"
#include "internal/model/registry.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/storage/event/event_log_storage.hpp"
#include "internal/storage/run/run_storage.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

namespace {

using runvault::migration::MigrationManager;
using runvault::migration::StorageDomain;
using runvault::storage::EventLogStorage;
using runvault::storage::RunStorage;
namespace db     = runvault::db;
namespace model  = runvault::model;
namespace schema = runvault::migration::schema;
namespace serdes = runvault::serdes;
namespace util   = runvault::util;

std::shared_ptr<db::Database> MakeDatabase() {
  return std::make_shared<db::sqlite::SqliteDatabase>(std::make_shared<db::sqlite::SqliteDB>(":memory:"));
}

struct Fixture {
  std::shared_ptr<MigrationManager> migrations = std::make_shared<MigrationManager>();
  RunStorage                        runs{MakeDatabase(), migrations, model::DefaultRegistry()};
};

model::Run MakeRun(const std::string& run_id, const std::string& job_name = "daily_etl") {
  model::Run run;
  run.run_id   = run_id;
  run.job_name = job_name;
  return run;
}

model::EventLogEntry MakeEvent(const std::string& run_id, const std::string& message, double timestamp) {
  model::EventLogEntry entry;
  entry.run_id       = run_id;
  entry.user_message = message;
  entry.timestamp    = timestamp;
  entry.job_name     = "daily_etl";
  return entry;
}

void TestRunLifecycleWithEvents() {
  auto             migrations = std::make_shared<MigrationManager>();
  RunStorage       runs(MakeDatabase(), migrations, model::DefaultRegistry());
  EventLogStorage  events(MakeDatabase(), migrations, model::DefaultRegistry());

  auto run = MakeRun("run-r");
  run.status = model::RunStatus::kNotStarted;
  runs.AddRun(run);

  events.StoreEvent(MakeEvent("run-r", "first", 10));
  events.StoreEvent(MakeEvent("run-r", "second", 11));
  events.StoreEvent(MakeEvent("run-r", "third", 12));

  auto logs = events.GetLogsForRun("run-r");
  assert(logs.size() == 3);
  assert(logs[0].log_id < logs[1].log_id && logs[1].log_id < logs[2].log_id);
  assert(logs[0].entry.user_message == "first");
  assert(logs[2].entry.user_message == "third");

  runs.UpdateRunStatus("run-r", model::RunStatus::kSuccess);
  auto stored = runs.GetRun("run-r");
  assert(stored);
  assert(stored->status == model::RunStatus::kSuccess);
}

void TestDuplicateRunIdIsRejected() {
  Fixture f;
  f.runs.AddRun(MakeRun("dup"));

  bool threw = false;
  try {
    f.runs.AddRun(MakeRun("dup", "other_job"));
  } catch (const util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(f.runs.GetRun("dup")->job_name == "daily_etl");
  assert(f.runs.GetRunsCount() == 1);
}

void TestRunIdAssignedWhenMissing() {
  Fixture f;
  auto    stored = f.runs.AddRun(MakeRun(""));
  assert(stored.run_id.size() == 36);
  assert(util::ToString(util::FromString(stored.run_id)) == stored.run_id);
  assert(f.runs.HasRun(stored.run_id));

  auto second = f.runs.AddRun(MakeRun(""));
  assert(second.run_id != stored.run_id);
}

void TestCommittedTransactionReleasesHandle() {
  Fixture f;
  auto    tx = f.runs.database().Begin();
  tx->Commit();

  // tx is still in scope; the store must still get the handle
  f.runs.AddRun(MakeRun("after-commit"));
  assert(f.runs.HasRun("after-commit"));

  bool threw = false;
  try {
    tx->Commit();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestAbsentRunIsEmptyNotAnError() {
  Fixture f;
  assert(!f.runs.HasRun("missing"));
  assert(!f.runs.GetRun("missing"));
  assert(!f.runs.GetRunGroup("missing"));

  bool threw = false;
  try {
    f.runs.UpdateRunStatus("missing", model::RunStatus::kStarted);
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestSnapshotsAreContentAddressed() {
  Fixture f;
  auto    snapshot = serdes::PackedValue::FromJson(R"({"__class__": "JobSnapshot", "name": "daily_etl", "ops": []})");

  auto without_snapshot = MakeRun("needs-snapshot");
  without_snapshot.job_snapshot_id = "0000";
  bool threw = false;
  try {
    f.runs.AddRun(without_snapshot);
  } catch (const util::InvariantViolation&) {
    threw = true;
  }
  assert(threw);

  const auto id = f.runs.AddSnapshot(snapshot, "JOB");
  assert(id == serdes::CreateSnapshotId(snapshot));
  assert(f.runs.AddSnapshot(snapshot, "JOB") == id);
  assert(f.runs.HasSnapshot(id));
  assert(*f.runs.GetSnapshot(id) == snapshot);
  assert(!f.runs.HasSnapshot("0000"));

  auto with_snapshot            = MakeRun("with-snapshot");
  with_snapshot.job_snapshot_id = id;
  f.runs.AddRun(with_snapshot);

  model::RunsFilter filter;
  filter.snapshot_id = id;
  assert(f.runs.GetRunsCount(filter) == 1);
}

void TestFiltersAndPagination() {
  Fixture f;
  for (int i = 0; i < 6; ++i) {
    auto run   = MakeRun("run-" + std::to_string(i), i % 2 == 0 ? "even_job" : "odd_job");
    run.tags   = {{"owner", i < 3 ? "alice" : "bob"}};
    run.status = i == 5 ? model::RunStatus::kFailure : model::RunStatus::kQueued;
    f.runs.AddRun(run);
  }

  // newest first
  auto all = f.runs.GetRuns();
  assert(all.size() == 6);
  assert(all.front().run_id == "run-5");
  assert(all.back().run_id == "run-0");

  auto page1 = f.runs.GetRuns({}, std::nullopt, 2);
  assert(page1.size() == 2);
  assert(page1[1].run_id == "run-4");
  auto page2 = f.runs.GetRuns({}, page1.back().run_id, 2);
  assert(page2.size() == 2);
  assert(page2[0].run_id == "run-3");
  assert(page2[1].run_id == "run-2");

  model::RunsFilter by_job;
  by_job.job_name = "even_job";
  assert(f.runs.GetRunsCount(by_job) == 3);

  model::RunsFilter by_status;
  by_status.statuses = {model::RunStatus::kFailure};
  auto failed        = f.runs.GetRuns(by_status);
  assert(failed.size() == 1 && failed[0].run_id == "run-5");

  model::RunsFilter by_tag;
  by_tag.tags = {{"owner", "bob"}};
  by_tag.job_name = "odd_job";
  auto bobs = f.runs.GetRuns(by_tag);
  assert(bobs.size() == 2);
  assert(bobs[0].run_id == "run-5" && bobs[1].run_id == "run-3");

  model::RunsFilter by_ids;
  by_ids.run_ids = {"run-1", "run-4", "nope"};
  assert(f.runs.GetRunsCount(by_ids) == 2);
}

void TestUnknownCursorIsNotFound() {
  Fixture f;
  f.runs.AddRun(MakeRun("only"));

  bool threw = false;
  try {
    f.runs.GetRuns({}, std::string("deleted-run"), 10);
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // the last run of a page is a valid cursor even with nothing after it
  assert(f.runs.GetRuns({}, std::string("only"), 10).empty());
}

void TestExpectedTransitions() {
  using model::IsExpectedTransition;
  using model::RunStatus;

  assert(IsExpectedTransition(RunStatus::kQueued, RunStatus::kNotStarted));
  assert(IsExpectedTransition(RunStatus::kNotStarted, RunStatus::kStarted));
  assert(IsExpectedTransition(RunStatus::kStarted, RunStatus::kSuccess));
  assert(IsExpectedTransition(RunStatus::kStarted, RunStatus::kFailure));

  // canceled while queued, failed at launch
  assert(IsExpectedTransition(RunStatus::kQueued, RunStatus::kCanceled));
  assert(IsExpectedTransition(RunStatus::kNotStarted, RunStatus::kFailure));

  assert(!IsExpectedTransition(RunStatus::kQueued, RunStatus::kSuccess));
  assert(!IsExpectedTransition(RunStatus::kNotStarted, RunStatus::kSuccess));
  assert(!IsExpectedTransition(RunStatus::kStarted, RunStatus::kQueued));
  assert(!IsExpectedTransition(RunStatus::kSuccess, RunStatus::kStarted));
  assert(!IsExpectedTransition(RunStatus::kFailure, RunStatus::kCanceled));

  // out-of-order updates are still applied
  Fixture f;
  f.runs.AddRun(MakeRun("skipped-start"));
  f.runs.UpdateRunStatus("skipped-start", RunStatus::kSuccess, 10.0);
  assert(f.runs.GetRun("skipped-start")->status == RunStatus::kSuccess);
}

void TestStatusUpdatesStampRunStats() {
  Fixture f;
  f.runs.AddRun(MakeRun("timed"));

  f.runs.UpdateRunStatus("timed", model::RunStatus::kStarted, 100.0);
  f.runs.UpdateRunStatus("timed", model::RunStatus::kSuccess, 160.0);

  auto record = f.runs.GetRunRecord("timed");
  assert(record);
  assert(record->run.status == model::RunStatus::kSuccess);
  assert(record->start_time == std::optional<double>(100.0));
  assert(record->end_time == std::optional<double>(160.0));
  assert(record->update_timestamp == 160.0);

  // logged, still applied
  f.runs.UpdateRunStatus("timed", model::RunStatus::kStarted, 170.0);
  assert(f.runs.GetRun("timed")->status == model::RunStatus::kStarted);
}

model::EventLogEntry MakeRunEvent(const std::string& run_id, const std::string& event_type, double timestamp) {
  auto                entry = MakeEvent(run_id, event_type, timestamp);
  model::DagsterEvent event;
  event.event_type_value = event_type;
  event.job_name         = "daily_etl";
  entry.dagster_event    = event;
  return entry;
}

void TestRunStatsBackfilledFromEventLog() {
  // one handle for both stores, as when they share a file
  auto       database   = MakeDatabase();
  auto       migrations = std::make_shared<MigrationManager>();
  RunStorage runs(database, migrations, model::DefaultRegistry());
  EventLogStorage events(database, migrations, model::DefaultRegistry());
  assert(runs.HasBuiltIndex(RunStorage::kRunStartEndIndex));

  // a run written before the stats columns existed
  migrations->Downgrade(StorageDomain::kRuns, schema::kRunsBulkActions);
  runs.AddRun(MakeRun("old"));
  events.StoreEvent(MakeRunEvent("old", model::event_type::kRunStart, 100));
  events.StoreEvent(MakeEvent("old", "working", 120));
  events.StoreEvent(MakeRunEvent("old", model::event_type::kRunSuccess, 150));
  runs.UpdateRunStatus("old", model::RunStatus::kSuccess, 150);

  bool threw = false;
  try {
    runs.MigrateRunStats(events);
  } catch (const util::InvariantViolation&) {
    threw = true;
  }
  assert(threw);

  migrations->Upgrade(StorageDomain::kRuns);
  assert(!runs.HasBuiltIndex(RunStorage::kRunStartEndIndex));
  assert(!runs.GetRunRecord("old")->start_time);

  // runs written after the step whose status never moved through the store
  runs.AddRun(MakeRun("fresh"));
  events.StoreEvent(MakeRunEvent("fresh", model::event_type::kRunStart, 200));
  events.StoreEvent(MakeRunEvent("fresh", model::event_type::kRunFailure, 230));
  runs.AddRun(MakeRun("idle"));
  runs.AddRun(MakeRun("timed"));
  runs.UpdateRunStatus("timed", model::RunStatus::kStarted, 300);
  runs.UpdateRunStatus("timed", model::RunStatus::kSuccess, 360);
  events.StoreEvent(MakeRunEvent("timed", model::event_type::kRunStart, 299));

  auto summary = runs.MigrateRunStats(events, false, 1);
  assert(summary.name == RunStorage::kRunStartEndIndex);
  assert(summary.migrated == 4);
  assert(summary.batches == 4);
  assert(runs.HasBuiltIndex(RunStorage::kRunStartEndIndex));

  auto old = runs.GetRunRecord("old");
  assert(old->start_time == std::optional<double>(100.0));
  assert(old->end_time == std::optional<double>(150.0));

  auto fresh = runs.GetRunRecord("fresh");
  assert(fresh->start_time == std::optional<double>(200.0));
  assert(fresh->end_time == std::optional<double>(230.0));

  auto idle = runs.GetRunRecord("idle");
  assert(!idle->start_time && !idle->end_time);

  // events win where they exist, the columns stay where they do not
  auto timed = runs.GetRunRecord("timed");
  assert(timed->start_time == std::optional<double>(299.0));
  assert(timed->end_time == std::optional<double>(360.0));

  assert(runs.MigrateRunStats(events).skipped);
}

void TestTagsMergeAndListing() {
  Fixture f;
  auto    run = MakeRun("tagged");
  run.tags    = {{"owner", "alice"}};
  f.runs.AddRun(run);

  f.runs.AddRunTags("tagged", {{"owner", "carol"}, {"priority", "high"}});

  auto stored = f.runs.GetRun("tagged");
  assert(stored->tags.at("owner") == "carol");
  assert(stored->tags.at("priority") == "high");

  auto tags = f.runs.GetRunTags();
  assert(tags.at("owner") == std::set<std::string>{"carol"});
  assert(tags.at("priority") == std::set<std::string>{"high"});

  model::RunsFilter filter;
  filter.tags = {{"owner", "alice"}};
  assert(f.runs.GetRunsCount(filter) == 0);
}

void TestRunGroupFollowsRootLineage() {
  Fixture f;
  f.runs.AddRun(MakeRun("root"));

  auto retry1          = MakeRun("retry-1");
  retry1.root_run_id   = "root";
  retry1.parent_run_id = "root";
  f.runs.AddRun(retry1);

  auto retry2          = MakeRun("retry-2");
  retry2.root_run_id   = "root";
  retry2.parent_run_id = "retry-1";
  f.runs.AddRun(retry2);

  f.runs.AddRun(MakeRun("unrelated"));

  auto group = f.runs.GetRunGroup("retry-2");
  assert(group);
  assert(group->first == "root");
  assert(group->second.size() == 3);

  std::set<std::string> ids;
  for (const auto& run : group->second) ids.insert(run.run_id);
  assert(ids == (std::set<std::string>{"root", "retry-1", "retry-2"}));

  auto from_root = f.runs.GetRunGroup("root");
  assert(from_root->second.size() == 3);
}

void TestStaleSchemaRejectsWritesBeforeSideEffects() {
  Fixture f;
  f.runs.AddRun(MakeRun("before"));

  f.migrations->Downgrade(StorageDomain::kRuns, schema::kRunsSnapshots);

  bool threw = false;
  try {
    f.runs.AddRun(MakeRun("after"));
  } catch (const util::SchemaMismatch& e) {
    threw = true;
    assert(e.domain() == "runs");
  }
  assert(threw);

  bool snapshot_threw = false;
  try {
    f.runs.AddSnapshot(serdes::PackedValue::FromJson(R"({"x": 1})"), "JOB");
  } catch (const util::SchemaMismatch&) {
    snapshot_threw = true;
  }
  assert(snapshot_threw);

  f.migrations->Upgrade(StorageDomain::kRuns);
  assert(!f.runs.HasRun("after"));
  assert(f.runs.HasRun("before"));
}

void TestPendingOptionalStepKeepsWorking() {
  Fixture f;
  f.migrations->Downgrade(StorageDomain::kRuns, schema::kRunsBulkActions);

  f.runs.AddRun(MakeRun("legacy-shape"));
  f.runs.UpdateRunStatus("legacy-shape", model::RunStatus::kStarted, 5.0);

  auto record = f.runs.GetRunRecord("legacy-shape");
  assert(record->run.status == model::RunStatus::kStarted);
  assert(!record->start_time);
  assert(!record->end_time);
}

} // namespace

int main() {
  TestRunLifecycleWithEvents();
  TestDuplicateRunIdIsRejected();
  TestRunIdAssignedWhenMissing();
  TestCommittedTransactionReleasesHandle();
  TestAbsentRunIsEmptyNotAnError();
  TestSnapshotsAreContentAddressed();
  TestFiltersAndPagination();
  TestUnknownCursorIsNotFound();
  TestExpectedTransitions();
  TestStatusUpdatesStampRunStats();
  TestRunStatsBackfilledFromEventLog();
  TestTagsMergeAndListing();
  TestRunGroupFollowsRootLineage();
  TestStaleSchemaRejectsWritesBeforeSideEffects();
  TestPendingOptionalStepKeepsWorking();

  std::cout << "runvault_unit_run_storage: pass\n";
  return 0;
}
