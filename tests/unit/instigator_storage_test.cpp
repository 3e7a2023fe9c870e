#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/migration/migration_manager.hpp"
#include "internal/migration/schema/schema.hpp"
#include "internal/model/registry.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/storage/instigator/instigator_storage.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using runvault::migration::MigrationManager;
using runvault::migration::StorageDomain;
using runvault::storage::InstigatorStorage;
namespace db     = runvault::db;
namespace model  = runvault::model;
namespace schema = runvault::migration::schema;
namespace serdes = runvault::serdes;
namespace util   = runvault::util;

struct Fixture {
  std::shared_ptr<db::Database> database =
      std::make_shared<db::sqlite::SqliteDatabase>(std::make_shared<db::sqlite::SqliteDB>(":memory:"));
  std::shared_ptr<MigrationManager> migrations = std::make_shared<MigrationManager>();
  InstigatorStorage                 instigators{database, migrations, model::DefaultRegistry()};
};

model::ExternalInstigatorOrigin Origin(const std::string& name, const std::string& repository = "repo") {
  model::ExternalInstigatorOrigin origin;
  origin.external_repository_origin.repository_location_origin.host          = "localhost";
  origin.external_repository_origin.repository_location_origin.port          = 4000;
  origin.external_repository_origin.repository_location_origin.location_name = "prod";
  origin.external_repository_origin.repository_name                          = repository;
  origin.instigator_name                                                     = name;
  return origin;
}

model::InstigatorState Schedule(const std::string& name, const std::string& repository = "repo") {
  model::InstigatorState state;
  state.origin          = Origin(name, repository);
  state.instigator_type = model::InstigatorType::kSchedule;
  state.status          = model::InstigatorStatus::kRunning;
  state.instigator_data = serdes::Pack(model::ScheduleInstigatorData{"0 * * * *", 1000.0}, model::DefaultRegistry());
  return state;
}

model::InstigatorState Sensor(const std::string& name) {
  model::SensorInstigatorData data;
  data.min_interval = 30;
  data.cursor       = "offset=0";

  model::InstigatorState state;
  state.origin          = Origin(name);
  state.instigator_type = model::InstigatorType::kSensor;
  state.status          = model::InstigatorStatus::kStopped;
  state.instigator_data = serdes::Pack(data, model::DefaultRegistry());
  return state;
}

model::TickData Tick(const std::string& origin_id, double timestamp,
                     model::TickStatus status = model::TickStatus::kStarted) {
  model::TickData data;
  data.instigator_origin_id = origin_id;
  data.instigator_name      = "hourly";
  data.instigator_type      = model::InstigatorType::kSchedule;
  data.status               = status;
  data.timestamp            = timestamp;
  return data;
}

void TestStateLifecycle() {
  Fixture f;
  auto    hourly = f.instigators.AddInstigatorState(Schedule("hourly"));
  f.instigators.AddInstigatorState(Sensor("s3_watch"));
  f.instigators.AddInstigatorState(Schedule("nightly", "other_repo"));

  const auto hourly_id = f.instigators.OriginId(hourly.origin);
  assert(hourly_id.size() == 40);

  auto all = f.instigators.AllInstigatorState();
  assert(all.size() == 3);
  assert(all[0] == hourly);

  const auto repo_id = f.instigators.RepositoryOriginId(hourly.origin.external_repository_origin);
  assert(f.instigators.AllInstigatorState(repo_id).size() == 2);
  auto sensors = f.instigators.AllInstigatorState(std::nullopt, model::InstigatorType::kSensor);
  assert(sensors.size() == 1 && sensors[0].name() == "s3_watch");
  auto sensor_data = serdes::Unpack<model::SensorInstigatorData>(sensors[0].instigator_data, model::DefaultRegistry());
  assert(sensor_data.cursor == std::optional<std::string>("offset=0"));

  bool duplicate = false;
  try {
    f.instigators.AddInstigatorState(Schedule("hourly"));
  } catch (const util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);

  hourly.status = model::InstigatorStatus::kStopped;
  f.instigators.UpdateInstigatorState(hourly);
  assert(f.instigators.GetInstigatorState(hourly_id)->status == model::InstigatorStatus::kStopped);

  f.instigators.DeleteInstigatorState(hourly_id);
  assert(!f.instigators.GetInstigatorState(hourly_id));
  assert(f.instigators.AllInstigatorState().size() == 2);

  bool update_missing = false;
  try {
    f.instigators.UpdateInstigatorState(hourly);
  } catch (const util::NotFound&) {
    update_missing = true;
  }
  assert(update_missing);

  bool delete_missing = false;
  try {
    f.instigators.DeleteInstigatorState(hourly_id);
  } catch (const util::NotFound&) {
    delete_missing = true;
  }
  assert(delete_missing);
}

void TestTickStateMachine() {
  Fixture    f;
  const auto origin_id = f.instigators.OriginId(Origin("hourly"));

  auto tick = f.instigators.CreateTick(Tick(origin_id, 100));
  assert(tick.tick_id > 0);
  assert(tick.status() == model::TickStatus::kStarted);
  assert(!tick.data.end_timestamp);

  // open ticks carry no end timestamp
  auto bogus                = tick;
  bogus.data.end_timestamp = 101;
  bool open_with_end        = false;
  try {
    f.instigators.UpdateTick(bogus);
  } catch (const util::InvariantViolation&) {
    open_with_end = true;
  }
  assert(open_with_end);

  tick = f.instigators.UpdateTick(tick.WithRunInfo("run-1", "key-1").WithCursor("c1"));
  assert(tick.status() == model::TickStatus::kStarted);

  tick = f.instigators.UpdateTick(tick.WithStatus(model::TickStatus::kSuccess, 130));
  assert(tick.data.end_timestamp == std::optional<double>(130));

  auto stored = f.instigators.GetTicks(origin_id);
  assert(stored.size() == 1);
  assert(stored[0].status() == model::TickStatus::kSuccess);
  assert(stored[0].data.run_ids == std::vector<std::string>{"run-1"});
  assert(stored[0].data.run_keys == std::vector<std::string>{"key-1"});
  assert(stored[0].data.cursor == std::optional<std::string>("c1"));

  // terminal ticks are immutable
  bool local = false;
  try {
    (void)tick.WithStatus(model::TickStatus::kFailure, 140);
  } catch (const util::InvariantViolation&) {
    local = true;
  }
  assert(local);

  auto rewritten                = stored[0];
  rewritten.data.end_timestamp = 999;
  bool persisted                = false;
  try {
    f.instigators.UpdateTick(rewritten);
  } catch (const util::InvariantViolation&) {
    persisted = true;
  }
  assert(persisted);
  assert(f.instigators.GetTicks(origin_id)[0].data.end_timestamp == std::optional<double>(130));

  bool missing = false;
  try {
    auto ghost    = tick;
    ghost.tick_id = 12345;
    f.instigators.UpdateTick(ghost);
  } catch (const util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestTerminalTransitionStampsEndOnce() {
  Fixture    f;
  const auto origin_id = f.instigators.OriginId(Origin("hourly"));

  // no end supplied: the store stamps it
  auto tick        = f.instigators.CreateTick(Tick(origin_id, 100));
  auto skipped     = tick;
  skipped.data.status      = model::TickStatus::kSkipped;
  skipped.data.skip_reason = "no new files";
  skipped          = f.instigators.UpdateTick(skipped);
  assert(skipped.data.end_timestamp);

  // created terminal: ends when it starts
  auto failed = f.instigators.CreateTick(Tick(origin_id, 200, model::TickStatus::kFailure));
  assert(failed.data.end_timestamp == std::optional<double>(200));

  model::SerializableErrorInfo error;
  error.message  = "repository unreachable";
  error.cls_name = "ConnectionError";

  auto errored = f.instigators.CreateTick(Tick(origin_id, 300));
  errored      = f.instigators.UpdateTick(errored.WithError(error, 302));
  auto stored  = f.instigators.GetTicks(origin_id, {}, 1);
  assert(stored.size() == 1 && stored[0].tick_id == errored.tick_id);
  assert(stored[0].status() == model::TickStatus::kFailure);
  assert(stored[0].data.error == std::optional<model::SerializableErrorInfo>(error));
  assert(stored[0].data.end_timestamp == std::optional<double>(302));

  auto quiet = f.instigators.CreateTick(Tick(origin_id, 400));
  quiet      = f.instigators.UpdateTick(quiet.WithSkipReason("cron not due", 401));
  stored     = f.instigators.GetTicks(origin_id, {}, 1);
  assert(stored[0].status() == model::TickStatus::kSkipped);
  assert(stored[0].data.skip_reason == std::optional<std::string>("cron not due"));

  bool threw = false;
  try {
    (void)quiet.WithError(error, 402);
  } catch (const util::InvariantViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestTickQueries() {
  Fixture    f;
  const auto origin_id = f.instigators.OriginId(Origin("hourly"));
  const auto other_id  = f.instigators.OriginId(Origin("other"));

  std::vector<int64_t> ids;
  for (int i = 0; i < 6; ++i) {
    auto tick = f.instigators.CreateTick(Tick(origin_id, 100 + i * 10));
    tick      = f.instigators.UpdateTick(
        tick.WithStatus(i % 2 == 0 ? model::TickStatus::kSuccess : model::TickStatus::kSkipped, 105 + i * 10));
    ids.push_back(tick.tick_id);
  }
  f.instigators.CreateTick(Tick(other_id, 500));

  auto all = f.instigators.GetTicks(origin_id);
  assert(all.size() == 6);
  assert(all.front().tick_id == ids.back());
  assert(all.back().tick_id == ids.front());

  assert(f.instigators.GetTicks(origin_id, {}, 2).size() == 2);

  model::TicksFilter skipped;
  skipped.statuses = {model::TickStatus::kSkipped};
  assert(f.instigators.GetTicks(origin_id, skipped).size() == 3);

  model::TicksFilter window;
  window.after  = 110;
  window.before = 140;
  auto in_window = f.instigators.GetTicks(origin_id, window);
  assert(in_window.size() == 2);
  assert(in_window[0].data.timestamp == 130);

  model::TicksFilter page;
  page.before_tick_id = ids[3];
  auto older          = f.instigators.GetTicks(origin_id, page, 2);
  assert(older.size() == 2);
  assert(older[0].tick_id == ids[2] && older[1].tick_id == ids[1]);

  auto purged = f.instigators.PurgeTicks(origin_id, model::TickStatus::kSkipped, 135);
  assert(purged == 2);
  assert(f.instigators.GetTicks(origin_id).size() == 4);
  assert(f.instigators.GetTicks(other_id).size() == 1);
}

void TestLegacyScheduleTablesAreUnified() {
  Fixture f;
  f.migrations->Downgrade(StorageDomain::kInstigators, schema::kInstigatorsInitial);

  bool stale = false;
  try {
    f.instigators.AddInstigatorState(Schedule("hourly"));
  } catch (const util::SchemaMismatch&) {
    stale = true;
  }
  assert(stale);

  const auto origin_id = f.instigators.OriginId(Origin("hourly"));
  const auto repo_id   = f.instigators.RepositoryOriginId(Origin("hourly").external_repository_origin);

  // shapes written before sensors existed
  const std::string schedule_body = R"({
    "__class__": "ScheduleState",
    "origin": {
      "__class__": "ExternalJobOrigin",
      "job_name": "hourly",
      "external_repository_origin": {
        "__class__": "ExternalRepositoryOrigin",
        "repository_name": "repo",
        "repository_location_origin": {
          "__class__": "GrpcServerRepositoryLocationOrigin",
          "host": "localhost", "port": 4000, "socket": null, "location_name": "prod"
        }
      }
    },
    "status": {"__enum__": "ScheduleStatus.RUNNING"},
    "cron_schedule": "0 * * * *",
    "start_timestamp": 1000.0
  })";
  const std::string tick_body = R"({
    "__class__": "ScheduleTickData",
    "schedule_origin_id": ")" + origin_id + R"(",
    "schedule_name": "hourly",
    "cron_schedule": "0 * * * *",
    "status": {"__enum__": "ScheduleTickStatus.SUCCESS"},
    "timestamp": 1700000000.0,
    "run_id": "legacy-run"
  })";

  {
    auto tx = f.database->Begin();
    db::ThrowIfDbError(
        f.database->Exec(*tx,
                         "INSERT INTO schedules (schedule_origin_id, repository_origin_id, status, schedule_body,"
                         " create_timestamp, update_timestamp) VALUES (?, ?, 'RUNNING', ?, 1, 1);",
                         {origin_id, repo_id, schedule_body}),
        "insert legacy schedule");
    // row written well after the tick it records
    db::ThrowIfDbError(f.database->Exec(*tx,
                                        "INSERT INTO schedule_ticks (schedule_origin_id, status, tick_body,"
                                        " create_timestamp, update_timestamp) VALUES (?, 'SUCCESS', ?, 1700005000,"
                                        " 1700005000);",
                                        {origin_id, tick_body}),
                       "insert legacy tick");
    tx->Commit();
  }

  f.migrations->Upgrade(StorageDomain::kInstigators);

  {
    auto tx = f.database->Begin();
    assert(!f.database->HasTable(*tx, "schedules"));
    assert(!f.database->HasTable(*tx, "schedule_ticks"));
    tx->Commit();
  }

  auto state = f.instigators.GetInstigatorState(origin_id);
  assert(state);
  assert(state->origin == Origin("hourly"));
  assert(state->instigator_type == model::InstigatorType::kSchedule);
  assert(state->status == model::InstigatorStatus::kRunning);
  auto data = serdes::Unpack<model::ScheduleInstigatorData>(state->instigator_data, model::DefaultRegistry());
  assert(data.cron_schedule == "0 * * * *");
  assert(data.start_timestamp == std::optional<double>(1000.0));

  auto schedules = f.instigators.AllInstigatorState(repo_id, model::InstigatorType::kSchedule);
  assert(schedules.size() == 1);

  auto ticks = f.instigators.GetTicks(origin_id);
  assert(ticks.size() == 1);
  assert(ticks[0].status() == model::TickStatus::kSuccess);
  assert(ticks[0].data.instigator_name == "hourly");
  assert(ticks[0].data.run_ids == std::vector<std::string>{"legacy-run"});

  // time filters see the tick time, not the row write time
  model::TicksFilter before;
  before.before = 1700000500.0;
  assert(f.instigators.GetTicks(origin_id, before).size() == 1);
  model::TicksFilter after;
  after.after = 1700000500.0;
  assert(f.instigators.GetTicks(origin_id, after).empty());

  // new rows land after the copied ones
  auto sensor = f.instigators.AddInstigatorState(Sensor("s3_watch"));
  assert(f.instigators.AllInstigatorState().size() == 2);
  auto next = f.instigators.CreateTick(Tick(origin_id, 1700000100.0));
  assert(next.tick_id > ticks[0].tick_id);
  assert(f.instigators.GetTicks(origin_id)[0].tick_id == next.tick_id);
  (void)sensor;
}

} // namespace

int main() {
  TestStateLifecycle();
  TestTickStateMachine();
  TestTerminalTransitionStampsEndOnce();
  TestTickQueries();
  TestLegacyScheduleTablesAreUnified();

  std::cout << "runvault_unit_instigator_storage: pass\n";
  return 0;
}
