#include "internal/bundle/gzip.hpp"
#include "internal/bundle/run_bundle.hpp"
#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/migration/migration_manager.hpp"
#include "internal/migration/schema/schema.hpp"
#include "internal/model/registry.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

using runvault::bundle::RunBundler;
using runvault::migration::MigrationManager;
using runvault::migration::StorageDomain;
using runvault::storage::EventLogStorage;
using runvault::storage::RunStorage;
namespace bundle = runvault::bundle;
namespace db     = runvault::db;
namespace model  = runvault::model;
namespace schema = runvault::migration::schema;
namespace serdes = runvault::serdes;
namespace util   = runvault::util;

std::shared_ptr<db::Database> MakeDatabase() {
  return std::make_shared<db::sqlite::SqliteDatabase>(std::make_shared<db::sqlite::SqliteDB>(":memory:"));
}

struct Instance {
  std::shared_ptr<MigrationManager> migrations = std::make_shared<MigrationManager>();
  RunStorage                        runs{MakeDatabase(), migrations, model::DefaultRegistry()};
  EventLogStorage                   events{MakeDatabase(), migrations, model::DefaultRegistry()};
  RunBundler                        bundler{runs, events, model::DefaultRegistry()};
};

model::EventLogEntry MakeEvent(const std::string& run_id, const std::string& message, double timestamp) {
  model::EventLogEntry entry;
  entry.run_id       = run_id;
  entry.user_message = message;
  entry.timestamp    = timestamp;
  entry.job_name     = "nightly";
  return entry;
}

std::string SeedRun(Instance& instance, const std::string& run_id) {
  auto snapshot = serdes::PackedValue::FromJson(R"({"__class__": "JobSnapshot", "name": "nightly", "ops": ["a", "b"]})");
  auto snapshot_id = instance.runs.AddSnapshot(snapshot, bundle::kJobSnapshotType);

  model::Run run;
  run.run_id          = run_id;
  run.job_name        = "nightly";
  run.status          = model::RunStatus::kSuccess;
  run.job_snapshot_id = snapshot_id;
  run.tags            = {{"team", "data"}};
  instance.runs.AddRun(run);

  instance.events.StoreEvent(MakeEvent(run_id, "started", 100));
  instance.events.StoreEvent(MakeEvent(run_id, "working", 101));
  instance.events.StoreEvent(MakeEvent(run_id, "finished", 102));
  return snapshot_id;
}

void TestGzipRoundTripAndTruncation() {
  std::string text;
  for (int i = 0; i < 2000; ++i) {
    text += "event line " + std::to_string(i) + "\n";
  }

  auto compressed = bundle::GzipCompress(text);
  assert(compressed.size() < text.size());
  // gzip magic
  assert(static_cast<unsigned char>(compressed[0]) == 0x1f);
  assert(static_cast<unsigned char>(compressed[1]) == 0x8b);
  assert(bundle::GzipDecompress(compressed) == text);
  assert(bundle::GzipDecompress(bundle::GzipCompress("")).empty());

  bool threw = false;
  try {
    bundle::GzipDecompress(compressed.substr(0, compressed.size() / 2));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    bundle::GzipDecompress("plain text, not gzip");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestBuildCollectsRunEventsAndSnapshot() {
  Instance source;
  auto     snapshot_id = SeedRun(source, "run-b");

  auto payload = source.bundler.Build("run-b");
  assert(payload.version == bundle::kBundleVersion);
  assert(payload.run.run_id == "run-b");
  assert(payload.run.job_snapshot_id == snapshot_id);
  assert(payload.event_list.size() == 3);
  assert(payload.event_list[0].user_message == "started");
  assert(payload.event_list[2].user_message == "finished");
  assert(payload.job_snapshot);
  assert(serdes::CreateSnapshotId(*payload.job_snapshot) == snapshot_id);

  auto decoded = serdes::Deserialize<model::DebugRunPayload>(serdes::Serialize(payload, model::DefaultRegistry()),
                                                             model::DefaultRegistry());
  assert(decoded.event_list.size() == 3);
  assert(decoded.run.run_id == "run-b");
}

void TestBuildUnknownRunIsNotFound() {
  Instance source;
  bool     threw = false;
  try {
    source.bundler.Build("missing");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestExportImportIntoFreshInstance() {
  const auto path =
      (std::filesystem::temp_directory_path() / "runvault_run_bundle_test.gz").string();
  std::filesystem::remove(path);

  Instance source;
  auto     snapshot_id = SeedRun(source, "run-x");
  source.bundler.Export("run-x", path);
  assert(std::filesystem::exists(path));

  auto read = source.bundler.Read(path);
  assert(read.run.run_id == "run-x");
  assert(read.event_list.size() == 3);

  Instance target;
  auto     imported = target.bundler.Import(path);
  assert(imported.run_id == "run-x");

  auto run = target.runs.GetRun("run-x");
  assert(run);
  assert(run->job_name == "nightly");
  assert(run->status == model::RunStatus::kSuccess);
  assert(run->tags.at("team") == "data");
  assert(run->job_snapshot_id == snapshot_id);

  assert(target.runs.HasSnapshot(snapshot_id));
  assert(*target.runs.GetSnapshot(snapshot_id) == *source.runs.GetSnapshot(snapshot_id));

  auto logs = target.events.GetLogsForRun("run-x");
  assert(logs.size() == 3);
  assert(logs[0].entry.user_message == "started");
  assert(logs[1].entry.user_message == "working");
  assert(logs[2].entry.user_message == "finished");
  assert(logs[0].log_id < logs[1].log_id && logs[1].log_id < logs[2].log_id);

  bool threw = false;
  try {
    target.bundler.Import(path);
  } catch (const util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(target.events.GetLogsForRun("run-x").size() == 3);

  std::filesystem::remove(path);
}

void TestImportIntoStaleEventLogLeavesNoRun() {
  Instance source;
  SeedRun(source, "run-s");
  auto payload = source.bundler.Build("run-s");

  Instance target;
  target.migrations->Downgrade(StorageDomain::kEventLogs, schema::kEventLogsStepKey);

  bool threw = false;
  try {
    target.bundler.Import(payload);
  } catch (const util::SchemaMismatch&) {
    threw = true;
  }
  assert(threw);
  assert(!target.runs.HasRun("run-s"));
  assert(!target.runs.HasSnapshot(*payload.run.job_snapshot_id));

  // once migrated the same bundle goes in whole
  target.migrations->Upgrade(StorageDomain::kEventLogs);
  auto imported = target.bundler.Import(payload);
  assert(imported.run_id == "run-s");
  assert(target.events.GetLogsForRun("run-s").size() == 3);
}

void TestDeleteRunAndEventsClearsBoth() {
  Instance instance;
  SeedRun(instance, "run-d");

  instance.events.DeleteEvents("run-d");
  instance.runs.DeleteRun("run-d");
  assert(!instance.runs.HasRun("run-d"));
  assert(instance.events.GetLogsForRun("run-d").empty());
  assert(instance.runs.GetRunTags().count("team") == 0);
}

void TestReadMissingBundleFails() {
  Instance source;
  bool     threw = false;
  try {
    source.bundler.Read((std::filesystem::temp_directory_path() / "runvault_no_such_bundle.gz").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGzipRoundTripAndTruncation();
  TestBuildCollectsRunEventsAndSnapshot();
  TestBuildUnknownRunIsNotFound();
  TestExportImportIntoFreshInstance();
  TestImportIntoStaleEventLogLeavesNoRun();
  TestDeleteRunAndEventsClearsBoth();
  TestReadMissingBundleFails();

  std::cout << "runvault_unit_run_bundle: pass\n";
  return 0;
}
