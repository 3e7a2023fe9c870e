#include "internal/bundle/run_bundle.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/bundle/gzip.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/util/errors.hpp"

namespace runvault::bundle {

using observability::IntField;
using observability::StringField;

RunBundler::RunBundler(storage::RunStorage& runs, storage::EventLogStorage& events, const serdes::Registry& registry)
    : runs_(runs), events_(events), registry_(registry) {
}

model::DebugRunPayload RunBundler::Build(const std::string& run_id) {
  auto run = runs_.GetRun(run_id);
  if (!run) {
    throw util::NotFound("run " + run_id + " not found");
  }

  model::DebugRunPayload payload;
  payload.version = kBundleVersion;
  payload.run     = *run;

  auto reader = events_.LogReader(run_id);
  while (auto record = reader.Next()) {
    payload.event_list.push_back(std::move(record->entry));
  }

  if (run->job_snapshot_id) {
    payload.job_snapshot = runs_.GetSnapshot(*run->job_snapshot_id);
  }
  return payload;
}

void RunBundler::Export(const std::string& run_id, const std::string& path) {
  auto payload    = Build(run_id);
  auto compressed = GzipCompress(serdes::Serialize(payload, registry_));

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open bundle for writing: " + path);
  }
  out.write(compressed.data(), static_cast<std::streamsize>(compressed.size()));
  if (!out) {
    throw std::runtime_error("Failed to write bundle: " + path);
  }

  RUNVAULT_LOG_INFO("exported run bundle", {StringField("run_id", run_id), StringField("path", path),
                                            IntField("events", static_cast<int64_t>(payload.event_list.size()))});
}

model::DebugRunPayload RunBundler::Read(const std::string& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open bundle: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  return serdes::Deserialize<model::DebugRunPayload>(GzipDecompress(buffer.str()), registry_);
}

model::Run RunBundler::Import(const model::DebugRunPayload& payload) {
  const auto& run = payload.run;

  // both domains must take writes before the first row lands
  runs_.CheckWritable();
  events_.CheckWritable();

  if (runs_.HasRun(run.run_id)) {
    throw util::AlreadyExists("run " + run.run_id + " already exists");
  }

  if (payload.job_snapshot && run.job_snapshot_id && !runs_.HasSnapshot(*run.job_snapshot_id)) {
    runs_.AddSnapshot(*payload.job_snapshot, kJobSnapshotType, *run.job_snapshot_id);
  }

  runs_.AddRun(run);
  try {
    for (const auto& entry : payload.event_list) {
      events_.StoreEvent(entry);
    }
  } catch (const std::exception& e) {
    RUNVAULT_LOG_WARN("run bundle import failed, removing partial run",
                      {StringField("run_id", run.run_id), StringField("error", e.what())});
    Discard(run.run_id);
    throw;
  }

  RUNVAULT_LOG_INFO("imported run bundle", {StringField("run_id", run.run_id), StringField("version", payload.version),
                                            IntField("events", static_cast<int64_t>(payload.event_list.size()))});
  return run;
}

void RunBundler::Discard(const std::string& run_id) {
  try {
    events_.DeleteEvents(run_id);
    runs_.DeleteRun(run_id);
  } catch (const std::exception& e) {
    RUNVAULT_LOG_ERROR("could not remove partially imported run",
                       {StringField("run_id", run_id), StringField("error", e.what())});
  }
}

model::Run RunBundler::Import(const std::string& path) {
  return Import(Read(path));
}

} // namespace runvault::bundle
