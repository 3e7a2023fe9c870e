#pragma once

#include <string>

#include "internal/model/debug_payload.hpp"
#include "internal/serdes/registry.hpp"
#include "internal/storage/event/event_log_storage.hpp"
#include "internal/storage/run/run_storage.hpp"

namespace runvault::bundle {

inline constexpr const char* kBundleVersion = "runvault-bundle-1";
inline constexpr const char* kJobSnapshotType = "JOB";

/*
  Portable run bundles.

  A bundle is the gzip-compressed JSON of a DebugRunPayload: the run, its
  full event log in log_id order and its job snapshot when stored.
  Importing replays the events, so log ids are reassigned in the same
  order on the target instance.
*/
class RunBundler {
 public:
  RunBundler(storage::RunStorage& runs, storage::EventLogStorage& events, const serdes::Registry& registry);

  // Throws util::NotFound for an unknown run.
  model::DebugRunPayload Build(const std::string& run_id);

  void Export(const std::string& run_id, const std::string& path);

  model::DebugRunPayload Read(const std::string& path) const;

  // Throws util::AlreadyExists when the run is already stored and
  // util::SchemaMismatch before any write when either domain is behind. A
  // failure while replaying events removes the run again.
  model::Run Import(const model::DebugRunPayload& payload);
  model::Run Import(const std::string& path);

 private:
  void Discard(const std::string& run_id);

  storage::RunStorage&      runs_;
  storage::EventLogStorage& events_;
  const serdes::Registry&   registry_;
};

} // namespace runvault::bundle
