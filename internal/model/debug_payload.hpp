#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/event.hpp"
#include "internal/model/run.hpp"

namespace runvault::model {

// Portable run bundle: one run, its full event log and its job snapshot.
struct DebugRunPayload {
  std::string                        version;
  Run                                run;
  std::vector<EventLogEntry>         event_list;
  std::optional<serdes::PackedValue> job_snapshot;

  bool operator==(const DebugRunPayload&) const = default;
};

} // namespace runvault::model
