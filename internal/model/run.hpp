#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/serdes/packed_value.hpp"

namespace runvault::model {

enum class RunStatus : std::uint8_t {
  kQueued     = 0,
  kNotStarted = 1,
  kStarted    = 2,
  kSuccess    = 3,
  kFailure    = 4,
  kCanceled   = 5,
};

const char* RunStatusName(RunStatus status);
std::optional<RunStatus> RunStatusFromName(const std::string& name);

constexpr bool IsTerminal(RunStatus status) {
  return status == RunStatus::kSuccess || status == RunStatus::kFailure || status == RunStatus::kCanceled;
}

// {QUEUED, NOT_STARTED} -> STARTED -> {SUCCESS, FAILURE, CANCELED}.
// FAILURE and CANCELED are also expected straight from QUEUED or
// NOT_STARTED: a queued run can be canceled and a launch can fail.
// SUCCESS needs STARTED.
constexpr bool IsExpectedTransition(RunStatus from, RunStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case RunStatus::kQueued:
      return false;
    case RunStatus::kNotStarted:
      return from == RunStatus::kQueued;
    case RunStatus::kStarted:
      return from == RunStatus::kQueued || from == RunStatus::kNotStarted;
    case RunStatus::kSuccess:
      return from == RunStatus::kStarted;
    case RunStatus::kFailure:
    case RunStatus::kCanceled:
      return true;
  }
  return false;
}

// Reserved tags.
inline constexpr const char* kPartitionTag    = "runvault/partition";
inline constexpr const char* kPartitionSetTag = "runvault/partition_set";
inline constexpr const char* kRootRunIdTag    = "runvault/root_run_id";
inline constexpr const char* kParentRunIdTag  = "runvault/parent_run_id";

struct Run {
  std::string                             job_name;
  std::string                             run_id;
  serdes::PackedValue                     run_config;
  RunStatus                               status = RunStatus::kNotStarted;
  std::map<std::string, std::string>      tags;
  std::optional<std::string>              root_run_id;
  std::optional<std::string>              parent_run_id;
  std::optional<std::string>              job_snapshot_id;
  std::optional<std::string>              execution_plan_snapshot_id;
  std::optional<std::vector<std::string>> step_keys_to_execute;
  std::optional<std::string>              mode;

  std::optional<std::string> partition() const;
  std::optional<std::string> partition_set() const;

  // Tags persisted in run_tags: user tags plus lineage tags.
  std::map<std::string, std::string> TagsForStorage() const;

  Run WithStatus(RunStatus next) const {
    Run copy    = *this;
    copy.status = next;
    return copy;
  }

  bool operator==(const Run&) const = default;
};

struct RunRecord {
  int64_t               storage_id = 0;
  Run                   run;
  double                create_timestamp = 0;
  double                update_timestamp = 0;
  std::optional<double> start_time;
  std::optional<double> end_time;
};

struct RunsFilter {
  std::vector<std::string>           run_ids;
  std::optional<std::string>         job_name;
  std::vector<RunStatus>             statuses;
  std::map<std::string, std::string> tags;
  std::optional<std::string>         partition_set;
  std::optional<std::string>         partition;
  std::optional<std::string>         snapshot_id;
};

} // namespace runvault::model
