#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/event.hpp"
#include "internal/model/instigator.hpp"

namespace runvault::model {

enum class BulkActionStatus : std::uint8_t {
  kRequested = 0,
  kCompleted = 1,
  kFailed    = 2,
  kCanceled  = 3,
};

const char* BulkActionStatusName(BulkActionStatus status);
std::optional<BulkActionStatus> BulkActionStatusFromName(const std::string& name);

struct ExternalPartitionSetOrigin {
  ExternalRepositoryOrigin external_repository_origin;
  std::string              partition_set_name;

  bool operator==(const ExternalPartitionSetOrigin&) const = default;
};

// One row of bulk_actions: a request to launch runs over a set of partitions.
struct PartitionBackfill {
  std::string                             backfill_id;
  ExternalPartitionSetOrigin              partition_set_origin;
  BulkActionStatus                        status = BulkActionStatus::kRequested;
  std::vector<std::string>                partition_names;
  bool                                    from_failure = false;
  std::optional<std::vector<std::string>> reexecution_steps;
  std::map<std::string, std::string>      tags;
  double                                  backfill_timestamp = 0;
  std::optional<std::string>              last_submitted_partition_name;
  std::optional<SerializableErrorInfo>    error;

  bool operator==(const PartitionBackfill&) const = default;
};

} // namespace runvault::model
