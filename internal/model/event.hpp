#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/serdes/packed_value.hpp"

namespace runvault::model {

// Event type values persisted in event_logs.event_type.
namespace event_type {
inline constexpr const char* kRunEnqueued          = "PIPELINE_ENQUEUED";
inline constexpr const char* kRunStart             = "PIPELINE_START";
inline constexpr const char* kRunSuccess           = "PIPELINE_SUCCESS";
inline constexpr const char* kRunFailure           = "PIPELINE_FAILURE";
inline constexpr const char* kRunCanceled          = "PIPELINE_CANCELED";
inline constexpr const char* kStepStart            = "STEP_START";
inline constexpr const char* kStepSuccess          = "STEP_SUCCESS";
inline constexpr const char* kStepFailure          = "STEP_FAILURE";
inline constexpr const char* kStepOutput           = "STEP_OUTPUT";
inline constexpr const char* kObjectStoreOperation = "OBJECT_STORE_OPERATION";
inline constexpr const char* kAssetMaterialization = "ASSET_MATERIALIZATION";
inline constexpr const char* kAssetObservation     = "ASSET_OBSERVATION";
} // namespace event_type

// Persisted (event_logs.asset_key, asset_keys.asset_key) as a JSON array.
struct AssetKey {
  std::vector<std::string> path;

  std::string ToDbString() const;
  static AssetKey FromDbString(const std::string& text);

  bool operator==(const AssetKey&) const = default;
  bool operator<(const AssetKey& other) const {
    return path < other.path;
  }
};

struct SerializableErrorInfo {
  std::string                message;
  std::vector<std::string>   stack;
  std::optional<std::string> cls_name;

  bool operator==(const SerializableErrorInfo&) const = default;
};

struct AssetMaterialization {
  AssetKey                           asset_key;
  std::optional<std::string>         description;
  std::optional<std::string>         partition;
  std::map<std::string, std::string> tags;

  bool operator==(const AssetMaterialization&) const = default;
};

// event_specific_data of ASSET_MATERIALIZATION events.
struct StepMaterializationData {
  AssetMaterialization materialization;

  bool operator==(const StepMaterializationData&) const = default;
};

// Position of a node in the job graph: its name plus the enclosing graph.
// Persisted under the SolidHandle tag, nested through "parent".
struct NodeHandle {
  std::vector<std::string> path;

  const std::string& name() const {
    return path.back();
  }
  std::optional<NodeHandle> parent() const;
  std::string ToString() const;

  bool operator==(const NodeHandle&) const = default;
};

enum class ObjectStoreOperationType : std::uint8_t {
  kSetObject = 0,
  kGetObject = 1,
  kRmObject  = 2,
  kCpObject  = 3,
};

// event_specific_data of OBJECT_STORE_OPERATION events. address, version
// and mapping_key came later and default to null.
struct ObjectStoreOperationResultData {
  ObjectStoreOperationType         op = ObjectStoreOperationType::kSetObject;
  std::optional<std::string>       value_name;
  std::vector<serdes::PackedValue> metadata_entries;
  std::optional<std::string>       address;
  std::optional<std::string>       version;
  std::optional<std::string>       mapping_key;

  bool operator==(const ObjectStoreOperationResultData&) const = default;
};

struct DagsterEvent {
  std::string                        event_type_value;
  std::string                        job_name;
  std::optional<std::string>         step_key;
  std::optional<NodeHandle>          node_handle;
  std::map<std::string, std::string> logging_tags;
  serdes::PackedValue                event_specific_data;
  std::optional<std::string>         message;
  std::optional<int64_t>             pid;

  bool IsMaterialization() const {
    return event_type_value == event_type::kAssetMaterialization;
  }

  bool operator==(const DagsterEvent&) const = default;
};

struct EventLogEntry {
  std::optional<SerializableErrorInfo> error_info;
  int                                  level = 20;
  std::string                          user_message;
  std::string                          run_id;
  double                               timestamp = 0;
  std::optional<std::string>           step_key;
  std::optional<std::string>           job_name;
  std::optional<DagsterEvent>          dagster_event;

  bool IsDagsterEvent() const {
    return dagster_event.has_value();
  }

  std::optional<std::string> event_type() const {
    if (!dagster_event) return std::nullopt;
    return dagster_event->event_type_value;
  }

  bool operator==(const EventLogEntry&) const = default;
};

struct EventLogRecord {
  int64_t       storage_id = 0;
  int64_t       log_id     = 0;
  EventLogEntry entry;
};

struct EventRecordsFilter {
  std::optional<std::string> event_type;
  std::optional<AssetKey>    asset_key;
  std::vector<std::string>   asset_partitions;
  std::optional<int64_t>     after_storage_id;
  std::optional<int64_t>     before_storage_id;
};

// Legacy shape of asset_keys.asset_details (wipe tombstone).
struct AssetDetails {
  std::optional<double> last_wipe_timestamp;

  bool operator==(const AssetDetails&) const = default;
};

struct AssetKeyRecord {
  AssetKey                           asset_key;
  std::optional<std::string>         last_run_id;
  std::optional<double>              last_materialization_timestamp;
  std::optional<double>              wipe_timestamp;
  std::map<std::string, std::string> tags;

  // Present iff never wiped, or materialized after the wipe.
  bool IsPresent() const {
    if (!wipe_timestamp) return true;
    return last_materialization_timestamp && *last_materialization_timestamp > *wipe_timestamp;
  }
};

} // namespace runvault::model
