#include "internal/model/registry.hpp"

#include "internal/model/bulk_action.hpp"
#include "internal/model/debug_payload.hpp"
#include "internal/model/event.hpp"
#include "internal/model/instigator.hpp"
#include "internal/model/run.hpp"
#include "internal/serdes/value_codec.hpp"

namespace runvault::model {

using serdes::EnumSpec;
using serdes::Packer;
using serdes::TypeSpec;
using serdes::Unpacker;
namespace defaults = serdes::defaults;

namespace {

void RegisterEnums(serdes::Registry& r) {
  r.RegisterEnum<RunStatus>(EnumSpec{
      .name         = "DagsterRunStatus",
      .storage_name = "PipelineRunStatus",
      .legacy_names = {},
      .members      = {{0, "QUEUED"}, {1, "NOT_STARTED"}, {2, "STARTED"}, {3, "SUCCESS"}, {4, "FAILURE"}, {5, "CANCELED"}},
  });

  r.RegisterEnum<InstigatorType>(EnumSpec{
      .name         = "InstigatorType",
      .storage_name = "JobType",
      .legacy_names = {},
      .members      = {{0, "SCHEDULE"}, {1, "SENSOR"}},
  });

  r.RegisterEnum<InstigatorStatus>(EnumSpec{
      .name         = "InstigatorStatus",
      .storage_name = "JobStatus",
      .legacy_names = {"ScheduleStatus"},
      .members      = {{0, "RUNNING"}, {1, "STOPPED"}},
  });

  r.RegisterEnum<TickStatus>(EnumSpec{
      .name         = "TickStatus",
      .storage_name = "JobTickStatus",
      .legacy_names = {"ScheduleTickStatus"},
      .members      = {{0, "STARTED"}, {1, "SKIPPED"}, {2, "SUCCESS"}, {3, "FAILURE"}},
  });

  r.RegisterEnum<BulkActionStatus>(EnumSpec{
      .name         = "BulkActionStatus",
      .storage_name = "",
      .legacy_names = {},
      .members      = {{0, "REQUESTED"}, {1, "COMPLETED"}, {2, "FAILED"}, {3, "CANCELED"}},
  });

  r.RegisterEnum<ObjectStoreOperationType>(EnumSpec{
      .name         = "ObjectStoreOperationType",
      .storage_name = "",
      .legacy_names = {},
      .members      = {{0, "SET_OBJECT"}, {1, "GET_OBJECT"}, {2, "RM_OBJECT"}, {3, "CP_OBJECT"}},
  });
}

void RegisterRunTypes(serdes::Registry& r) {
  TypeSpec run;
  run.name                = "DagsterRun";
  run.storage_name        = "PipelineRun";
  run.fields              = {
      {"job_name", std::nullopt},
      {"run_id", std::nullopt},
      {"run_config", defaults::EmptyMap()},
      {"status", defaults::Enum("DagsterRunStatus.NOT_STARTED")},
      {"tags", defaults::EmptyMap()},
      {"root_run_id", defaults::Null()},
      {"parent_run_id", defaults::Null()},
      {"job_snapshot_id", defaults::Null()},
      {"execution_plan_snapshot_id", defaults::Null()},
      {"step_keys_to_execute", defaults::Null()},
      {"mode", defaults::Null()},
  };
  run.storage_field_names = {{"job_name", "pipeline_name"}, {"job_snapshot_id", "pipeline_snapshot_id"}};
  run.field_renames       = {{"environment_dict", "run_config"}};

  r.Register<Run>(
      std::move(run),
      [](const Run& v, Packer& p) {
        p.Field("job_name", v.job_name);
        p.Field("run_id", v.run_id);
        p.Field("run_config", v.run_config);
        p.Field("status", v.status);
        p.Field("tags", v.tags);
        p.Field("root_run_id", v.root_run_id);
        p.Field("parent_run_id", v.parent_run_id);
        p.Field("job_snapshot_id", v.job_snapshot_id);
        p.Field("execution_plan_snapshot_id", v.execution_plan_snapshot_id);
        p.Field("step_keys_to_execute", v.step_keys_to_execute);
        p.Field("mode", v.mode);
      },
      [](Unpacker& u) {
        Run v;
        v.job_name                   = u.Field<std::string>("job_name");
        v.run_id                     = u.Field<std::string>("run_id");
        v.run_config                 = u.Field<serdes::PackedValue>("run_config");
        v.status                     = u.Field<RunStatus>("status");
        v.tags                       = u.Field<std::map<std::string, std::string>>("tags");
        v.root_run_id                = u.Field<std::optional<std::string>>("root_run_id");
        v.parent_run_id              = u.Field<std::optional<std::string>>("parent_run_id");
        v.job_snapshot_id            = u.Field<std::optional<std::string>>("job_snapshot_id");
        v.execution_plan_snapshot_id = u.Field<std::optional<std::string>>("execution_plan_snapshot_id");
        v.step_keys_to_execute       = u.Field<std::optional<std::vector<std::string>>>("step_keys_to_execute");
        v.mode                       = u.Field<std::optional<std::string>>("mode");
        return v;
      });

  TypeSpec payload;
  payload.name   = "DebugRunPayload";
  payload.fields = {
      {"version", std::nullopt},
      {"run", std::nullopt},
      {"event_list", defaults::EmptyList()},
      {"job_snapshot", defaults::Null()},
  };
  payload.storage_field_names = {{"run", "pipeline_run"}, {"job_snapshot", "pipeline_snapshot"}};

  r.Register<DebugRunPayload>(
      std::move(payload),
      [](const DebugRunPayload& v, Packer& p) {
        p.Field("version", v.version);
        p.Field("run", v.run);
        p.Field("event_list", v.event_list);
        p.Field("job_snapshot", v.job_snapshot);
      },
      [](Unpacker& u) {
        DebugRunPayload v;
        v.version      = u.Field<std::string>("version");
        v.run          = u.Field<Run>("run");
        v.event_list   = u.Field<std::vector<EventLogEntry>>("event_list");
        v.job_snapshot = u.Field<std::optional<serdes::PackedValue>>("job_snapshot");
        return v;
      });
}

void RegisterEventTypes(serdes::Registry& r) {
  TypeSpec key;
  key.name   = "AssetKey";
  key.fields = {{"path", std::nullopt}};
  r.Register<AssetKey>(
      std::move(key), [](const AssetKey& v, Packer& p) { p.Field("path", v.path); },
      [](Unpacker& u) { return AssetKey{u.Field<std::vector<std::string>>("path")}; });

  TypeSpec error;
  error.name   = "SerializableErrorInfo";
  error.fields = {{"message", std::nullopt}, {"stack", defaults::EmptyList()}, {"cls_name", defaults::Null()}};
  r.Register<SerializableErrorInfo>(
      std::move(error),
      [](const SerializableErrorInfo& v, Packer& p) {
        p.Field("message", v.message);
        p.Field("stack", v.stack);
        p.Field("cls_name", v.cls_name);
      },
      [](Unpacker& u) {
        SerializableErrorInfo v;
        v.message  = u.Field<std::string>("message");
        v.stack    = u.Field<std::vector<std::string>>("stack");
        v.cls_name = u.Field<std::optional<std::string>>("cls_name");
        return v;
      });

  TypeSpec materialization;
  materialization.name         = "AssetMaterialization";
  materialization.legacy_names = {"Materialization"};
  materialization.fields       = {
      {"asset_key", std::nullopt},
      {"description", defaults::Null()},
      {"partition", defaults::Null()},
      {"tags", defaults::EmptyMap()},
  };
  r.Register<AssetMaterialization>(
      std::move(materialization),
      [](const AssetMaterialization& v, Packer& p) {
        p.Field("asset_key", v.asset_key);
        p.Field("description", v.description);
        p.Field("partition", v.partition);
        p.Field("tags", v.tags);
      },
      [](Unpacker& u) {
        AssetMaterialization v;
        v.asset_key   = u.Field<AssetKey>("asset_key");
        v.description = u.Field<std::optional<std::string>>("description");
        v.partition   = u.Field<std::optional<std::string>>("partition");
        v.tags        = u.Field<std::map<std::string, std::string>>("tags");
        return v;
      });

  TypeSpec step_materialization;
  step_materialization.name   = "StepMaterializationData";
  step_materialization.fields = {{"materialization", std::nullopt}};
  r.Register<StepMaterializationData>(
      std::move(step_materialization),
      [](const StepMaterializationData& v, Packer& p) { p.Field("materialization", v.materialization); },
      [](Unpacker& u) { return StepMaterializationData{u.Field<AssetMaterialization>("materialization")}; });

  TypeSpec handle;
  handle.name         = "NodeHandle";
  handle.storage_name = "SolidHandle";
  handle.fields       = {{"name", std::nullopt}, {"parent", defaults::Null()}};
  r.Register<NodeHandle>(
      std::move(handle),
      [](const NodeHandle& v, Packer& p) {
        if (v.path.empty()) {
          throw util::SerializationError("node handle without a name");
        }
        p.Field("name", v.name());
        p.Field("parent", v.parent());
      },
      [](Unpacker& u) {
        NodeHandle v;
        if (auto parent = u.Field<std::optional<NodeHandle>>("parent")) {
          v.path = std::move(parent->path);
        }
        v.path.push_back(u.Field<std::string>("name"));
        return v;
      });

  TypeSpec object_store;
  object_store.name   = "ObjectStoreOperationResultData";
  object_store.fields = {
      {"op", std::nullopt},
      {"value_name", defaults::Null()},
      {"metadata_entries", defaults::EmptyList()},
      {"address", defaults::Null()},
      {"version", defaults::Null()},
      {"mapping_key", defaults::Null()},
  };
  r.Register<ObjectStoreOperationResultData>(
      std::move(object_store),
      [](const ObjectStoreOperationResultData& v, Packer& p) {
        p.Field("op", v.op);
        p.Field("value_name", v.value_name);
        p.Field("metadata_entries", v.metadata_entries);
        p.Field("address", v.address);
        p.Field("version", v.version);
        p.Field("mapping_key", v.mapping_key);
      },
      [](Unpacker& u) {
        ObjectStoreOperationResultData v;
        v.op               = u.Field<ObjectStoreOperationType>("op");
        v.value_name       = u.Field<std::optional<std::string>>("value_name");
        v.metadata_entries = u.Field<std::vector<serdes::PackedValue>>("metadata_entries");
        v.address          = u.Field<std::optional<std::string>>("address");
        v.version          = u.Field<std::optional<std::string>>("version");
        v.mapping_key      = u.Field<std::optional<std::string>>("mapping_key");
        return v;
      });

  TypeSpec event;
  event.name                = "DagsterEvent";
  event.fields              = {
      {"event_type_value", std::nullopt},
      {"job_name", std::nullopt},
      {"step_key", defaults::Null()},
      {"node_handle", defaults::Null()},
      {"logging_tags", defaults::EmptyMap()},
      {"event_specific_data", defaults::Null()},
      {"message", defaults::Null()},
      {"pid", defaults::Null()},
  };
  event.storage_field_names = {{"job_name", "pipeline_name"}, {"node_handle", "solid_handle"}};
  r.Register<DagsterEvent>(
      std::move(event),
      [](const DagsterEvent& v, Packer& p) {
        p.Field("event_type_value", v.event_type_value);
        p.Field("job_name", v.job_name);
        p.Field("step_key", v.step_key);
        p.Field("node_handle", v.node_handle);
        p.Field("logging_tags", v.logging_tags);
        p.Field("event_specific_data", v.event_specific_data);
        p.Field("message", v.message);
        p.Field("pid", v.pid);
      },
      [](Unpacker& u) {
        DagsterEvent v;
        v.event_type_value    = u.Field<std::string>("event_type_value");
        v.job_name            = u.Field<std::string>("job_name");
        v.step_key            = u.Field<std::optional<std::string>>("step_key");
        v.node_handle         = u.Field<std::optional<NodeHandle>>("node_handle");
        v.logging_tags        = u.Field<std::map<std::string, std::string>>("logging_tags");
        v.event_specific_data = u.Field<serdes::PackedValue>("event_specific_data");
        v.message             = u.Field<std::optional<std::string>>("message");
        v.pid                 = u.Field<std::optional<int64_t>>("pid");
        return v;
      });

  TypeSpec entry;
  entry.name                = "EventLogEntry";
  entry.legacy_names        = {"EventRecord"};
  entry.fields              = {
      {"error_info", defaults::Null()},
      {"level", defaults::Number(20)},
      {"user_message", defaults::String("")},
      {"run_id", std::nullopt},
      {"timestamp", std::nullopt},
      {"step_key", defaults::Null()},
      {"job_name", defaults::Null()},
      {"dagster_event", defaults::Null()},
  };
  entry.storage_field_names = {{"job_name", "pipeline_name"}};
  r.Register<EventLogEntry>(
      std::move(entry),
      [](const EventLogEntry& v, Packer& p) {
        p.Field("error_info", v.error_info);
        p.Field("level", v.level);
        p.Field("user_message", v.user_message);
        p.Field("run_id", v.run_id);
        p.Field("timestamp", v.timestamp);
        p.Field("step_key", v.step_key);
        p.Field("job_name", v.job_name);
        p.Field("dagster_event", v.dagster_event);
      },
      [](Unpacker& u) {
        EventLogEntry v;
        v.error_info    = u.Field<std::optional<SerializableErrorInfo>>("error_info");
        v.level         = u.Field<int>("level");
        v.user_message  = u.Field<std::string>("user_message");
        v.run_id        = u.Field<std::string>("run_id");
        v.timestamp     = u.Field<double>("timestamp");
        v.step_key      = u.Field<std::optional<std::string>>("step_key");
        v.job_name      = u.Field<std::optional<std::string>>("job_name");
        v.dagster_event = u.Field<std::optional<DagsterEvent>>("dagster_event");
        return v;
      });

  TypeSpec details;
  details.name   = "AssetDetails";
  details.fields = {{"last_wipe_timestamp", defaults::Null()}};
  r.Register<AssetDetails>(
      std::move(details), [](const AssetDetails& v, Packer& p) { p.Field("last_wipe_timestamp", v.last_wipe_timestamp); },
      [](Unpacker& u) { return AssetDetails{u.Field<std::optional<double>>("last_wipe_timestamp")}; });
}

void RegisterOriginTypes(serdes::Registry& r) {
  TypeSpec location;
  location.name            = "GrpcServerRepositoryLocationOrigin";
  location.fields          = {
      {"host", std::nullopt},
      {"port", defaults::Null()},
      {"socket", defaults::Null()},
      {"location_name", defaults::Null()},
      {"use_ssl", defaults::Null()},
  };
  // added after origin ids were first persisted; omitted when unset so
  // existing ids keep hashing the same
  location.skip_when_empty = {"use_ssl"};
  r.Register<GrpcServerRepositoryLocationOrigin>(
      std::move(location),
      [](const GrpcServerRepositoryLocationOrigin& v, Packer& p) {
        p.Field("host", v.host);
        p.Field("port", v.port);
        p.Field("socket", v.socket);
        p.Field("location_name", v.location_name);
        p.Field("use_ssl", v.use_ssl);
      },
      [](Unpacker& u) {
        GrpcServerRepositoryLocationOrigin v;
        v.host          = u.Field<std::string>("host");
        v.port          = u.Field<std::optional<int64_t>>("port");
        v.socket        = u.Field<std::optional<std::string>>("socket");
        v.location_name = u.Field<std::optional<std::string>>("location_name");
        v.use_ssl       = u.Field<std::optional<bool>>("use_ssl");
        return v;
      });

  TypeSpec repository;
  repository.name   = "ExternalRepositoryOrigin";
  repository.fields = {{"repository_location_origin", std::nullopt}, {"repository_name", std::nullopt}};
  r.Register<ExternalRepositoryOrigin>(
      std::move(repository),
      [](const ExternalRepositoryOrigin& v, Packer& p) {
        p.Field("repository_location_origin", v.repository_location_origin);
        p.Field("repository_name", v.repository_name);
      },
      [](Unpacker& u) {
        ExternalRepositoryOrigin v;
        v.repository_location_origin = u.Field<GrpcServerRepositoryLocationOrigin>("repository_location_origin");
        v.repository_name            = u.Field<std::string>("repository_name");
        return v;
      });

  TypeSpec instigator;
  instigator.name                = "ExternalInstigatorOrigin";
  instigator.storage_name        = "ExternalJobOrigin";
  instigator.fields              = {{"external_repository_origin", std::nullopt}, {"instigator_name", std::nullopt}};
  instigator.storage_field_names = {{"instigator_name", "job_name"}};
  r.Register<ExternalInstigatorOrigin>(
      std::move(instigator),
      [](const ExternalInstigatorOrigin& v, Packer& p) {
        p.Field("external_repository_origin", v.external_repository_origin);
        p.Field("instigator_name", v.instigator_name);
      },
      [](Unpacker& u) {
        ExternalInstigatorOrigin v;
        v.external_repository_origin = u.Field<ExternalRepositoryOrigin>("external_repository_origin");
        v.instigator_name            = u.Field<std::string>("instigator_name");
        return v;
      });
}

void RegisterInstigatorTypes(serdes::Registry& r) {
  TypeSpec schedule_data;
  schedule_data.name   = "ScheduleInstigatorData";
  schedule_data.fields = {{"cron_schedule", std::nullopt}, {"start_timestamp", defaults::Null()}};
  r.Register<ScheduleInstigatorData>(
      std::move(schedule_data),
      [](const ScheduleInstigatorData& v, Packer& p) {
        p.Field("cron_schedule", v.cron_schedule);
        p.Field("start_timestamp", v.start_timestamp);
      },
      [](Unpacker& u) {
        ScheduleInstigatorData v;
        v.cron_schedule   = u.Field<std::string>("cron_schedule");
        v.start_timestamp = u.Field<std::optional<double>>("start_timestamp");
        return v;
      });

  TypeSpec sensor_data;
  sensor_data.name   = "SensorInstigatorData";
  sensor_data.fields = {
      {"last_tick_timestamp", defaults::Null()},
      {"last_run_key", defaults::Null()},
      {"min_interval", defaults::Null()},
      {"cursor", defaults::Null()},
  };
  r.Register<SensorInstigatorData>(
      std::move(sensor_data),
      [](const SensorInstigatorData& v, Packer& p) {
        p.Field("last_tick_timestamp", v.last_tick_timestamp);
        p.Field("last_run_key", v.last_run_key);
        p.Field("min_interval", v.min_interval);
        p.Field("cursor", v.cursor);
      },
      [](Unpacker& u) {
        SensorInstigatorData v;
        v.last_tick_timestamp = u.Field<std::optional<double>>("last_tick_timestamp");
        v.last_run_key        = u.Field<std::optional<std::string>>("last_run_key");
        v.min_interval        = u.Field<std::optional<int64_t>>("min_interval");
        v.cursor              = u.Field<std::optional<std::string>>("cursor");
        return v;
      });

  TypeSpec state;
  state.name                = "InstigatorState";
  state.storage_name        = "JobState";
  state.legacy_names        = {"ScheduleState"};
  state.fields              = {
      {"origin", std::nullopt},
      {"instigator_type", std::nullopt},
      {"status", std::nullopt},
      {"instigator_data", defaults::Null()},
  };
  state.storage_field_names = {{"instigator_type", "job_type"}, {"instigator_data", "job_specific_data"}};
  // ScheduleState predates sensors: it is always a schedule and carries
  // its cron string and start time inline.
  state.upgrade_hook = [](std::string_view wire_tag, google::protobuf::Struct& fields) {
    if (wire_tag != "ScheduleState") return;
    auto& f = *fields.mutable_fields();
    f["instigator_type"] = defaults::Enum("InstigatorType.SCHEDULE");

    google::protobuf::Value data;
    auto& d = *data.mutable_struct_value()->mutable_fields();
    d[serdes::kClassField].set_string_value("ScheduleInstigatorData");
    d["cron_schedule"]   = f.count("cron_schedule") ? f["cron_schedule"] : defaults::String("");
    d["start_timestamp"] = f.count("start_timestamp") ? f["start_timestamp"] : defaults::Null();
    f["instigator_data"] = std::move(data);
  };
  r.Register<InstigatorState>(
      std::move(state),
      [](const InstigatorState& v, Packer& p) {
        p.Field("origin", v.origin);
        p.Field("instigator_type", v.instigator_type);
        p.Field("status", v.status);
        p.Field("instigator_data", v.instigator_data);
      },
      [](Unpacker& u) {
        InstigatorState v;
        v.origin          = u.Field<ExternalInstigatorOrigin>("origin");
        v.instigator_type = u.Field<InstigatorType>("instigator_type");
        v.status          = u.Field<InstigatorStatus>("status");
        v.instigator_data = u.Field<serdes::PackedValue>("instigator_data");
        return v;
      });

  TypeSpec tick;
  tick.name                = "TickData";
  tick.storage_name        = "JobTickData";
  tick.legacy_names        = {"ScheduleTickData"};
  tick.fields              = {
      {"instigator_origin_id", std::nullopt},
      {"instigator_name", std::nullopt},
      {"instigator_type", std::nullopt},
      {"status", std::nullopt},
      {"timestamp", std::nullopt},
      {"end_timestamp", defaults::Null()},
      {"run_ids", defaults::EmptyList()},
      {"run_keys", defaults::EmptyList()},
      {"error", defaults::Null()},
      {"skip_reason", defaults::Null()},
      {"cursor", defaults::Null()},
  };
  tick.storage_field_names = {
      {"instigator_origin_id", "job_origin_id"},
      {"instigator_name", "job_name"},
      {"instigator_type", "job_type"},
  };
  tick.field_renames = {{"schedule_origin_id", "instigator_origin_id"}, {"schedule_name", "instigator_name"}};
  // ScheduleTickData recorded at most one run per tick
  tick.upgrade_hook = [](std::string_view wire_tag, google::protobuf::Struct& fields) {
    if (wire_tag != "ScheduleTickData") return;
    auto& f = *fields.mutable_fields();
    f["instigator_type"] = defaults::Enum("InstigatorType.SCHEDULE");

    auto run_ids = defaults::EmptyList();
    auto run_id  = f.find("run_id");
    if (run_id != f.end() && run_id->second.kind_case() == google::protobuf::Value::kStringValue) {
      *run_ids.mutable_list_value()->add_values() = run_id->second;
    }
    f["run_ids"] = std::move(run_ids);
  };
  r.Register<TickData>(
      std::move(tick),
      [](const TickData& v, Packer& p) {
        p.Field("instigator_origin_id", v.instigator_origin_id);
        p.Field("instigator_name", v.instigator_name);
        p.Field("instigator_type", v.instigator_type);
        p.Field("status", v.status);
        p.Field("timestamp", v.timestamp);
        p.Field("end_timestamp", v.end_timestamp);
        p.Field("run_ids", v.run_ids);
        p.Field("run_keys", v.run_keys);
        p.Field("error", v.error);
        p.Field("skip_reason", v.skip_reason);
        p.Field("cursor", v.cursor);
      },
      [](Unpacker& u) {
        TickData v;
        v.instigator_origin_id = u.Field<std::string>("instigator_origin_id");
        v.instigator_name      = u.Field<std::string>("instigator_name");
        v.instigator_type      = u.Field<InstigatorType>("instigator_type");
        v.status               = u.Field<TickStatus>("status");
        v.timestamp            = u.Field<double>("timestamp");
        v.end_timestamp        = u.Field<std::optional<double>>("end_timestamp");
        v.run_ids              = u.Field<std::vector<std::string>>("run_ids");
        v.run_keys             = u.Field<std::vector<std::string>>("run_keys");
        v.error                = u.Field<std::optional<SerializableErrorInfo>>("error");
        v.skip_reason          = u.Field<std::optional<std::string>>("skip_reason");
        v.cursor               = u.Field<std::optional<std::string>>("cursor");
        return v;
      });
}

void RegisterBulkActionTypes(serdes::Registry& r) {
  TypeSpec origin;
  origin.name   = "ExternalPartitionSetOrigin";
  origin.fields = {{"external_repository_origin", std::nullopt}, {"partition_set_name", std::nullopt}};
  r.Register<ExternalPartitionSetOrigin>(
      std::move(origin),
      [](const ExternalPartitionSetOrigin& v, Packer& p) {
        p.Field("external_repository_origin", v.external_repository_origin);
        p.Field("partition_set_name", v.partition_set_name);
      },
      [](Unpacker& u) {
        ExternalPartitionSetOrigin v;
        v.external_repository_origin = u.Field<ExternalRepositoryOrigin>("external_repository_origin");
        v.partition_set_name         = u.Field<std::string>("partition_set_name");
        return v;
      });

  TypeSpec backfill;
  backfill.name   = "PartitionBackfill";
  backfill.fields = {
      {"backfill_id", std::nullopt},
      {"partition_set_origin", std::nullopt},
      {"status", std::nullopt},
      {"partition_names", defaults::EmptyList()},
      {"from_failure", defaults::Bool(false)},
      {"reexecution_steps", defaults::Null()},
      {"tags", defaults::EmptyMap()},
      {"backfill_timestamp", std::nullopt},
      {"last_submitted_partition_name", defaults::Null()},
      {"error", defaults::Null()},
  };
  r.Register<PartitionBackfill>(
      std::move(backfill),
      [](const PartitionBackfill& v, Packer& p) {
        p.Field("backfill_id", v.backfill_id);
        p.Field("partition_set_origin", v.partition_set_origin);
        p.Field("status", v.status);
        p.Field("partition_names", v.partition_names);
        p.Field("from_failure", v.from_failure);
        p.Field("reexecution_steps", v.reexecution_steps);
        p.Field("tags", v.tags);
        p.Field("backfill_timestamp", v.backfill_timestamp);
        p.Field("last_submitted_partition_name", v.last_submitted_partition_name);
        p.Field("error", v.error);
      },
      [](Unpacker& u) {
        PartitionBackfill v;
        v.backfill_id                   = u.Field<std::string>("backfill_id");
        v.partition_set_origin          = u.Field<ExternalPartitionSetOrigin>("partition_set_origin");
        v.status                        = u.Field<BulkActionStatus>("status");
        v.partition_names               = u.Field<std::vector<std::string>>("partition_names");
        v.from_failure                  = u.Field<bool>("from_failure");
        v.reexecution_steps             = u.Field<std::optional<std::vector<std::string>>>("reexecution_steps");
        v.tags                          = u.Field<std::map<std::string, std::string>>("tags");
        v.backfill_timestamp            = u.Field<double>("backfill_timestamp");
        v.last_submitted_partition_name = u.Field<std::optional<std::string>>("last_submitted_partition_name");
        v.error                         = u.Field<std::optional<SerializableErrorInfo>>("error");
        return v;
      });
}

} // namespace

void RegisterModelTypes(serdes::Registry& registry) {
  RegisterEnums(registry);
  RegisterRunTypes(registry);
  RegisterEventTypes(registry);
  RegisterOriginTypes(registry);
  RegisterInstigatorTypes(registry);
  RegisterBulkActionTypes(registry);
}

const serdes::Registry& DefaultRegistry() {
  static const serdes::Registry* registry = [] {
    auto* r = new serdes::Registry();
    RegisterModelTypes(*r);
    r->RegisterFallback();
    r->Freeze();
    return r;
  }();
  return *registry;
}

} // namespace runvault::model
