#pragma once

#include "internal/migration/migration_step.hpp"

namespace runvault::migration::schema {

// runs
inline constexpr const char* kRunsInitial          = "runs_0001_initial";
inline constexpr const char* kRunsSnapshots        = "runs_0002_snapshots";
inline constexpr const char* kRunsPartitionColumns = "runs_0003_partition_columns";
inline constexpr const char* kRunsBulkActions       = "runs_0004_bulk_actions";
inline constexpr const char* kRunsModeColumn        = "runs_0005_mode_column";
inline constexpr const char* kRunsRunStats         = "runs_0006_run_stats";

// event_logs
inline constexpr const char* kEventLogsInitial           = "event_logs_0001_initial";
inline constexpr const char* kEventLogsStepKey           = "event_logs_0002_step_key";
inline constexpr const char* kEventLogsAssetKeys         = "event_logs_0003_asset_keys";
inline constexpr const char* kEventLogsPartition         = "event_logs_0004_partition";
inline constexpr const char* kEventLogsAssetIndexColumns = "event_logs_0005_asset_index_columns";

// instigators
inline constexpr const char* kInstigatorsInitial     = "instigators_0001_initial";
inline constexpr const char* kInstigatorsUnify       = "instigators_0002_unify_instigators";
inline constexpr const char* kInstigatorsTickIndexes = "instigators_0003_tick_indexes";

MigrationChain RunsChain();
MigrationChain EventLogsChain();
MigrationChain InstigatorsChain();

MigrationChain ChainFor(StorageDomain domain);

} // namespace runvault::migration::schema
