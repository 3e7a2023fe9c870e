#pragma once

#include <optional>
#include <string>

#include "internal/model/event.hpp"
#include "internal/serdes/registry.hpp"

namespace runvault::storage {

// Derived event_logs columns, parsed from the payload at write time and
// recomputed by the event_index_columns backfill.
struct EventIndexColumns {
  std::optional<std::string>                 step_key;
  std::optional<model::AssetKey>             asset_key;
  std::optional<std::string>                 partition;
  std::optional<model::AssetMaterialization> materialization;
};

// Throws util::SerializationError when a materialization event carries
// undecodable data.
EventIndexColumns ExtractIndexColumns(const model::EventLogEntry& entry, const serdes::Registry& registry);

} // namespace runvault::storage
