#include "internal/storage/event/event_index.hpp"

#include "internal/serdes/serdes.hpp"

namespace runvault::storage {

EventIndexColumns ExtractIndexColumns(const model::EventLogEntry& entry, const serdes::Registry& registry) {
  EventIndexColumns out;
  out.step_key = entry.step_key;

  if (!entry.IsDagsterEvent()) {
    return out;
  }

  const auto& event = *entry.dagster_event;
  if (!out.step_key) {
    out.step_key = event.step_key;
  }

  if (event.IsMaterialization() && !event.event_specific_data.IsNull()) {
    auto data           = serdes::Unpack<model::StepMaterializationData>(event.event_specific_data, registry);
    out.asset_key       = data.materialization.asset_key;
    out.partition       = data.materialization.partition;
    out.materialization = std::move(data.materialization);
  }
  return out;
}

} // namespace runvault::storage
