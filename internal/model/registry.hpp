#pragma once

#include "internal/serdes/registry.hpp"

namespace runvault::model {

// Registers every persisted model type, with its storage names and
// legacy shapes, into `registry`.
void RegisterModelTypes(serdes::Registry& registry);

// Process-wide registry: model types plus the unknown-tag fallback.
// Built on first use and frozen.
const serdes::Registry& DefaultRegistry();

} // namespace runvault::model
