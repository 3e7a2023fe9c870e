#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace runvault::util {

/*
  UUID helpers

  Run ids are RFC4122 version 4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Fresh run id, canonical lowercase form.
std::string MakeNewRunId();

} // namespace runvault::util
