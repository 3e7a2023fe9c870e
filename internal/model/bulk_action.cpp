#include "internal/model/bulk_action.hpp"

#include <iterator>

namespace runvault::model {

namespace {

constexpr const char* kBulkActionStatusNames[] = {"REQUESTED", "COMPLETED", "FAILED", "CANCELED"};

} // namespace

const char* BulkActionStatusName(BulkActionStatus status) {
  return kBulkActionStatusNames[static_cast<std::uint8_t>(status)];
}

std::optional<BulkActionStatus> BulkActionStatusFromName(const std::string& name) {
  for (std::uint8_t i = 0; i < std::size(kBulkActionStatusNames); ++i) {
    if (name == kBulkActionStatusNames[i]) return static_cast<BulkActionStatus>(i);
  }
  return std::nullopt;
}

} // namespace runvault::model
