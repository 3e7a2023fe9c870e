#include "internal/model/run.hpp"

#include <iterator>

namespace runvault::model {

namespace {

constexpr const char* kRunStatusNames[] = {"QUEUED", "NOT_STARTED", "STARTED", "SUCCESS", "FAILURE", "CANCELED"};

std::optional<std::string> FindTag(const std::map<std::string, std::string>& tags, const char* key) {
  auto it = tags.find(key);
  if (it == tags.end()) return std::nullopt;
  return it->second;
}

} // namespace

const char* RunStatusName(RunStatus status) {
  return kRunStatusNames[static_cast<std::uint8_t>(status)];
}

std::optional<RunStatus> RunStatusFromName(const std::string& name) {
  for (std::uint8_t i = 0; i < std::size(kRunStatusNames); ++i) {
    if (name == kRunStatusNames[i]) return static_cast<RunStatus>(i);
  }
  return std::nullopt;
}

std::optional<std::string> Run::partition() const {
  return FindTag(tags, kPartitionTag);
}

std::optional<std::string> Run::partition_set() const {
  return FindTag(tags, kPartitionSetTag);
}

std::map<std::string, std::string> Run::TagsForStorage() const {
  auto out = tags;
  if (root_run_id) out[kRootRunIdTag] = *root_run_id;
  if (parent_run_id) out[kParentRunIdTag] = *parent_run_id;
  return out;
}

} // namespace runvault::model
