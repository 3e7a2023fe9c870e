#include "internal/model/event.hpp"

#include <google/protobuf/struct.pb.h>

#include "internal/util/errors.hpp"

namespace runvault::model {

std::string AssetKey::ToDbString() const {
  google::protobuf::Value value;
  auto*                   list = value.mutable_list_value();
  for (const auto& segment : path) {
    list->add_values()->set_string_value(segment);
  }
  return serdes::PackedValue(std::move(value)).ToJson();
}

AssetKey AssetKey::FromDbString(const std::string& text) {
  auto packed = serdes::PackedValue::FromJson(text);
  if (packed.value().kind_case() != google::protobuf::Value::kListValue) {
    throw util::SerializationError("asset key is not a JSON array: " + text);
  }
  AssetKey key;
  for (const auto& segment : packed.value().list_value().values()) {
    key.path.push_back(segment.string_value());
  }
  return key;
}

std::optional<NodeHandle> NodeHandle::parent() const {
  if (path.size() < 2) return std::nullopt;
  return NodeHandle{std::vector<std::string>(path.begin(), path.end() - 1)};
}

std::string NodeHandle::ToString() const {
  std::string out;
  for (const auto& segment : path) {
    if (!out.empty()) out += '.';
    out += segment;
  }
  return out;
}

} // namespace runvault::model
