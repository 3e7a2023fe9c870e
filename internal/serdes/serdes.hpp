#pragma once

#include <any>
#include <string>

#include "internal/serdes/packed_value.hpp"
#include "internal/serdes/registry.hpp"
#include "internal/serdes/value_codec.hpp"

namespace runvault::serdes {

/*
  Structured value codec.

  Wire text is JSON. Composites carry "__class__", enums encode as
  {"__enum__": "Tag.MEMBER"}, sets as {"__set__": [...]}.
*/

std::string ValueToJson(const google::protobuf::Value& value);
google::protobuf::Value JsonToValue(const std::string& json);

template <typename T>
PackedValue Pack(const T& value, const Registry& registry) {
  google::protobuf::Value out;
  ValueCodec<T>::Encode(value, registry, &out);
  return PackedValue(std::move(out));
}

template <typename T>
T Unpack(const PackedValue& packed, const Registry& registry) {
  return ValueCodec<T>::Decode(packed.value(), registry);
}

template <typename T>
std::string Serialize(const T& value, const Registry& registry) {
  return ValueToJson(Pack(value, registry).value());
}

template <typename T>
T Deserialize(const std::string& json, const Registry& registry) {
  return ValueCodec<T>::Decode(JsonToValue(json), registry);
}

// Decodes any registered composite. Yields UnknownRecord for an
// unresolvable tag when the registry has a fallback.
std::any UnpackAny(const PackedValue& packed, const Registry& registry);
std::any DeserializeAny(const std::string& json, const Registry& registry);

// SHA-1 hex over the deterministic binary encoding of the packed value.
std::string CreateSnapshotId(const PackedValue& packed);

template <typename T>
std::string CreateSnapshotId(const T& value, const Registry& registry) {
  return CreateSnapshotId(Pack(value, registry));
}

} // namespace runvault::serdes
