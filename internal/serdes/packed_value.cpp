#include "internal/serdes/packed_value.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include "internal/util/errors.hpp"

namespace runvault::serdes {

PackedValue::PackedValue() {
  value_.set_null_value(google::protobuf::NULL_VALUE);
}

PackedValue::PackedValue(google::protobuf::Value value) : value_(std::move(value)) {
}

PackedValue PackedValue::FromJson(const std::string& json) {
  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw util::SerializationError("invalid JSON: " + std::string(status.message()));
  }
  return PackedValue(std::move(value));
}

bool PackedValue::IsNull() const {
  return value_.kind_case() == google::protobuf::Value::kNullValue ||
         value_.kind_case() == google::protobuf::Value::KIND_NOT_SET;
}

std::string PackedValue::ToJson() const {
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(value_, &json);
  if (!status.ok()) {
    throw util::SerializationError("cannot print JSON: " + std::string(status.message()));
  }
  return json;
}

bool operator==(const PackedValue& a, const PackedValue& b) {
  if (a.IsNull() && b.IsNull()) {
    return true;
  }
  return google::protobuf::util::MessageDifferencer::Equals(a.value_, b.value_);
}

namespace defaults {

google::protobuf::Value Null() {
  google::protobuf::Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

google::protobuf::Value EmptyList() {
  google::protobuf::Value v;
  v.mutable_list_value();
  return v;
}

google::protobuf::Value EmptyMap() {
  google::protobuf::Value v;
  v.mutable_struct_value();
  return v;
}

google::protobuf::Value String(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

google::protobuf::Value Number(double n) {
  google::protobuf::Value v;
  v.set_number_value(n);
  return v;
}

google::protobuf::Value Bool(bool b) {
  google::protobuf::Value v;
  v.set_bool_value(b);
  return v;
}

google::protobuf::Value Enum(const std::string& qualified) {
  google::protobuf::Value v;
  (*v.mutable_struct_value()->mutable_fields())["__enum__"].set_string_value(qualified);
  return v;
}

} // namespace defaults

} // namespace runvault::serdes
