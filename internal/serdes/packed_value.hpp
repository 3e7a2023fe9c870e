#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

namespace runvault::serdes {

/*
  An arbitrary structured value held in its wire shape.

  Used for dynamic fields (run config, instigator data, event specific
  data) so that a nested value of a type this binary does not know is
  carried verbatim through decode and re-encode.
*/
class PackedValue {
 public:
  PackedValue();
  explicit PackedValue(google::protobuf::Value value);

  static PackedValue FromJson(const std::string& json);

  const google::protobuf::Value& value() const {
    return value_;
  }
  google::protobuf::Value* mutable_value() {
    return &value_;
  }

  bool IsNull() const;

  std::string ToJson() const;

  friend bool operator==(const PackedValue& a, const PackedValue& b);

 private:
  google::protobuf::Value value_;
};

// Defaults for TypeSpec fields.
namespace defaults {

google::protobuf::Value Null();
google::protobuf::Value EmptyList();
google::protobuf::Value EmptyMap();
google::protobuf::Value String(const std::string& s);
google::protobuf::Value Number(double n);
google::protobuf::Value Bool(bool b);
// `qualified` is "<EnumTag>.<MEMBER>"
google::protobuf::Value Enum(const std::string& qualified);

} // namespace defaults

} // namespace runvault::serdes
