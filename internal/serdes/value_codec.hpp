#pragma once

#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/serdes/registry.hpp"

namespace runvault::serdes {

/*
  ValueCodec<T>: T <-> google::protobuf::Value in wire shape.

  Primary template handles registered composites; scalars, containers,
  enums and PackedValue are specialized below.
*/

template <typename T, typename Enable = void>
struct ValueCodec {
  static void Encode(const T& value, const Registry& registry, google::protobuf::Value* out) {
    registry.EncodeComposite(std::type_index(typeid(T)), &value, out);
  }

  static T Decode(const google::protobuf::Value& in, const Registry& registry) {
    return std::any_cast<T>(registry.DecodeComposite(in, std::type_index(typeid(T))));
  }
};

template <typename E>
struct ValueCodec<E, std::enable_if_t<std::is_enum_v<E>>> {
  static void Encode(const E& value, const Registry& registry, google::protobuf::Value* out) {
    registry.EncodeEnum(std::type_index(typeid(E)), static_cast<int64_t>(value), out);
  }

  static E Decode(const google::protobuf::Value& in, const Registry& registry) {
    return static_cast<E>(registry.DecodeEnum(std::type_index(typeid(E)), in));
  }
};

template <>
struct ValueCodec<std::string> {
  static void Encode(const std::string& value, const Registry&, google::protobuf::Value* out) {
    out->set_string_value(value);
  }

  static std::string Decode(const google::protobuf::Value& in, const Registry&) {
    if (in.kind_case() != google::protobuf::Value::kStringValue) {
      throw util::SerializationError("expected a string");
    }
    return in.string_value();
  }
};

template <>
struct ValueCodec<bool> {
  static void Encode(const bool& value, const Registry&, google::protobuf::Value* out) {
    out->set_bool_value(value);
  }

  static bool Decode(const google::protobuf::Value& in, const Registry&) {
    if (in.kind_case() != google::protobuf::Value::kBoolValue) {
      throw util::SerializationError("expected a boolean");
    }
    return in.bool_value();
  }
};

template <>
struct ValueCodec<double> {
  static void Encode(const double& value, const Registry&, google::protobuf::Value* out) {
    out->set_number_value(value);
  }

  static double Decode(const google::protobuf::Value& in, const Registry&) {
    if (in.kind_case() != google::protobuf::Value::kNumberValue) {
      throw util::SerializationError("expected a number");
    }
    return in.number_value();
  }
};

template <typename I>
struct ValueCodec<I, std::enable_if_t<std::is_integral_v<I> && !std::is_same_v<I, bool>>> {
  static void Encode(const I& value, const Registry&, google::protobuf::Value* out) {
    out->set_number_value(static_cast<double>(value));
  }

  static I Decode(const google::protobuf::Value& in, const Registry&) {
    if (in.kind_case() != google::protobuf::Value::kNumberValue) {
      throw util::SerializationError("expected an integer");
    }
    const double n = in.number_value();
    if (std::trunc(n) != n) {
      throw util::SerializationError("expected an integer, got " + std::to_string(n));
    }
    // [min, 2^digits) is exact in double for every integral width
    const double upper = std::ldexp(1.0, std::numeric_limits<I>::digits);
    const double lower = static_cast<double>(std::numeric_limits<I>::min());
    if (n < lower || n >= upper) {
      throw util::SerializationError("integer out of range: " + std::to_string(n));
    }
    return static_cast<I>(n);
  }
};

template <>
struct ValueCodec<PackedValue> {
  static void Encode(const PackedValue& value, const Registry&, google::protobuf::Value* out) {
    *out = value.value();
    if (out->kind_case() == google::protobuf::Value::KIND_NOT_SET) {
      out->set_null_value(google::protobuf::NULL_VALUE);
    }
  }

  static PackedValue Decode(const google::protobuf::Value& in, const Registry&) {
    return PackedValue(in);
  }
};

template <>
struct ValueCodec<UnknownRecord> {
  static void Encode(const UnknownRecord& value, const Registry&, google::protobuf::Value* out) {
    *out = value.raw.value();
  }

  static UnknownRecord Decode(const google::protobuf::Value& in, const Registry&) {
    const auto& fields = in.struct_value().fields();
    auto        cls    = fields.find(kClassField);
    if (in.kind_case() != google::protobuf::Value::kStructValue || cls == fields.end()) {
      throw util::SerializationError("expected an object with a discriminator");
    }
    return UnknownRecord{cls->second.string_value(), PackedValue(in)};
  }
};

template <typename T>
struct ValueCodec<std::optional<T>> {
  static void Encode(const std::optional<T>& value, const Registry& registry, google::protobuf::Value* out) {
    if (!value) {
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    }
    ValueCodec<T>::Encode(*value, registry, out);
  }

  static std::optional<T> Decode(const google::protobuf::Value& in, const Registry& registry) {
    if (in.kind_case() == google::protobuf::Value::kNullValue ||
        in.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
      return std::nullopt;
    }
    return ValueCodec<T>::Decode(in, registry);
  }
};

template <typename T>
struct ValueCodec<std::vector<T>> {
  static void Encode(const std::vector<T>& value, const Registry& registry, google::protobuf::Value* out) {
    auto* list = out->mutable_list_value();
    list->clear_values();
    for (const auto& item : value) {
      ValueCodec<T>::Encode(item, registry, list->add_values());
    }
  }

  static std::vector<T> Decode(const google::protobuf::Value& in, const Registry& registry) {
    if (in.kind_case() != google::protobuf::Value::kListValue) {
      throw util::SerializationError("expected a list");
    }
    std::vector<T> out;
    out.reserve(in.list_value().values_size());
    for (const auto& item : in.list_value().values()) {
      out.push_back(ValueCodec<T>::Decode(item, registry));
    }
    return out;
  }
};

template <typename T>
struct ValueCodec<std::set<T>> {
  static void Encode(const std::set<T>& value, const Registry& registry, google::protobuf::Value* out) {
    auto* fields = out->mutable_struct_value()->mutable_fields();
    auto* list   = (*fields)[kSetField].mutable_list_value();
    for (const auto& item : value) {
      ValueCodec<T>::Encode(item, registry, list->add_values());
    }
  }

  static std::set<T> Decode(const google::protobuf::Value& in, const Registry& registry) {
    const google::protobuf::ListValue* items = nullptr;
    if (in.kind_case() == google::protobuf::Value::kListValue) {
      items = &in.list_value();
    } else if (in.kind_case() == google::protobuf::Value::kStructValue) {
      const auto& fields = in.struct_value().fields();
      auto        it     = fields.find(kSetField);
      if (it == fields.end()) it = fields.find(kFrozenSetField);
      if (it != fields.end() && it->second.kind_case() == google::protobuf::Value::kListValue) {
        items = &it->second.list_value();
      }
    }
    if (!items) {
      throw util::SerializationError("expected a set");
    }
    std::set<T> out;
    for (const auto& item : items->values()) {
      out.insert(ValueCodec<T>::Decode(item, registry));
    }
    return out;
  }
};

template <typename T>
struct ValueCodec<std::map<std::string, T>> {
  static void Encode(const std::map<std::string, T>& value, const Registry& registry,
                     google::protobuf::Value* out) {
    auto* fields = out->mutable_struct_value()->mutable_fields();
    fields->clear();
    for (const auto& [key, item] : value) {
      ValueCodec<T>::Encode(item, registry, &(*fields)[key]);
    }
  }

  static std::map<std::string, T> Decode(const google::protobuf::Value& in, const Registry& registry) {
    if (in.kind_case() != google::protobuf::Value::kStructValue) {
      throw util::SerializationError("expected a mapping");
    }
    std::map<std::string, T> out;
    for (const auto& [key, item] : in.struct_value().fields()) {
      out.emplace(key, ValueCodec<T>::Decode(item, registry));
    }
    return out;
  }
};

// ------------------------------------------------------------
// Packer / Unpacker
// ------------------------------------------------------------

template <typename V>
void Packer::Field(const std::string& name, const V& value) {
  ValueCodec<V>::Encode(value, registry_, &(*fields_->mutable_fields())[name]);
}

template <typename V>
V Unpacker::Field(const std::string& name) const {
  try {
    return ValueCodec<V>::Decode(Raw(name), registry_);
  } catch (const util::SerializationError& e) {
    throw util::SerializationError(type_name_ + "." + name + ": " + e.what());
  }
}

} // namespace runvault::serdes
