#pragma once

#include <google/protobuf/struct.pb.h>

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/serdes/packed_value.hpp"
#include "internal/util/errors.hpp"

namespace runvault::serdes {

inline constexpr const char* kClassField   = "__class__";
inline constexpr const char* kEnumField    = "__enum__";
inline constexpr const char* kSetField     = "__set__";
inline constexpr const char* kFrozenSetField = "__frozenset__";

struct FieldSpec {
  std::string                            name;
  std::optional<google::protobuf::Value> default_value;
};

// Runs on the decoded field set (current names) before defaults are
// applied. `wire_tag` is the discriminator found in the payload.
using UpgradeHook = std::function<void(std::string_view wire_tag, google::protobuf::Struct& fields)>;

/*
  Evolution table for one composite type.

    name                 current discriminator tag
    storage_name         tag written on encode (empty: name)
    legacy_names         extra tags accepted on decode
    fields               every field the type reads, with optional default
    storage_field_names  current field name -> name written on the wire
    field_renames        historical wire name -> current name
    skip_when_empty      fields omitted on encode when null / [] / {}
*/
struct TypeSpec {
  std::string                        name;
  std::string                        storage_name;
  std::vector<std::string>           legacy_names;
  std::vector<FieldSpec>             fields;
  std::map<std::string, std::string> storage_field_names;
  std::map<std::string, std::string> field_renames;
  std::set<std::string>              skip_when_empty;
  UpgradeHook                        upgrade_hook;

  const std::string& WireName() const {
    return storage_name.empty() ? name : storage_name;
  }
};

struct EnumSpec {
  std::string                                name;
  std::string                                storage_name;
  std::vector<std::string>                   legacy_names;
  std::vector<std::pair<int64_t, std::string>> members;

  const std::string& WireName() const {
    return storage_name.empty() ? name : storage_name;
  }
};

// Result of DeserializeAny for a tag nobody registered, when the
// registry has a fallback. Re-encodes to the identical tree.
struct UnknownRecord {
  std::string type_name;
  PackedValue raw;

  bool operator==(const UnknownRecord&) const = default;
};

class Registry;

// Collects the fields of one composite on encode (current names).
class Packer {
 public:
  Packer(const Registry& registry, google::protobuf::Struct* fields) : registry_(registry), fields_(fields) {
  }

  template <typename V>
  void Field(const std::string& name, const V& value);

 private:
  const Registry&           registry_;
  google::protobuf::Struct* fields_;
};

// Reads the fields of one composite on decode. The field set has
// already been renamed, upgraded and filled with defaults.
class Unpacker {
 public:
  Unpacker(const Registry& registry, const std::string& type_name, const google::protobuf::Struct& fields)
      : registry_(registry), type_name_(type_name), fields_(fields) {
  }

  template <typename V>
  V Field(const std::string& name) const;

  const google::protobuf::Value& Raw(const std::string& name) const;

 private:
  const Registry&                 registry_;
  const std::string&              type_name_;
  const google::protobuf::Struct& fields_;
};

/*
  Registry

  Discriminator tag -> reconstruction logic plus the type's evolution
  table. Populated by explicit Register calls, then frozen; lookups on a
  frozen registry are lock free and safe from any thread.
*/
class Registry {
 public:
  template <typename T>
  using PackFn = std::function<void(const T&, Packer&)>;
  template <typename T>
  using UnpackFn = std::function<T(Unpacker&)>;

  template <typename T>
  void Register(TypeSpec spec, PackFn<T> pack, UnpackFn<T> unpack) {
    auto entry    = std::make_shared<CompositeEntry>();
    entry->spec   = std::move(spec);
    entry->type   = std::type_index(typeid(T));
    entry->pack   = [pack = std::move(pack)](const void* value, Packer& p) { pack(*static_cast<const T*>(value), p); };
    entry->unpack = [unpack = std::move(unpack)](Unpacker& u) -> std::any { return unpack(u); };
    AddComposite(std::move(entry));
  }

  template <typename E>
  void RegisterEnum(EnumSpec spec) {
    static_assert(std::is_enum_v<E>, "RegisterEnum needs an enum type");
    auto entry  = std::make_shared<EnumEntry>();
    entry->spec = std::move(spec);
    entry->type = std::type_index(typeid(E));
    AddEnum(std::move(entry));
  }

  // Unresolvable tags decode to UnknownRecord through DeserializeAny.
  void RegisterFallback();

  void Freeze() {
    frozen_ = true;
  }
  bool frozen() const {
    return frozen_;
  }
  bool has_fallback() const {
    return fallback_;
  }

  bool IsRegistered(std::string_view tag) const;

  // Composite encode/decode; `expected` empty means any registered type.
  void     EncodeComposite(std::type_index type, const void* value, google::protobuf::Value* out) const;
  std::any DecodeComposite(const google::protobuf::Value& in, std::optional<std::type_index> expected) const;

  void    EncodeEnum(std::type_index type, int64_t value, google::protobuf::Value* out) const;
  int64_t DecodeEnum(std::type_index type, const google::protobuf::Value& in) const;

 private:
  struct CompositeEntry {
    TypeSpec                                         spec;
    std::type_index                                  type = std::type_index(typeid(void));
    std::function<void(const void*, Packer&)>        pack;
    std::function<std::any(Unpacker&)>               unpack;
  };

  struct EnumEntry {
    EnumSpec        spec;
    std::type_index type = std::type_index(typeid(void));
  };

  void AddComposite(std::shared_ptr<CompositeEntry> entry);
  void AddEnum(std::shared_ptr<EnumEntry> entry);
  void CheckMutable(const std::string& what) const;

  const CompositeEntry& CompositeFor(std::type_index type) const;
  const EnumEntry&      EnumFor(std::type_index type) const;

  google::protobuf::Struct Normalize(const CompositeEntry& entry, const std::string& wire_tag,
                                     const google::protobuf::Struct& wire) const;

  std::unordered_map<std::type_index, std::shared_ptr<CompositeEntry>> composites_by_type_;
  std::unordered_map<std::string, std::shared_ptr<CompositeEntry>>     composites_by_tag_;
  std::unordered_map<std::type_index, std::shared_ptr<EnumEntry>>      enums_by_type_;
  std::unordered_map<std::string, std::shared_ptr<EnumEntry>>          enums_by_tag_;

  bool frozen_   = false;
  bool fallback_ = false;
};

} // namespace runvault::serdes
