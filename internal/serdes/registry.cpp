#include "internal/serdes/registry.hpp"

namespace runvault::serdes {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

bool IsEmptyValue(const Value& v) {
  switch (v.kind_case()) {
    case Value::KIND_NOT_SET:
    case Value::kNullValue:
      return true;
    case Value::kListValue:
      return v.list_value().values_size() == 0;
    case Value::kStructValue:
      return v.struct_value().fields().empty();
    default:
      return false;
  }
}

} // namespace

void Registry::CheckMutable(const std::string& what) const {
  if (frozen_) {
    throw util::InvariantViolation("cannot register " + what + ": registry is frozen");
  }
}

void Registry::AddComposite(std::shared_ptr<CompositeEntry> entry) {
  CheckMutable(entry->spec.name);

  if (composites_by_type_.count(entry->type)) {
    throw util::InvariantViolation("type already registered as " + composites_by_type_.at(entry->type)->spec.name);
  }

  std::vector<std::string> tags{entry->spec.name};
  if (!entry->spec.storage_name.empty()) tags.push_back(entry->spec.storage_name);
  tags.insert(tags.end(), entry->spec.legacy_names.begin(), entry->spec.legacy_names.end());

  for (const auto& tag : tags) {
    if (composites_by_tag_.count(tag) || enums_by_tag_.count(tag)) {
      throw util::InvariantViolation("duplicate discriminator tag " + tag);
    }
  }
  for (const auto& tag : tags) {
    composites_by_tag_[tag] = entry;
  }
  composites_by_type_[entry->type] = std::move(entry);
}

void Registry::AddEnum(std::shared_ptr<EnumEntry> entry) {
  CheckMutable(entry->spec.name);

  std::vector<std::string> tags{entry->spec.name};
  if (!entry->spec.storage_name.empty()) tags.push_back(entry->spec.storage_name);
  tags.insert(tags.end(), entry->spec.legacy_names.begin(), entry->spec.legacy_names.end());

  for (const auto& tag : tags) {
    if (composites_by_tag_.count(tag) || enums_by_tag_.count(tag)) {
      throw util::InvariantViolation("duplicate discriminator tag " + tag);
    }
  }
  for (const auto& tag : tags) {
    enums_by_tag_[tag] = entry;
  }
  enums_by_type_[entry->type] = std::move(entry);
}

void Registry::RegisterFallback() {
  CheckMutable("fallback");
  fallback_ = true;
}

bool Registry::IsRegistered(std::string_view tag) const {
  const std::string key(tag);
  return composites_by_tag_.count(key) > 0 || enums_by_tag_.count(key) > 0;
}

const Registry::CompositeEntry& Registry::CompositeFor(std::type_index type) const {
  auto it = composites_by_type_.find(type);
  if (it == composites_by_type_.end()) {
    throw util::SerializationError(std::string("type not registered: ") + type.name());
  }
  return *it->second;
}

const Registry::EnumEntry& Registry::EnumFor(std::type_index type) const {
  auto it = enums_by_type_.find(type);
  if (it == enums_by_type_.end()) {
    throw util::SerializationError(std::string("enum not registered: ") + type.name());
  }
  return *it->second;
}

// ------------------------------------------------------------
// Composites
// ------------------------------------------------------------

void Registry::EncodeComposite(std::type_index type, const void* value, Value* out) const {
  const auto& entry = CompositeFor(type);

  Struct current;
  Packer packer(*this, &current);
  entry.pack(value, packer);

  auto* wire = out->mutable_struct_value()->mutable_fields();
  wire->clear();
  (*wire)[kClassField].set_string_value(entry.spec.WireName());

  for (const auto& [name, field_value] : current.fields()) {
    if (entry.spec.skip_when_empty.count(name) && IsEmptyValue(field_value)) {
      continue;
    }
    auto renamed = entry.spec.storage_field_names.find(name);
    (*wire)[renamed == entry.spec.storage_field_names.end() ? name : renamed->second] = field_value;
  }
}

Struct Registry::Normalize(const CompositeEntry& entry, const std::string& wire_tag, const Struct& wire) const {
  const auto& spec = entry.spec;

  Struct fields;
  auto*  out = fields.mutable_fields();

  for (const auto& [wire_name, field_value] : wire.fields()) {
    if (wire_name == kClassField) continue;

    std::string name = wire_name;
    if (auto r = spec.field_renames.find(wire_name); r != spec.field_renames.end()) {
      name = r->second;
    } else {
      for (const auto& [current, stored] : spec.storage_field_names) {
        if (stored == wire_name) {
          name = current;
          break;
        }
      }
    }
    (*out)[name] = field_value;
  }

  if (spec.upgrade_hook) {
    spec.upgrade_hook(wire_tag, fields);
  }

  Struct normalized;
  auto*  result = normalized.mutable_fields();
  for (const auto& field : spec.fields) {
    auto it = out->find(field.name);
    if (it != out->end()) {
      (*result)[field.name] = it->second;
    } else if (field.default_value) {
      (*result)[field.name] = *field.default_value;
    } else {
      throw util::SerializationError("missing required field '" + field.name + "' for " + spec.name +
                                     " (payload tag " + wire_tag + ")");
    }
  }
  // anything not in the field list is dropped
  return normalized;
}

std::any Registry::DecodeComposite(const Value& in, std::optional<std::type_index> expected) const {
  if (in.kind_case() != Value::kStructValue) {
    throw util::SerializationError("expected an object with a " + std::string(kClassField) + " field");
  }

  const auto& wire = in.struct_value();
  auto        cls  = wire.fields().find(kClassField);
  if (cls == wire.fields().end() || cls->second.kind_case() != Value::kStringValue) {
    throw util::SerializationError("object has no " + std::string(kClassField) + " discriminator");
  }

  const std::string& tag = cls->second.string_value();
  auto               it  = composites_by_tag_.find(tag);
  if (it == composites_by_tag_.end()) {
    if (fallback_ && !expected) {
      return UnknownRecord{tag, PackedValue(in)};
    }
    throw util::SerializationError("unknown type tag '" + tag + "'");
  }

  const auto& entry = *it->second;
  if (expected && entry.type != *expected) {
    throw util::SerializationError("tag '" + tag + "' decodes to " + entry.spec.name + ", not the requested type");
  }

  Struct   fields = Normalize(entry, tag, wire);
  Unpacker unpacker(*this, entry.spec.name, fields);
  return entry.unpack(unpacker);
}

const Value& Unpacker::Raw(const std::string& name) const {
  auto it = fields_.fields().find(name);
  if (it == fields_.fields().end()) {
    throw util::SerializationError(type_name_ + " has no field '" + name + "'");
  }
  return it->second;
}

// ------------------------------------------------------------
// Enums
// ------------------------------------------------------------

void Registry::EncodeEnum(std::type_index type, int64_t value, Value* out) const {
  const auto& entry = EnumFor(type);
  for (const auto& [member_value, member_name] : entry.spec.members) {
    if (member_value == value) {
      (*out->mutable_struct_value()->mutable_fields())[kEnumField].set_string_value(entry.spec.WireName() + "." +
                                                                                    member_name);
      return;
    }
  }
  throw util::SerializationError("value " + std::to_string(value) + " is not a member of " + entry.spec.name);
}

int64_t Registry::DecodeEnum(std::type_index type, const Value& in) const {
  const auto& entry = EnumFor(type);

  if (in.kind_case() != Value::kStructValue) {
    throw util::SerializationError("expected an " + std::string(kEnumField) + " object for " + entry.spec.name);
  }
  auto it = in.struct_value().fields().find(kEnumField);
  if (it == in.struct_value().fields().end()) {
    throw util::SerializationError("expected an " + std::string(kEnumField) + " object for " + entry.spec.name);
  }

  const std::string& qualified = it->second.string_value();
  const auto         dot       = qualified.rfind('.');
  if (dot == std::string::npos) {
    throw util::SerializationError("malformed enum value '" + qualified + "'");
  }

  const std::string tag    = qualified.substr(0, dot);
  const std::string member = qualified.substr(dot + 1);

  auto by_tag = enums_by_tag_.find(tag);
  if (by_tag == enums_by_tag_.end()) {
    throw util::SerializationError("unknown enum tag '" + tag + "'");
  }
  if (by_tag->second->type != type) {
    throw util::SerializationError("enum tag '" + tag + "' decodes to " + by_tag->second->spec.name + ", not " +
                                   entry.spec.name);
  }

  for (const auto& [member_value, member_name] : entry.spec.members) {
    if (member_name == member) {
      return member_value;
    }
  }
  throw util::SerializationError("'" + member + "' is not a member of " + entry.spec.name);
}

} // namespace runvault::serdes
