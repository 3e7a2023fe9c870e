#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace runvault::util {

/*
  Central error types.

  Stores throw these on the write path. Read-path absence is reported
  as an empty std::optional, never as NotFound.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unresolvable discriminator tag, missing required field or a payload that
// does not match the requested type.
class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Corrupt legacy row hit during a backfill. Counted, never fatal to the
// migration as a whole.
class MalformedRecord : public std::runtime_error {
 public:
  MalformedRecord(std::int64_t row_id, const std::string& msg)
      : std::runtime_error("malformed record " + std::to_string(row_id) + ": " + msg), row_id_(row_id) {
  }

  std::int64_t row_id() const {
    return row_id_;
  }

 private:
  std::int64_t row_id_;
};

// Caller or programmer error at the data-model level.
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::logic_error(msg) {
  }
};

/*
  Raised by every mutating store call while the domain's schema has a
  pending non-optional migration step. Raised before any side effect.
*/
class SchemaMismatch : public std::runtime_error {
 public:
  SchemaMismatch(std::string domain, std::string current_revision, std::string head_revision)
      : std::runtime_error(Format(domain, current_revision, head_revision)),
        domain_(std::move(domain)),
        current_revision_(std::move(current_revision)),
        head_revision_(std::move(head_revision)) {
  }

  const std::string& domain() const {
    return domain_;
  }
  const std::string& current_revision() const {
    return current_revision_;
  }
  const std::string& head_revision() const {
    return head_revision_;
  }

  static constexpr const char* kRemediation = "runvaultctl --config <config.yaml> migrate";

 private:
  static std::string Format(const std::string& domain, const std::string& current, const std::string& head) {
    return "Instance is out of date and must be migrated (" + domain + " storage requires migration). " +
           "Database is at revision " + (current.empty() ? std::string("<none>") : current) + ", head is " + head +
           ". Please run `" + kRemediation + "`.";
  }

  std::string domain_;
  std::string current_revision_;
  std::string head_revision_;
};

} // namespace runvault::util
