#include "internal/model/instigator.hpp"

#include "internal/util/errors.hpp"

namespace runvault::model {

const char* InstigatorTypeName(InstigatorType type) {
  return type == InstigatorType::kSensor ? "SENSOR" : "SCHEDULE";
}

const char* InstigatorStatusName(InstigatorStatus status) {
  return status == InstigatorStatus::kRunning ? "RUNNING" : "STOPPED";
}

const char* TickStatusName(TickStatus status) {
  switch (status) {
    case TickStatus::kStarted:
      return "STARTED";
    case TickStatus::kSkipped:
      return "SKIPPED";
    case TickStatus::kSuccess:
      return "SUCCESS";
    case TickStatus::kFailure:
      return "FAILURE";
  }
  return "UNKNOWN";
}

void ValidateTickTransition(const TickData& from, const TickData& to) {
  if (IsTerminal(from.status)) {
    if (!(from == to)) {
      throw util::InvariantViolation(std::string("tick is already ") + TickStatusName(from.status) +
                                     " and cannot change");
    }
    return;
  }

  if (!IsTerminal(to.status) && to.end_timestamp) {
    throw util::InvariantViolation("an open tick cannot carry an end timestamp");
  }
  if (from.instigator_origin_id != to.instigator_origin_id) {
    throw util::InvariantViolation("tick cannot move to another instigator");
  }
}

InstigatorTick InstigatorTick::WithStatus(TickStatus next, double end_timestamp) const {
  if (IsTerminal(data.status)) {
    throw util::InvariantViolation(std::string("tick ") + std::to_string(tick_id) + " is already " +
                                   TickStatusName(data.status));
  }
  InstigatorTick copy = *this;
  copy.data.status    = next;
  if (IsTerminal(next)) {
    copy.data.end_timestamp = end_timestamp;
  }
  return copy;
}

InstigatorTick InstigatorTick::WithRunInfo(const std::string& run_id, const std::optional<std::string>& run_key) const {
  InstigatorTick copy = *this;
  copy.data.run_ids.push_back(run_id);
  if (run_key) {
    copy.data.run_keys.push_back(*run_key);
  }
  return copy;
}

InstigatorTick InstigatorTick::WithError(SerializableErrorInfo error, double end_timestamp) const {
  auto copy       = WithStatus(TickStatus::kFailure, end_timestamp);
  copy.data.error = std::move(error);
  return copy;
}

InstigatorTick InstigatorTick::WithSkipReason(std::string reason, double end_timestamp) const {
  auto copy             = WithStatus(TickStatus::kSkipped, end_timestamp);
  copy.data.skip_reason = std::move(reason);
  return copy;
}

InstigatorTick InstigatorTick::WithCursor(std::optional<std::string> cursor) const {
  InstigatorTick copy = *this;
  copy.data.cursor    = std::move(cursor);
  return copy;
}

} // namespace runvault::model
