#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/event.hpp"
#include "internal/serdes/packed_value.hpp"

namespace runvault::model {

enum class InstigatorType : std::uint8_t {
  kSchedule = 0,
  kSensor   = 1,
};

enum class InstigatorStatus : std::uint8_t {
  kRunning = 0,
  kStopped = 1,
};

enum class TickStatus : std::uint8_t {
  kStarted = 0,
  kSkipped = 1,
  kSuccess = 2,
  kFailure = 3,
};

const char* InstigatorTypeName(InstigatorType type);
const char* InstigatorStatusName(InstigatorStatus status);
const char* TickStatusName(TickStatus status);

constexpr bool IsTerminal(TickStatus status) {
  return status != TickStatus::kStarted;
}

struct GrpcServerRepositoryLocationOrigin {
  std::string                host;
  std::optional<int64_t>     port;
  std::optional<std::string> socket;
  std::optional<std::string> location_name;
  std::optional<bool>        use_ssl;

  bool operator==(const GrpcServerRepositoryLocationOrigin&) const = default;
};

struct ExternalRepositoryOrigin {
  GrpcServerRepositoryLocationOrigin repository_location_origin;
  std::string                        repository_name;

  bool operator==(const ExternalRepositoryOrigin&) const = default;
};

struct ExternalInstigatorOrigin {
  ExternalRepositoryOrigin external_repository_origin;
  std::string              instigator_name;

  bool operator==(const ExternalInstigatorOrigin&) const = default;
};

struct ScheduleInstigatorData {
  std::string           cron_schedule;
  std::optional<double> start_timestamp;

  bool operator==(const ScheduleInstigatorData&) const = default;
};

struct SensorInstigatorData {
  std::optional<double>      last_tick_timestamp;
  std::optional<std::string> last_run_key;
  std::optional<int64_t>     min_interval;
  std::optional<std::string> cursor;

  bool operator==(const SensorInstigatorData&) const = default;
};

/*
  Persisted state of one schedule or sensor.

  origin_id / repository_origin_id are snapshot ids of the origins and
  are computed by the store through the codec, so they stay stable
  across field and tag renames.
*/
struct InstigatorState {
  ExternalInstigatorOrigin origin;
  InstigatorType           instigator_type = InstigatorType::kSchedule;
  InstigatorStatus         status          = InstigatorStatus::kStopped;
  // ScheduleInstigatorData or SensorInstigatorData, packed
  serdes::PackedValue instigator_data;

  const std::string& name() const {
    return origin.instigator_name;
  }

  bool operator==(const InstigatorState&) const = default;
};

struct TickData {
  std::string                          instigator_origin_id;
  std::string                          instigator_name;
  InstigatorType                       instigator_type = InstigatorType::kSchedule;
  TickStatus                           status          = TickStatus::kStarted;
  double                               timestamp       = 0;
  std::optional<double>                end_timestamp;
  std::vector<std::string>             run_ids;
  std::vector<std::string>             run_keys;
  std::optional<SerializableErrorInfo> error;
  std::optional<std::string>           skip_reason;
  std::optional<std::string>           cursor;

  bool operator==(const TickData&) const = default;
};

/*
  One evaluation attempt of an instigator.

  STARTED -> {SUCCESS, FAILURE, SKIPPED}. The terminal transition stamps
  end_timestamp; a terminal tick is immutable.
*/
struct InstigatorTick {
  int64_t  tick_id = 0;
  TickData data;

  TickStatus status() const {
    return data.status;
  }

  InstigatorTick WithStatus(TickStatus next, double end_timestamp) const;
  InstigatorTick WithRunInfo(const std::string& run_id, const std::optional<std::string>& run_key = {}) const;
  InstigatorTick WithError(SerializableErrorInfo error, double end_timestamp) const;
  InstigatorTick WithSkipReason(std::string reason, double end_timestamp) const;
  InstigatorTick WithCursor(std::optional<std::string> cursor) const;
};

// Throws util::InvariantViolation if `to` is not a legal successor of
// the persisted `from`.
void ValidateTickTransition(const TickData& from, const TickData& to);

struct TicksFilter {
  std::optional<double>   before;
  std::optional<double>   after;
  std::vector<TickStatus> statuses;
  std::optional<int64_t>  before_tick_id;
};

} // namespace runvault::model
