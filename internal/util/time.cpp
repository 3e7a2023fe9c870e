#include "time.hpp"

namespace runvault::util {

TimePoint Now() {
  return Clock::now();
}

double ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

double NowSeconds() {
  return ToUnixSeconds(Now());
}

} // namespace runvault::util
