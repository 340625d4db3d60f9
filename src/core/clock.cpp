#include "cuid2/core/clock.h"

#include <chrono>
#include <string>

namespace cuid2::core {

namespace {

Result<std::int64_t> checked_millis(const std::int64_t millis) {
  if (millis < 0) {
    return Result<std::int64_t>::err(
        CuidError::clock("time is " + std::to_string(-millis) + "ms before the Unix epoch"));
  }
  return Result<std::int64_t>::ok(millis);
}

}  // namespace

Result<std::int64_t> SystemClock::now_unix_millis() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  return checked_millis(static_cast<std::int64_t>(millis));
}

Result<std::int64_t> FixedClock::now_unix_millis() {
  return checked_millis(fixed_millis_);
}

}  // namespace cuid2::core
