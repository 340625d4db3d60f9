#pragma once

#include "cuid2/core/result.h"

#include <cstdint>

namespace cuid2::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests pin or break the clock.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return milliseconds since the Unix epoch.
  // Contract: on success the value is non-negative; otherwise a kClock error.
  virtual Result<std::int64_t> now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: reads std::chrono::system_clock.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Result<std::int64_t> now_unix_millis() override;
};

// Fixed clock: returns a constant timestamp for deterministic tests.
// A negative value models a clock set before the epoch and is reported as an error.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  Result<std::int64_t> now_unix_millis() override;

 private:
  std::int64_t fixed_millis_;
};

}  // namespace cuid2::core
