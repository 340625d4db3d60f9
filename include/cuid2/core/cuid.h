#pragma once

#include "cuid2/core/clock.h"
#include "cuid2/core/result.h"
#include "cuid2/core/seed_source.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cuid2::core {

constexpr std::size_t kDefaultLength = 24;
constexpr std::size_t kMaxLength = 32;
constexpr std::size_t kMinLength = 2;

// Abstract ID generator interface for dependency injection.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate one identifier of exactly `length` characters.
  // Contract: on success the result satisfies is_valid_cuid(result, length, length).
  virtual Result<std::string> next(std::size_t length) = 0;

  Result<std::string> next() { return next(kDefaultLength); }

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// CUID2-style generator: SHA3-512 over timestamp, salt, counter and fingerprint,
// led by an independently drawn lowercase letter.
//
// Thread-safe as long as the injected clock and seed source are. The counter is
// shared by reference; every call that passes length validation and reads the
// clock takes a distinct counter value (pre-increment) via a seq_cst fetch_add.
class CuidGenerator final : public IIdGenerator {
 public:
  CuidGenerator(IClock& clock, ISeedSource& seed_source, std::atomic<std::uint64_t>& counter)
      : clock_(clock), seed_source_(seed_source), counter_(counter) {}
  ~CuidGenerator() override = default;

  // Not copyable or movable (holds references)
  CuidGenerator(const CuidGenerator&) = delete;
  CuidGenerator& operator=(const CuidGenerator&) = delete;
  CuidGenerator(CuidGenerator&&) = delete;
  CuidGenerator& operator=(CuidGenerator&&) = delete;

  using IIdGenerator::next;
  Result<std::string> next(std::size_t length) override;

 private:
  IClock& clock_;
  ISeedSource& seed_source_;
  std::atomic<std::uint64_t>& counter_;
};

// Process-wide counter, zero at start, never reset or persisted.
std::atomic<std::uint64_t>& process_counter();

// counter_value reads the process-wide counter without modifying it.
[[nodiscard]] std::uint64_t counter_value();

// Process-wide generator: SystemClock + OS seed source + process_counter().
IIdGenerator& default_generator();

// generate_cuid fails with kInvalidLength (before touching any state) unless
// kMinLength <= length <= kMaxLength.
[[nodiscard]] Result<std::string> generate_cuid(std::size_t length);

// generate == generate_cuid(kDefaultLength).
[[nodiscard]] Result<std::string> generate();

// is_valid_cuid is a format check only: non-empty, leading a-z, only a-z/0-9,
// length in [min_length, max_length]. It never errors.
[[nodiscard]] bool is_valid_cuid(std::string_view id, std::size_t min_length,
                                 std::size_t max_length);
[[nodiscard]] bool is_valid_cuid(std::string_view id);

}  // namespace cuid2::core
