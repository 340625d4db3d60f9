#pragma once

#include "cuid2/core/result.h"

#include <cstdint>
#include <string>
#include <utility>

namespace cuid2::core {

// ISeedSource supplies 64 bits of unpredictable seed material per call.
// Every entropy draw re-seeds its pseudorandom stream from one of these.
class ISeedSource {
 public:
  virtual ~ISeedSource() = default;

  // Contract: returns fresh seed material, or a kRandomSource error.
  virtual Result<std::uint64_t> next_seed() = 0;

 protected:
  ISeedSource() = default;
  ISeedSource(const ISeedSource&) = default;
  ISeedSource& operator=(const ISeedSource&) = default;
  ISeedSource(ISeedSource&&) = default;
  ISeedSource& operator=(ISeedSource&&) = default;
};

// Production source: the operating system CSPRNG via std::random_device.
// Thread-safe. Failures to open or read the device surface as kRandomSource.
class OsSeedSource final : public ISeedSource {
 public:
  OsSeedSource() = default;
  ~OsSeedSource() override = default;

  OsSeedSource(const OsSeedSource&) = default;
  OsSeedSource& operator=(const OsSeedSource&) = default;
  OsSeedSource(OsSeedSource&&) = default;
  OsSeedSource& operator=(OsSeedSource&&) = default;

  Result<std::uint64_t> next_seed() override;
};

// Fixed source: same seed every call, so every draw replays the same stream.
class FixedSeedSource final : public ISeedSource {
 public:
  explicit FixedSeedSource(std::uint64_t seed) : seed_(seed) {}
  ~FixedSeedSource() override = default;

  FixedSeedSource(const FixedSeedSource&) = default;
  FixedSeedSource& operator=(const FixedSeedSource&) = default;
  FixedSeedSource(FixedSeedSource&&) = default;
  FixedSeedSource& operator=(FixedSeedSource&&) = default;

  Result<std::uint64_t> next_seed() override;

 private:
  std::uint64_t seed_;
};

// Failing source: models an unavailable OS entropy device.
class FailingSeedSource final : public ISeedSource {
 public:
  explicit FailingSeedSource(std::string detail) : detail_(std::move(detail)) {}
  ~FailingSeedSource() override = default;

  FailingSeedSource(const FailingSeedSource&) = default;
  FailingSeedSource& operator=(const FailingSeedSource&) = default;
  FailingSeedSource(FailingSeedSource&&) = default;
  FailingSeedSource& operator=(FailingSeedSource&&) = default;

  Result<std::uint64_t> next_seed() override;

 private:
  std::string detail_;
};

// Process-wide OS seed source used by the default overloads.
ISeedSource& default_seed_source();

}  // namespace cuid2::core
