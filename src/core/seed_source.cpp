#include "cuid2/core/seed_source.h"

#include <exception>
#include <random>

namespace cuid2::core {

Result<std::uint64_t> OsSeedSource::next_seed() {
  // std::random_device throws if the OS source cannot be opened or read.
  // A device per call keeps this stateless and safe to call from any thread.
  // The explicit token pins the kernel source; the default may pick RDRAND/RDSEED.
  try {
    std::random_device device("/dev/urandom");
    const auto high = static_cast<std::uint64_t>(device());
    const auto low = static_cast<std::uint64_t>(device());
    return Result<std::uint64_t>::ok((high << 32u) | (low & 0xffffffffull));
  } catch (const std::exception& e) {
    return Result<std::uint64_t>::err(CuidError::random_source(e.what()));
  }
}

Result<std::uint64_t> FixedSeedSource::next_seed() {
  return Result<std::uint64_t>::ok(seed_);
}

Result<std::uint64_t> FailingSeedSource::next_seed() {
  return Result<std::uint64_t>::err(CuidError::random_source(detail_));
}

ISeedSource& default_seed_source() {
  static OsSeedSource source;
  return source;
}

}  // namespace cuid2::core
