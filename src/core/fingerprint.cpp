#include "cuid2/core/fingerprint.h"

#include "cuid2/core/cuid.h"
#include "cuid2/core/entropy.h"
#include "cuid2/core/hashing.h"

namespace cuid2::core {

Result<std::string> generate_fingerprint(ISeedSource& seed_source) {
  const auto entropy = generate_entropy(seed_source, kMaxLength);
  if (!entropy.has_value()) {
    return Result<std::string>::err(entropy.error());
  }
  return Result<std::string>::ok(compute_hash(entropy.value(), kMaxLength));
}

Result<std::string> generate_fingerprint() {
  return generate_fingerprint(default_seed_source());
}

}  // namespace cuid2::core
