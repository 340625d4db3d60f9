#pragma once

#include "cuid2/core/result.h"
#include "cuid2/core/seed_source.h"

#include <string>

namespace cuid2::core {

// generate_fingerprint hashes kMaxLength characters of fresh entropy down to kMaxLength
// hex characters. Recomputed on every call; nothing is memoized per process.
[[nodiscard]] Result<std::string> generate_fingerprint(ISeedSource& seed_source);
[[nodiscard]] Result<std::string> generate_fingerprint();

}  // namespace cuid2::core
