#pragma once

#include "cuid2/core/result.h"
#include "cuid2/core/seed_source.h"

#include <cstddef>
#include <string>

namespace cuid2::core {

// generate_entropy draws `length` base-36 characters (0-9, a-z), each uniform.
// Each call seeds a fresh 64-bit Mersenne Twister from one seed_source draw;
// no stream is shared between calls. Any length is accepted, including 0.
[[nodiscard]] Result<std::string> generate_entropy(ISeedSource& seed_source, std::size_t length);
[[nodiscard]] Result<std::string> generate_entropy(std::size_t length);

// generate_random_letter draws one letter uniformly from a-z using a freshly seeded stream.
[[nodiscard]] Result<char> generate_random_letter(ISeedSource& seed_source);
[[nodiscard]] Result<char> generate_random_letter();

}  // namespace cuid2::core
