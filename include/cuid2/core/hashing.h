#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cuid2::core {

// Length of a hex-encoded SHA3-512 digest.
constexpr std::size_t kHashHexLength = 128;

// compute_hash compresses input to the first `length` hex characters of its SHA3-512 digest.
// Deterministic: the same (input, length) always yields the same output.
// Requests beyond kHashHexLength return the whole digest.
[[nodiscard]] std::string compute_hash(std::string_view input, std::size_t length);

}  // namespace cuid2::core
