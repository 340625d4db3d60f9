#pragma once

#include <string>
#include <string_view>

namespace cuid2::core {

// sha3_512_hex returns the SHA3-512 digest of input as a lower-case hex string.
//
// Implements FIPS 202 SHA3-512 (Keccak-f[1600], rate 576 bits, domain suffix 0b01).
// Output: 128-character lower-case hexadecimal string.
[[nodiscard]] std::string sha3_512_hex(std::string_view input);

}  // namespace cuid2::core
