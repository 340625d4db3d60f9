#include "cuid2/core/hashing.h"

#include "cuid2/core/sha3.h"

namespace cuid2::core {

std::string compute_hash(const std::string_view input, const std::size_t length) {
  // substr clamps, so an oversized request yields the full 128-character digest.
  return sha3_512_hex(input).substr(0, length);
}

}  // namespace cuid2::core
