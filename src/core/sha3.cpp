#include "cuid2/core/sha3.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace cuid2::core {

namespace {

// FIPS 202 §6.1 — SHA3-512: capacity 1024 bits, so the rate is 1600 - 1024 = 576 bits.
constexpr std::size_t kRateBytes = 72u;
constexpr std::size_t kDigestBytes = 64u;
constexpr unsigned kRounds = 24u;

// FIPS 202 §3.2.5 — iota round constants RC[ir].
constexpr std::array<uint64_t, kRounds> kRoundConstants = {
    0x0000000000000001ull, 0x0000000000008082ull, 0x800000000000808aull, 0x8000000080008000ull,
    0x000000000000808bull, 0x0000000080000001ull, 0x8000000080008081ull, 0x8000000000008009ull,
    0x000000000000008aull, 0x0000000000000088ull, 0x0000000080008009ull, 0x000000008000000aull,
    0x000000008000808bull, 0x800000000000008bull, 0x8000000000008089ull, 0x8000000000008003ull,
    0x8000000000008002ull, 0x8000000000000080ull, 0x000000000000800aull, 0x800000008000000aull,
    0x8000000080008081ull, 0x8000000000008080ull, 0x0000000080000001ull, 0x8000000080008008ull,
};

// FIPS 202 §3.2.2/§3.2.3 — rho offsets, listed in the order pi visits the lanes.
constexpr std::array<unsigned, 24> kRhoOffsets = {
    1u, 3u, 6u, 10u, 15u, 21u, 28u, 36u, 45u, 55u, 2u, 14u,
    27u, 41u, 56u, 8u, 25u, 43u, 62u, 18u, 39u, 61u, 20u, 44u,
};

// Lane visited at each pi step, as x + 5y.
constexpr std::array<unsigned, 24> kPiLanes = {
    10u, 7u, 11u, 17u, 18u, 3u, 5u, 16u, 8u, 21u, 24u, 4u,
    15u, 23u, 19u, 13u, 12u, 2u, 20u, 14u, 22u, 9u, 6u, 1u,
};

using State = std::array<uint64_t, 25>;

constexpr uint64_t rotl64(uint64_t x, unsigned n) noexcept {
  return (x << n) | (x >> (64u - n));
}

// FIPS 202 §3.3 — Keccak-f[1600]. Mutates state in place.
void keccak_f1600(State& a) noexcept {
  std::array<uint64_t, 5> c{};

  for (unsigned round = 0; round < kRounds; ++round) {
    // theta
    for (unsigned x = 0; x < 5u; ++x) {
      c[x] = a[x] ^ a[x + 5u] ^ a[x + 10u] ^ a[x + 15u] ^ a[x + 20u];
    }
    for (unsigned x = 0; x < 5u; ++x) {
      const uint64_t d = c[(x + 4u) % 5u] ^ rotl64(c[(x + 1u) % 5u], 1u);
      for (unsigned y = 0; y < 25u; y += 5u) {
        a[y + x] ^= d;
      }
    }

    // rho and pi
    uint64_t carry = a[1];
    for (unsigned i = 0; i < 24u; ++i) {
      const unsigned lane = kPiLanes[i];
      const uint64_t next = a[lane];
      a[lane] = rotl64(carry, kRhoOffsets[i]);
      carry = next;
    }

    // chi
    for (unsigned y = 0; y < 25u; y += 5u) {
      for (unsigned x = 0; x < 5u; ++x) {
        c[x] = a[y + x];
      }
      for (unsigned x = 0; x < 5u; ++x) {
        a[y + x] ^= (~c[(x + 1u) % 5u]) & c[(x + 2u) % 5u];
      }
    }

    // iota
    a[0] ^= kRoundConstants[round];
  }
}

// XOR one byte into the state at byte offset `pos` (lanes are little-endian).
inline void xor_byte(State& state, std::size_t pos, uint8_t byte) noexcept {
  state[pos / 8u] ^= static_cast<uint64_t>(byte) << ((pos % 8u) * 8u);
}

inline uint8_t read_byte(const State& state, std::size_t pos) noexcept {
  return static_cast<uint8_t>(state[pos / 8u] >> ((pos % 8u) * 8u));
}

}  // namespace

std::string sha3_512_hex(std::string_view input) {
  State state{};

  // FIPS 202 §4 — absorb full rate-sized blocks.
  std::size_t offset = 0;
  while (input.size() - offset >= kRateBytes) {
    for (std::size_t i = 0; i < kRateBytes; ++i) {
      xor_byte(state, i, static_cast<uint8_t>(input[offset + i]));
    }
    keccak_f1600(state);
    offset += kRateBytes;
  }

  // Absorb the tail, then pad10*1 with the SHA-3 domain suffix (0x06 ... 0x80).
  const std::size_t tail = input.size() - offset;
  for (std::size_t i = 0; i < tail; ++i) {
    xor_byte(state, i, static_cast<uint8_t>(input[offset + i]));
  }
  xor_byte(state, tail, 0x06u);
  xor_byte(state, kRateBytes - 1u, 0x80u);
  keccak_f1600(state);

  // Squeeze: the 64-byte digest fits inside a single 72-byte rate block.
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < kDigestBytes; ++i) {
    oss << std::setw(2) << static_cast<unsigned>(read_byte(state, i));
  }
  return oss.str();
}

}  // namespace cuid2::core
