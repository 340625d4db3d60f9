#include "cuid2/core/entropy.h"

#include <random>

namespace cuid2::core {

namespace {

constexpr int kBase = 36;
constexpr int kLetters = 26;

char base36_digit(const int value) {
  return value < 10 ? static_cast<char>('0' + value) : static_cast<char>('a' + (value - 10));
}

}  // namespace

Result<std::string> generate_entropy(ISeedSource& seed_source, const std::size_t length) {
  const auto seed = seed_source.next_seed();
  if (!seed.has_value()) {
    return Result<std::string>::err(seed.error());
  }

  std::mt19937_64 gen(seed.value());
  std::uniform_int_distribution<int> dist(0, kBase - 1);

  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(base36_digit(dist(gen)));
  }
  return Result<std::string>::ok(std::move(out));
}

Result<std::string> generate_entropy(const std::size_t length) {
  return generate_entropy(default_seed_source(), length);
}

Result<char> generate_random_letter(ISeedSource& seed_source) {
  const auto seed = seed_source.next_seed();
  if (!seed.has_value()) {
    return Result<char>::err(seed.error());
  }

  std::mt19937_64 gen(seed.value());
  std::uniform_int_distribution<int> dist(0, kLetters - 1);
  return Result<char>::ok(static_cast<char>('a' + dist(gen)));
}

Result<char> generate_random_letter() {
  return generate_random_letter(default_seed_source());
}

}  // namespace cuid2::core
