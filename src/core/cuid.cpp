#include "cuid2/core/cuid.h"

#include "cuid2/core/entropy.h"
#include "cuid2/core/fingerprint.h"
#include "cuid2/core/hashing.h"

namespace cuid2::core {

namespace {

bool is_lower_alpha(const char ch) {
  return ch >= 'a' && ch <= 'z';
}

bool is_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

}  // namespace

Result<std::string> CuidGenerator::next(const std::size_t length) {
  // Fail fast: no entropy drawn, counter untouched.
  if (length < kMinLength || length > kMaxLength) {
    return Result<std::string>::err(CuidError::invalid_length(length, kMinLength, kMaxLength));
  }

  const auto first_letter = generate_random_letter(seed_source_);
  if (!first_letter.has_value()) {
    return Result<std::string>::err(first_letter.error());
  }

  const auto millis = clock_.now_unix_millis();
  if (!millis.has_value()) {
    return Result<std::string>::err(millis.error());
  }
  const std::string timestamp = std::to_string(millis.value());

  const std::string count =
      std::to_string(counter_.fetch_add(1, std::memory_order_seq_cst));

  const auto salt = generate_entropy(seed_source_, length);
  if (!salt.has_value()) {
    return Result<std::string>::err(salt.error());
  }

  const auto fingerprint = generate_fingerprint(seed_source_);
  if (!fingerprint.has_value()) {
    return Result<std::string>::err(fingerprint.error());
  }

  // Fixed order: timestamp || salt || counter || fingerprint.
  std::string hash_input;
  hash_input.reserve(timestamp.size() + salt.value().size() + count.size() +
                     fingerprint.value().size());
  hash_input += timestamp;
  hash_input += salt.value();
  hash_input += count;
  hash_input += fingerprint.value();

  const std::string digest = compute_hash(hash_input, length);

  // The digest's own first character is replaced so the id always starts with a letter.
  std::string id;
  id.reserve(length);
  id.push_back(first_letter.value());
  id.append(digest, 1, length - 1);
  return Result<std::string>::ok(std::move(id));
}

std::atomic<std::uint64_t>& process_counter() {
  static std::atomic<std::uint64_t> counter{0};
  return counter;
}

std::uint64_t counter_value() {
  return process_counter().load(std::memory_order_seq_cst);
}

IIdGenerator& default_generator() {
  static SystemClock clock;
  static CuidGenerator generator(clock, default_seed_source(), process_counter());
  return generator;
}

Result<std::string> generate_cuid(const std::size_t length) {
  return default_generator().next(length);
}

Result<std::string> generate() {
  return generate_cuid(kDefaultLength);
}

bool is_valid_cuid(const std::string_view id, const std::size_t min_length,
                   const std::size_t max_length) {
  if (id.empty()) {
    return false;
  }
  if (id.size() < min_length || id.size() > max_length) {
    return false;
  }
  if (!is_lower_alpha(id.front())) {
    return false;
  }
  for (const char ch : id) {
    if (!is_lower_alpha(ch) && !is_digit(ch)) {
      return false;
    }
  }
  return true;
}

bool is_valid_cuid(const std::string_view id) {
  return is_valid_cuid(id, kMinLength, kMaxLength);
}

}  // namespace cuid2::core
