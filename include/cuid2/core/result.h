#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace cuid2::core {

// Error kinds following E.14 (use purpose-designed types as error indicators).
enum class CuidErrorKind {
  kInvalidLength,  // requested length outside [min, max]
  kClock,          // system clock unavailable or before the Unix epoch
  kRandomSource,   // OS entropy source failed
};

// CuidError carries the kind plus its diagnostic payload.
// requested/min_length/max_length are only meaningful for kInvalidLength;
// detail is only meaningful for kClock and kRandomSource.
struct CuidError {
  CuidErrorKind kind{CuidErrorKind::kInvalidLength};  // NOLINT(readability-identifier-naming)
  std::size_t requested{0};                           // NOLINT(readability-identifier-naming)
  std::size_t min_length{0};                          // NOLINT(readability-identifier-naming)
  std::size_t max_length{0};                          // NOLINT(readability-identifier-naming)
  std::string detail;                                 // NOLINT(readability-identifier-naming)

  static CuidError invalid_length(std::size_t requested, std::size_t min_length,
                                  std::size_t max_length) {
    return CuidError{CuidErrorKind::kInvalidLength, requested, min_length, max_length, {}};
  }
  static CuidError clock(std::string detail) {
    return CuidError{CuidErrorKind::kClock, 0, 0, 0, std::move(detail)};
  }
  static CuidError random_source(std::string detail) {
    return CuidError{CuidErrorKind::kRandomSource, 0, 0, 0, std::move(detail)};
  }

  bool operator==(const CuidError&) const = default;
};

// to_string renders a one-line diagnostic, e.g.
// "Invalid CUID length: 33, expected between 2 and 32".
[[nodiscard]] std::string to_string(const CuidError& error);

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E = CuidError>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

  std::variant<T, E> data_;
};

}  // namespace cuid2::core
