#pragma once

#include "cuid2/core/cuid.h"

#include <cstddef>
#include <ostream>

// Upper bound for --count; every id is buffered before anything is printed.
constexpr std::size_t kMaxCount = 1'000'000;

struct GenerateOptions {
  std::size_t length{cuid2::core::kDefaultLength};  // NOLINT(readability-identifier-naming)
  std::size_t count{1};                             // NOLINT(readability-identifier-naming)
  bool json{false};                                 // NOLINT(readability-identifier-naming)
};

// execute_generate: draw `count` ids of `length` from the generator and print them,
// one per line or as a JSON document. Nothing is printed to `out` unless every id
// was generated; the first failure goes to `err` and yields exit code 1.
int execute_generate(const GenerateOptions& options, cuid2::core::IIdGenerator& generator,
                     std::ostream& out, std::ostream& err);
