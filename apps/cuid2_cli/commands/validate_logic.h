#pragma once

#include "cuid2/core/cuid.h"

#include <cstddef>
#include <ostream>
#include <string>

struct ValidateOptions {
  std::size_t min_length{cuid2::core::kMinLength};  // NOLINT(readability-identifier-naming)
  std::size_t max_length{cuid2::core::kMaxLength};  // NOLINT(readability-identifier-naming)
  bool json{false};                                 // NOLINT(readability-identifier-naming)
};

// execute_validate: format-check one id. Exit code 0 if valid, 1 otherwise.
int execute_validate(const std::string& id, const ValidateOptions& options, std::ostream& out);
