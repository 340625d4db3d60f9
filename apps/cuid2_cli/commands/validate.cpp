#include "validate.h"

#include "shared/arg_parser.h"
#include "validate_logic.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

bool store_size(std::size_t& target, const char* flag, const std::string& value) {
  const auto parsed = cuid2::apps::parse_size(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected a non-negative integer)\n";
    return false;
  }
  target = parsed.value();
  return true;
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<cuid2::apps::Option<ValidateOptions>> options = {
      {"--min", true, "Minimum accepted length (default 2)",
       [](ValidateOptions& c, const std::string& v) {
         return store_size(c.min_length, "--min", v);
       }},
      {"--max", true, "Maximum accepted length (default 32)",
       [](ValidateOptions& c, const std::string& v) {
         return store_size(c.max_length, "--max", v);
       }},
      {"--json", false, "Print a JSON document instead of valid/invalid",
       [](ValidateOptions& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  const auto parsed = cuid2::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positional.size() != 1) {
    std::cerr << "Usage: cuid2_cli validate <id> [--min N] [--max N] [--json]\n";
    return 1;
  }

  return execute_validate(parsed.positional.front(), parsed.config, std::cout);
}
