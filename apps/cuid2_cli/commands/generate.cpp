#include "generate.h"

#include "cuid2/core/cuid.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<cuid2::apps::Option<GenerateOptions>> options = {
      {"--length", true, "Identifier length (2-32, default 24)",
       [](GenerateOptions& c, const std::string& v) {
         const auto parsed = cuid2::apps::parse_size(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --length: " << v << " (expected a non-negative integer)\n";
           return false;
         }
         c.length = parsed.value();
         return true;
       }},
      {"--count", true, "Number of identifiers to print (1-1000000, default 1)",
       [](GenerateOptions& c, const std::string& v) {
         const auto parsed = cuid2::apps::parse_size(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --count: " << v << " (expected a non-negative integer)\n";
           return false;
         }
         c.count = parsed.value();
         return true;
       }},
      {"--json", false, "Print a JSON document instead of one id per line",
       [](GenerateOptions& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  const auto parsed = cuid2::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }
  if (!parsed.positional.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positional.front() << "\n";
    return 1;
  }

  return execute_generate(parsed.config, cuid2::core::default_generator(), std::cout, std::cerr);
}
