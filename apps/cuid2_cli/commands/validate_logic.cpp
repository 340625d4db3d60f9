#include "validate_logic.h"

#include <nlohmann/json.hpp>

int execute_validate(const std::string& id, const ValidateOptions& options, std::ostream& out) {
  const bool valid = cuid2::core::is_valid_cuid(id, options.min_length, options.max_length);

  if (options.json) {
    nlohmann::json doc;
    doc["id"] = id;
    doc["valid"] = valid;
    doc["min_length"] = options.min_length;
    doc["max_length"] = options.max_length;
    out << doc.dump(2) << "\n";
  } else {
    out << (valid ? "valid" : "invalid") << "\n";
  }
  return valid ? 0 : 1;
}
