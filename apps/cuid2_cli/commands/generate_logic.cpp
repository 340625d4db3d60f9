#include "generate_logic.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

int execute_generate(const GenerateOptions& options, cuid2::core::IIdGenerator& generator,
                     std::ostream& out, std::ostream& err) {
  if (options.count == 0 || options.count > kMaxCount) {
    err << "Error: --count must be between 1 and " << kMaxCount << "\n";
    return 1;
  }

  std::vector<std::string> ids;
  ids.reserve(options.count);
  for (std::size_t i = 0; i < options.count; ++i) {
    auto result = generator.next(options.length);
    if (!result.has_value()) {
      err << "Error: " << cuid2::core::to_string(result.error()) << "\n";
      return 1;
    }
    ids.push_back(result.value());
  }

  if (options.json) {
    nlohmann::json doc;
    doc["length"] = options.length;
    doc["count"] = options.count;
    doc["ids"] = ids;
    out << doc.dump(2) << "\n";
    return 0;
  }

  for (const auto& id : ids) {
    out << id << "\n";
  }
  return 0;
}
