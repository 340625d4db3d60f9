#pragma once

#include <charconv>
#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cuid2::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. The parser keeps
// going after a failed handler but reports it through ParseOutcome::ok.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParseOutcome is the populated config plus the leftover positional tokens.
// ok is false if any flag was unknown, missing its value, or rejected by its handler.
template <typename Config>
struct ParseOutcome {
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
  bool ok{true};                        // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and collects non-flag tokens as positional arguments.
// Unknown flags are reported to stderr.
template <typename Config>
ParseOutcome<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                   const std::vector<Option<Config>>& options, int start = 1,
                                   Config default_config = {}) {
  ParseOutcome<Config> outcome{std::move(default_config), {}, true};
  Config& config = outcome.config;

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          if (!opt->handler(config,
                            argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            outcome.ok = false;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          outcome.ok = false;
        }
      } else if (!opt->handler(config, "")) {
        outcome.ok = false;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      // Only flag-like tokens are reported as unknown.
      std::cerr << "Unknown option: " << arg << "\n";
      outcome.ok = false;
    } else {
      outcome.positional.push_back(std::move(arg));
    }
  }

  return outcome;
}

// parse_size accepts a plain non-negative decimal integer and nothing else.
inline std::optional<std::size_t> parse_size(const std::string& value) {
  std::size_t out = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return out;
}

}  // namespace cuid2::apps
