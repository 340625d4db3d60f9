#include "cuid2/core/clock.h"
#include "cuid2/core/cuid.h"
#include "cuid2/core/seed_source.h"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include "validate_logic.h"
#include <atomic>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace cuid2;

namespace {

// Hands out ids from a fixed list, then fails with a random-source error.
class ScriptedIdGenerator final : public core::IIdGenerator {
 public:
  explicit ScriptedIdGenerator(std::vector<std::string> ids) : ids_(std::move(ids)) {}

  using core::IIdGenerator::next;
  core::Result<std::string> next(std::size_t /*length*/) override {
    if (index_ >= ids_.size()) {
      return core::Result<std::string>::err(core::CuidError::random_source("exhausted"));
    }
    return core::Result<std::string>::ok(ids_[index_++]);
  }

 private:
  std::vector<std::string> ids_;
  std::size_t index_{0};
};

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

// ── generate ────────────────────────────────────────────────────────────────

TEST_CASE("execute_generate: prints one id per line", "[cli][generate]") {
  core::FixedClock clock(1700000000000);
  core::OsSeedSource seeds;
  std::atomic<std::uint64_t> counter{0};
  core::CuidGenerator generator(clock, seeds, counter);

  GenerateOptions options;
  options.length = 10;
  options.count = 5;
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(execute_generate(options, generator, out, err) == 0);
  const auto lines = split_lines(out.str());
  REQUIRE(lines.size() == 5);
  for (const auto& line : lines) {
    CHECK(line.size() == 10);
    CHECK(core::is_valid_cuid(line));
  }
  CHECK(err.str().empty());
  CHECK(counter.load() == 5);
}

TEST_CASE("execute_generate: --json emits length, count and ids", "[cli][generate]") {
  ScriptedIdGenerator generator({"aaaa", "bbbb"});
  GenerateOptions options;
  options.length = 4;
  options.count = 2;
  options.json = true;
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(execute_generate(options, generator, out, err) == 0);
  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["length"] == 4);
  CHECK(doc["count"] == 2);
  REQUIRE(doc["ids"].size() == 2);
  CHECK(doc["ids"][0] == "aaaa");
  CHECK(doc["ids"][1] == "bbbb");
}

TEST_CASE("execute_generate: invalid length prints the error and exits 1", "[cli][generate]") {
  GenerateOptions options;
  options.length = 33;
  std::ostringstream out;
  std::ostringstream err;

  CHECK(execute_generate(options, core::default_generator(), out, err) == 1);
  CHECK(out.str().empty());
  CHECK(err.str() == "Error: Invalid CUID length: 33, expected between 2 and 32\n");
}

TEST_CASE("execute_generate: a mid-batch failure prints nothing to stdout", "[cli][generate]") {
  ScriptedIdGenerator generator({"aaaa"});
  GenerateOptions options;
  options.count = 3;
  std::ostringstream out;
  std::ostringstream err;

  CHECK(execute_generate(options, generator, out, err) == 1);
  CHECK(out.str().empty());
  CHECK(err.str() == "Error: Random source error: exhausted\n");
}

TEST_CASE("execute_generate: zero count is rejected", "[cli][generate]") {
  ScriptedIdGenerator generator({});
  GenerateOptions options;
  options.count = 0;
  std::ostringstream out;
  std::ostringstream err;

  CHECK(execute_generate(options, generator, out, err) == 1);
  CHECK(err.str() == "Error: --count must be between 1 and 1000000\n");
}

TEST_CASE("execute_generate: oversized count is rejected before any id is drawn",
          "[cli][generate]") {
  core::FixedClock clock(1700000000000);
  core::FixedSeedSource seeds(5);
  std::atomic<std::uint64_t> counter{0};
  core::CuidGenerator generator(clock, seeds, counter);

  for (const std::size_t count : {kMaxCount + 1, std::numeric_limits<std::size_t>::max()}) {
    GenerateOptions options;
    options.count = count;
    options.length = 33;
    std::ostringstream out;
    std::ostringstream err;

    CHECK(execute_generate(options, generator, out, err) == 1);
    CHECK(out.str().empty());
    CHECK(err.str() == "Error: --count must be between 1 and 1000000\n");
  }
  CHECK(counter.load() == 0);
}

TEST_CASE("execute_generate: kMaxCount itself is accepted", "[cli][generate]") {
  std::vector<std::string> ids(kMaxCount, "ab");
  ScriptedIdGenerator generator(std::move(ids));
  GenerateOptions options;
  options.length = 2;
  options.count = kMaxCount;
  std::ostringstream out;
  std::ostringstream err;

  CHECK(execute_generate(options, generator, out, err) == 0);
  CHECK(err.str().empty());
}

// ── validate ────────────────────────────────────────────────────────────────

TEST_CASE("execute_validate: plain output and exit codes", "[cli][validate]") {
  ValidateOptions options;
  std::ostringstream valid_out;
  std::ostringstream invalid_out;

  CHECK(execute_validate("abc123", options, valid_out) == 0);
  CHECK(valid_out.str() == "valid\n");
  CHECK(execute_validate("1abc", options, invalid_out) == 1);
  CHECK(invalid_out.str() == "invalid\n");
}

TEST_CASE("execute_validate: --json reports the bounds used", "[cli][validate]") {
  ValidateOptions options;
  options.min_length = 4;
  options.max_length = 8;
  options.json = true;
  std::ostringstream out;

  CHECK(execute_validate("abc", options, out) == 1);
  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["id"] == "abc");
  CHECK(doc["valid"] == false);
  CHECK(doc["min_length"] == 4);
  CHECK(doc["max_length"] == 8);
}

// ── option parsing ──────────────────────────────────────────────────────────

TEST_CASE("parse_size: accepts plain decimal integers only", "[cli][args]") {
  CHECK(apps::parse_size("0") == std::optional<std::size_t>{0});
  CHECK(apps::parse_size("24") == std::optional<std::size_t>{24});
  CHECK_FALSE(apps::parse_size("").has_value());
  CHECK_FALSE(apps::parse_size("-1").has_value());
  CHECK_FALSE(apps::parse_size("12a").has_value());
  CHECK_FALSE(apps::parse_size(" 3").has_value());
}

TEST_CASE("parse_options: flags, positionals and failures", "[cli][args]") {
  const std::vector<apps::Option<ValidateOptions>> options = {
      {"--max", true, "max",
       [](ValidateOptions& c, const std::string& v) {
         const auto parsed = apps::parse_size(v);
         if (!parsed.has_value()) {
           return false;
         }
         c.max_length = parsed.value();
         return true;
       }},
      {"--json", false, "json",
       [](ValidateOptions& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };

  SECTION("recognised flags and a positional") {
    std::vector<std::string> args = {"cuid2_cli", "validate", "abc", "--max", "8", "--json"};
    std::vector<char*> argv;
    for (auto& a : args) {
      argv.push_back(a.data());
    }
    const auto parsed =
        apps::parse_options(static_cast<int>(argv.size()), argv.data(), options, 2);
    CHECK(parsed.ok);
    CHECK(parsed.config.max_length == 8);
    CHECK(parsed.config.json);
    REQUIRE(parsed.positional.size() == 1);
    CHECK(parsed.positional.front() == "abc");
  }

  SECTION("a rejected value marks the parse as failed") {
    std::vector<std::string> args = {"cuid2_cli", "validate", "--max", "lots"};
    std::vector<char*> argv;
    for (auto& a : args) {
      argv.push_back(a.data());
    }
    const auto parsed =
        apps::parse_options(static_cast<int>(argv.size()), argv.data(), options, 2);
    CHECK_FALSE(parsed.ok);
    CHECK(parsed.config.max_length == core::kMaxLength);
  }

  SECTION("unknown flags and missing values mark the parse as failed") {
    std::vector<std::string> args = {"cuid2_cli", "validate", "--bogus", "--max"};
    std::vector<char*> argv;
    for (auto& a : args) {
      argv.push_back(a.data());
    }
    const auto parsed =
        apps::parse_options(static_cast<int>(argv.size()), argv.data(), options, 2);
    CHECK_FALSE(parsed.ok);
  }
}
