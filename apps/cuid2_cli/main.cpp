#include "cuid2/core/version.h"

#include "commands/generate.h"
#include "commands/validate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: cuid2_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  generate [--length N] [--count N] [--json]   Print new identifiers\n"
            << "  validate <id> [--min N] [--max N] [--json]   Check an identifier's format\n"
            << "  version                                      Print the build version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "version") {
    std::cout << "cuid2 v" << cuid2::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
