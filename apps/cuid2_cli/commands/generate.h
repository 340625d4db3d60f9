#pragma once

// cmd_generate: print one or more identifiers (--length, --count, --json)
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
