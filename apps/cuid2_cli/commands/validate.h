#pragma once

// cmd_validate: format-check an id given as the first positional argument (--min, --max, --json)
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
