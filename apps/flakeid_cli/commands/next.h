#pragma once

// cmd_next: mint identifiers (--count N, --json)
// cmd_prefixed: mint "<prefix>-<id>" identifiers (positional prefix, --count N)
int cmd_next(int argc, char* argv[]);      // NOLINT(modernize-avoid-c-arrays)
int cmd_prefixed(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
