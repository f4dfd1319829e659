#pragma once

// cmd_decode: split identifiers into timestamp / worker / sequence using the generator
// layout flags (no worker id needed)
// cmd_layout: print the effective generator configuration as JSON
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_layout(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
