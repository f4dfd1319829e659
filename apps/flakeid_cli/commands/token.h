#pragma once

// cmd_token: print secure random tokens (--bytes N, --encoding base64url|hex, --prefix P,
// --count N)
int cmd_token(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
