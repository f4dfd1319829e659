#include "flakeid/core/version.h"

#include "commands/decode.h"
#include "commands/next.h"
#include "commands/token.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: flakeid_cli <command> [options]\n"
               "\n"
               "Commands:\n"
               "  next       Mint Snowflake identifiers (--count N, --json)\n"
               "  prefixed   Mint '<prefix>-<id>' identifiers (prefixed <prefix> [--count N])\n"
               "  decode     Split identifiers into timestamp/worker/sequence (decode <id>...)\n"
               "  layout     Print the effective generator configuration as JSON\n"
               "  token      Print secure random tokens (--bytes N, --encoding base64url|hex)\n"
               "  version    Print the version\n"
               "\n"
               "Generator options (next, prefixed, decode, layout):\n"
               "  --config <file>  --worker-id N  --worker-source static|hostname|pid|datacenter\n"
               "  --datacenter-id N  --datacenter-bits N  --epoch <ISO-8601|unix-ms>\n"
               "  --worker-bits N  --sequence-bits N  --rollback-tolerance-ms N  --max-wait-ms N\n"
               "  --quiet\n";
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  if (command == "next") {
    return cmd_next(argc, argv);
  }
  if (command == "prefixed") {
    return cmd_prefixed(argc, argv);
  }
  if (command == "decode") {
    return cmd_decode(argc, argv);
  }
  if (command == "layout") {
    return cmd_layout(argc, argv);
  }
  if (command == "token") {
    return cmd_token(argc, argv);
  }
  if (command == "version" || command == "--version") {
    std::cout << "flakeid " << flakeid::core::kBuildVersion << "\n";
    return 0;
  }
  if (command == "help" || command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << command << "\n";
  print_usage();
  return 1;
}
