#include "token.h"

#include "flakeid/core/id_generator.h"
#include "flakeid/core/random_token.h"

#include "generator_flags.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TokenCliConfig {
  std::size_t bytes{flakeid::core::kDefaultTokenBytes};
  flakeid::core::TokenEncoding encoding{flakeid::core::TokenEncoding::kBase64Url};
  std::string prefix;
  std::size_t count{1};
};

bool set_positive(const char* flag, std::size_t& out, const std::string& v) {
  const auto parsed = flakeid::cli::parse_int64_value(v);
  if (!parsed.has_value() || *parsed < 1) {
    std::cerr << "Invalid " << flag << ": " << v << " (expected a positive integer)\n";
    return false;
  }
  out = static_cast<std::size_t>(*parsed);
  return true;
}

}  // namespace

int cmd_token(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<flakeid::apps::Option<TokenCliConfig>> options = {
      {"--bytes", true, "Random bytes per token (default 32)",
       [](TokenCliConfig& c, const std::string& v) { return set_positive("--bytes", c.bytes, v); }},
      {"--encoding", true, "Token encoding (base64url|hex)",
       [](TokenCliConfig& c, const std::string& v) {
         const auto encoding = flakeid::core::parse_token_encoding(v);
         if (!encoding.has_value()) {
           std::cerr << "Invalid --encoding: " << v << " (valid: base64url, hex)\n";
           return false;
         }
         c.encoding = *encoding;
         return true;
       }},
      {"--prefix", true, "Prefix joined to each token with '-'",
       [](TokenCliConfig& c, const std::string& v) {
         c.prefix = v;
         return true;
       }},
      {"--count", true, "Number of tokens (default 1)",
       [](TokenCliConfig& c, const std::string& v) { return set_positive("--count", c.count, v); }},
  };

  if (flakeid::apps::has_help_flag(argc, argv, 2)) {
    std::cout << "Usage: flakeid_cli token [options]\n\nOptions:\n";
    flakeid::apps::print_option_help(std::cout, options);
    return 0;
  }

  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << "Run 'flakeid_cli token --help' for the accepted options.\n";
    return 1;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    return 1;
  }

  flakeid::core::RandomTokenIdGenerator id_gen(parsed.config.bytes, parsed.config.encoding);
  for (std::size_t i = 0; i < parsed.config.count; ++i) {
    std::cout << id_gen.next(parsed.config.prefix) << "\n";
  }
  return 0;
}
