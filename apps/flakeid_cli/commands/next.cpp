#include "next.h"

#include "flakeid/core/clock.h"
#include "flakeid/core/id_generator.h"
#include "flakeid/snowflake/prefixed_id_generator.h"

#include "generator_flags.h"
#include "next_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct NextCliConfig {
  flakeid::cli::GeneratorCliConfig generator;
  std::size_t count{1};
  bool json{false};
};

bool set_count(std::size_t& out, const std::string& v) {
  const auto parsed = flakeid::cli::parse_int64_value(v);
  if (!parsed.has_value() || *parsed < 1) {
    std::cerr << "Invalid --count: " << v << " (expected a positive integer)\n";
    return false;
  }
  out = static_cast<std::size_t>(*parsed);
  return true;
}

// Resolves flags over the config file and builds the generator. Prints the error and
// returns nullptr on failure.
std::unique_ptr<flakeid::snowflake::SnowflakeGenerator> open_generator(
    const flakeid::cli::GeneratorCliConfig& cli, const flakeid::core::IClock& clock) {
  auto config = flakeid::cli::resolve_generator_config(cli);
  if (!config.has_value()) {
    std::cerr << "Error: " << config.error() << "\n";
    return nullptr;
  }
  return flakeid::cli::build_generator(config.value(), clock, cli.quiet, std::cerr);
}

}  // namespace

int cmd_next(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = flakeid::cli::generator_option_registry<NextCliConfig>();
  options.push_back({"--count", true, "Number of identifiers to mint (default 1)",
                     [](NextCliConfig& c, const std::string& v) { return set_count(c.count, v); }});
  options.push_back({"--json", false, "Print a JSON array instead of one id per line",
                     [](NextCliConfig& c, const std::string&) {
                       c.json = true;
                       return true;
                     }});

  if (flakeid::apps::has_help_flag(argc, argv, 2)) {
    std::cout << "Usage: flakeid_cli next [options]\n\nOptions:\n";
    flakeid::apps::print_option_help(std::cout, options);
    return 0;
  }

  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << "Run 'flakeid_cli next --help' for the accepted options.\n";
    return 1;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    return 1;
  }

  flakeid::core::SystemClock clock;
  auto generator = open_generator(parsed.config.generator, clock);
  if (!generator) {
    return 1;
  }

  return flakeid::cli::execute_next(*generator, parsed.config.count, parsed.config.json,
                                    std::cout, std::cerr);
}

int cmd_prefixed(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = flakeid::cli::generator_option_registry<NextCliConfig>();
  options.push_back({"--count", true, "Number of identifiers to mint (default 1)",
                     [](NextCliConfig& c, const std::string& v) { return set_count(c.count, v); }});

  if (flakeid::apps::has_help_flag(argc, argv, 2)) {
    std::cout << "Usage: flakeid_cli prefixed <prefix> [options]\n\nOptions:\n";
    flakeid::apps::print_option_help(std::cout, options);
    return 0;
  }

  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << "Run 'flakeid_cli prefixed --help' for the accepted options.\n";
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: flakeid_cli prefixed <prefix> [--count N] [generator flags]\n";
    return 1;
  }
  const std::string& prefix = parsed.positionals.front();

  flakeid::core::SystemClock clock;
  auto generator = open_generator(parsed.config.generator, clock);
  if (!generator) {
    return 1;
  }

  flakeid::snowflake::SnowflakeIdGenerator id_gen(*generator);
  try {
    for (std::size_t i = 0; i < parsed.config.count; ++i) {
      std::cout << id_gen.next(prefix) << "\n";
    }
  } catch (const flakeid::core::GenerationFailure& e) {
    flakeid::cli::print_generation_error(std::cerr, e.error());
    return 1;
  }
  return 0;
}
