#include "decode.h"

#include "flakeid/snowflake/generator_config.h"
#include "flakeid/snowflake/generator_options.h"

#include "decode_logic.h"
#include "generator_flags.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct DecodeCliConfig {
  flakeid::cli::GeneratorCliConfig generator;
};

}  // namespace

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = flakeid::cli::generator_option_registry<DecodeCliConfig>();
  if (flakeid::apps::has_help_flag(argc, argv, 2)) {
    std::cout << "Usage: flakeid_cli decode <id>... [options]\n\nOptions:\n";
    flakeid::apps::print_option_help(std::cout, options);
    return 0;
  }

  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << "Run 'flakeid_cli decode --help' for the accepted options.\n";
    return 1;
  }

  auto config = flakeid::cli::resolve_generator_config(parsed.config.generator);
  if (!config.has_value()) {
    std::cerr << "Error: " << config.error() << "\n";
    return 1;
  }

  // Decoding only needs the layout and epoch; the worker id is irrelevant.
  const auto layout = flakeid::snowflake::resolve_layout(config.value().options);
  if (!layout.has_value()) {
    std::cerr << "Error: invalid generator configuration: " << layout.error().message << "\n";
    return 1;
  }
  const std::string options_error = flakeid::snowflake::validate_options(config.value().options);
  if (!options_error.empty()) {
    std::cerr << "Error: invalid generator configuration: " << options_error << "\n";
    return 1;
  }

  return flakeid::cli::execute_decode(parsed.positionals, layout.value(),
                                      config.value().options.epoch_unix_ms, std::cout, std::cerr);
}

int cmd_layout(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = flakeid::cli::generator_option_registry<DecodeCliConfig>();
  if (flakeid::apps::has_help_flag(argc, argv, 2)) {
    std::cout << "Usage: flakeid_cli layout [options]\n\nOptions:\n";
    flakeid::apps::print_option_help(std::cout, options);
    return 0;
  }

  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << "Run 'flakeid_cli layout --help' for the accepted options.\n";
    return 1;
  }

  auto config = flakeid::cli::resolve_generator_config(parsed.config.generator);
  if (!config.has_value()) {
    std::cerr << "Error: " << config.error() << "\n";
    return 1;
  }

  const auto layout = flakeid::snowflake::resolve_layout(config.value().options);
  if (!layout.has_value()) {
    std::cerr << "Error: invalid generator configuration: " << layout.error().message << "\n";
    return 1;
  }
  const std::string options_error = flakeid::snowflake::validate_options(config.value().options);
  if (!options_error.empty()) {
    std::cerr << "Error: invalid generator configuration: " << options_error << "\n";
    return 1;
  }

  std::cout << flakeid::snowflake::to_json(config.value()) << "\n";
  return 0;
}
