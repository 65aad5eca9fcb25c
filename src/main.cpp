#include "pgpcrypt/cli/cli.hpp"
#include "pgpcrypt/config/service_config.hpp"
#include "pgpcrypt/logger/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  namespace cli = pgpcrypt::cli;
  const std::string program_name = argc > 0 ? argv[0] : "pgpcrypt";

  pgpcrypt::config::ServiceConfig environment;
  try {
    environment = pgpcrypt::config::load_from_environment();
  } catch (const pgpcrypt::crypto::ConfigurationError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return cli::EXIT_USAGE;
  }

  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  const auto options = cli::parse_command_line(args, environment);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    cli::print_usage(std::cerr, program_name);
    return cli::EXIT_USAGE;
  } else if (options.help) {
    cli::print_usage(std::cout, program_name);
    return cli::EXIT_OK;
  }

  try {
    pgpcrypt::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return cli::EXIT_OPERATION_FAILED;
  }

  cli::CLI app(std::cin, std::cout, std::cerr);
  return app.run(options);
}
