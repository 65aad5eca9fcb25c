#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include "pgpcrypt/config/service_config.hpp"
#include "pgpcrypt/crypto/gpg_service.hpp"
#include "pgpcrypt/logger/logger.hpp"

namespace pgpcrypt {
namespace cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_OPERATION_FAILED = 2;

enum class Command {
  None,
  Encrypt,
  Decrypt
};

struct ProgramOptions {
  Command command{Command::None};
  std::string input_path;
  std::string output_path;
  std::string log_file;
  logging::severity_level log_level{boost::log::trivial::warning};
  config::ServiceConfig config;
  bool help{false};
  bool valid{false};
  std::string error;
};

void print_usage(std::ostream& out, const std::string& program_name);

// Overlays the flags in args (program name excluded) on base
ProgramOptions parse_command_line(const std::vector<std::string>& args, config::ServiceConfig base = {});

class CLI {
public:
  // ---- CONSTRUCTOR ----
  // in/out are used when no --in/--out file is given
  CLI(std::istream& in, std::ostream& out, std::ostream& err);


  // ---- STARTUP ----
  // Returns the process exit status
  int run(const ProgramOptions& options);

private:
  // ---- PARAMETERS ----
  std::istream& in_;
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND PROCESSING ----
  void process_command(crypto::GpgService& service, Command command, std::istream& input, std::ostream& output);
  void write_result(const ProgramOptions& options, const std::string& result);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace pgpcrypt
