#include "pgpcrypt/cli/cli.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace pgpcrypt {
namespace cli {

namespace {

enum class Flag {
  In,
  Out,
  PublicKey,
  PrivateKey,
  Passphrase,
  KeyId,
  Keyserver,
  Cipher,
  LogFile,
  LogLevel,
  Armor,
  Help
};

const std::unordered_map<std::string, Flag> flag_map = {
  {"--in",          Flag::In},
  {"--out",         Flag::Out},
  {"--public-key",  Flag::PublicKey},
  {"--private-key", Flag::PrivateKey},
  {"--passphrase",  Flag::Passphrase},
  {"--key-id",      Flag::KeyId},
  {"--keyserver",   Flag::Keyserver},
  {"--cipher",      Flag::Cipher},
  {"--log-file",    Flag::LogFile},
  {"--log-level",   Flag::LogLevel},
  {"--armor",       Flag::Armor},
  {"--help",        Flag::Help},
  {"-h",            Flag::Help}
};

bool takes_value(Flag flag) {
  return flag != Flag::Armor && flag != Flag::Help;
}

ProgramOptions invalid(ProgramOptions options, const std::string& error) {
  options.valid = false;
  options.error = error;
  return options;
}

const char* command_name(Command command) {
  switch (command) {
    case Command::Encrypt: return "encrypt";
    case Command::Decrypt: return "decrypt";
    default:               return "none";
  }
}

} // namespace

//==============================================
// ARGUMENT PARSING
//==============================================

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " <encrypt|decrypt> [options]\n"
      << "Options:\n"
      << "  --in <file>            Input file (default: stdin)\n"
      << "  --out <file>           Output file (default: stdout)\n"
      << "  --public-key <file>    Armored public key (encrypt)\n"
      << "  --private-key <file>   Armored secret key (decrypt)\n"
      << "  --passphrase <text>    Passphrase for the secret key\n"
      << "  --key-id <id>          Key ID to fetch from the keyserver (encrypt)\n"
      << "  --keyserver <url>      Keyserver address, e.g. hkps://keys.openpgp.org (encrypt)\n"
      << "  --armor                ASCII-armor the ciphertext\n"
      << "  --cipher <name>        Symmetric cipher (default: AES256)\n"
      << "  --log-file <file>      Write the log to <file> instead of stderr\n"
      << "  --log-level <level>    trace|debug|info|warning|error|fatal (default: warning)\n"
      << "  -h, --help             Print this message\n"
      << "Environment: " << config::ENV_PUBLIC_KEY_PATH << ", " << config::ENV_PRIVATE_KEY_PATH << ", "
      << config::ENV_PASSPHRASE << ",\n"
      << "  " << config::ENV_KEY_ID << ", " << config::ENV_KEYSERVER << ", "
      << config::ENV_ARMOR << ", " << config::ENV_CIPHER << "\n"
      << "Example: " << program_name << " encrypt --public-key alice.asc --in note.txt --out note.gpg\n";
}

ProgramOptions parse_command_line(const std::vector<std::string>& args, config::ServiceConfig base) {
  ProgramOptions options;
  options.config = std::move(base);

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg.rfind("-", 0) != 0) {
      if (options.command != Command::None) {
        return invalid(std::move(options), "Unexpected argument: " + arg);
      }
      if (arg == "encrypt") {
        options.command = Command::Encrypt;
      } else if (arg == "decrypt") {
        options.command = Command::Decrypt;
      } else {
        return invalid(std::move(options), "Unknown command: " + arg);
      }
      continue;
    }

    const auto found = flag_map.find(arg);
    if (found == flag_map.end()) {
      return invalid(std::move(options), "Unknown argument: " + arg);
    }

    const Flag flag = found->second;
    std::string value;
    if (takes_value(flag)) {
      if (i + 1 >= args.size()) {
        return invalid(std::move(options), "Missing value for " + arg);
      }
      value = args[++i];
    }

    switch (flag) {
      case Flag::In:         options.input_path = value; break;
      case Flag::Out:        options.output_path = value; break;
      case Flag::PublicKey:  options.config.public_key_path = value; break;
      case Flag::PrivateKey: options.config.private_key_path = value; break;
      case Flag::Passphrase: options.config.passphrase = value; break;
      case Flag::KeyId:      options.config.key_id = value; break;
      case Flag::Keyserver:  options.config.key_server = value; break;
      case Flag::Cipher:     options.config.cipher = value; break;
      case Flag::LogFile:    options.log_file = value; break;
      case Flag::Armor:      options.config.armor = true; break;
      case Flag::Help:       options.help = true; break;
      case Flag::LogLevel:
        try {
          options.log_level = logging::parse_severity(value);
        }
        catch (const crypto::ConfigurationError& e) {
          return invalid(std::move(options), e.reason());
        }
        break;
    }
  }

  if (options.help) {
    options.valid = true;
    return options;
  }
  if (options.command == Command::None) {
    return invalid(std::move(options), "A command is required (encrypt or decrypt)");
  }

  options.valid = true;
  return options;
}


//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(std::istream& in, std::ostream& out, std::ostream& err)
  : in_(in)
  , out_(out)
  , err_(err) {
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const ProgramOptions& options) {
  if (!options.valid || options.command == Command::None) {
    err_ << "Error: " << (options.error.empty() ? "Invalid arguments" : options.error) << '\n';
    return EXIT_USAGE;
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Running " << command_name(options.command);

  std::ifstream input_file;
  if (!options.input_path.empty()) {
    input_file.open(options.input_path, std::ios::binary);
    if (!input_file) {
      log_and_display_error("Failed to open input file", options.input_path);
      return EXIT_OPERATION_FAILED;
    }
  }
  std::istream& input = options.input_path.empty() ? in_ : input_file;

  // Output is only written once the operation has succeeded
  std::ostringstream result;
  try {
    crypto::GpgService service(options.config);
    process_command(service, options.command, input, result);
    write_result(options, result.str());
  }
  catch (const crypto::CryptoError& e) {
    log_and_display_error(std::string("Failed to ") + command_name(options.command), e.what());
    return EXIT_OPERATION_FAILED;
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: " << command_name(options.command) << " finished";
  return EXIT_OK;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(crypto::GpgService& service, Command command, std::istream& input, std::ostream& output) {
  if (command == Command::Encrypt) {
    service.encrypt(input, output);
  } else {
    service.decrypt(input, output);
  }
}

void CLI::write_result(const ProgramOptions& options, const std::string& result) {
  if (options.output_path.empty()) {
    out_.write(result.data(), static_cast<std::streamsize>(result.size()));
    out_.flush();
    if (!out_) {
      throw crypto::CryptoError("failed to write to standard output");
    }
    return;
  }

  std::ofstream file(options.output_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw crypto::CryptoError("failed to open output file " + options.output_path);
  }
  file.write(result.data(), static_cast<std::streamsize>(result.size()));
  if (!file) {
    throw crypto::CryptoError("failed to write output file " + options.output_path);
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << "Error: " << message << ": " << error << '\n';
}

} // namespace cli
} // namespace pgpcrypt
