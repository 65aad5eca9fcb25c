#include "pgpcrypt/config/service_config.hpp"
#include "pgpcrypt/crypto/crypto_error.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace pgpcrypt {
namespace config {

namespace {

// Returns true and sets value when the variable is set
bool read_env(const char* name, std::string& value) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return false;
  }
  value = raw;
  return true;
}

} // namespace

KeySource ServiceConfig::key_source() const {
  if (!public_key_path.empty()) {
    if (!key_id.empty() || !key_server.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "Config: Public key path set together with key ID/keyserver, using " << public_key_path;
    }
    return LocalKeyFile{public_key_path};
  }
  if (!key_id.empty() && !key_server.empty()) {
    return RemoteKey{key_id, key_server};
  }
  return std::monostate{};
}

ServiceConfig load_from_environment() {
  ServiceConfig config;
  read_env(ENV_PUBLIC_KEY_PATH, config.public_key_path);
  read_env(ENV_PRIVATE_KEY_PATH, config.private_key_path);
  read_env(ENV_PASSPHRASE, config.passphrase);
  read_env(ENV_KEY_ID, config.key_id);
  read_env(ENV_KEYSERVER, config.key_server);
  read_env(ENV_CIPHER, config.cipher);

  std::string armor;
  if (read_env(ENV_ARMOR, armor)) {
    config.armor = parse_bool(ENV_ARMOR, armor);
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Loaded configuration from environment";
  return config;
}

bool parse_bool(const std::string& name, const std::string& value) {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw crypto::ConfigurationError("invalid boolean for " + name + ": " + value);
}

} // namespace config
} // namespace pgpcrypt
