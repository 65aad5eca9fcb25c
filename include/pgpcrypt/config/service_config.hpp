#ifndef PGPCRYPT_SERVICE_CONFIG_HPP
#define PGPCRYPT_SERVICE_CONFIG_HPP

#include <string>
#include <variant>

namespace pgpcrypt {
namespace config {

// Environment variables read by load_from_environment()
constexpr const char* ENV_PUBLIC_KEY_PATH = "PGPCRYPT_PUBLIC_KEY_PATH";
constexpr const char* ENV_PRIVATE_KEY_PATH = "PGPCRYPT_PRIVATE_KEY_PATH";
constexpr const char* ENV_PASSPHRASE = "PGPCRYPT_PASSPHRASE";
constexpr const char* ENV_KEY_ID = "PGPCRYPT_KEY_ID";
constexpr const char* ENV_KEYSERVER = "PGPCRYPT_KEYSERVER";
constexpr const char* ENV_ARMOR = "PGPCRYPT_ARMOR";
constexpr const char* ENV_CIPHER = "PGPCRYPT_CIPHER";

// Public key read from an armored file
struct LocalKeyFile {
  std::string path;
};

// Public key fetched by ID from a keyserver
struct RemoteKey {
  std::string key_id;
  std::string key_server;
};

// std::monostate: no usable key source configured
using KeySource = std::variant<std::monostate, LocalKeyFile, RemoteKey>;

struct ServiceConfig {
  std::string key_id;
  std::string key_server;
  std::string public_key_path;
  // Required for decryption
  std::string private_key_path;
  // Only used when the private key is passphrase-protected
  std::string passphrase;

  bool armor = false;
  std::string cipher = "AES256";

  // The public key path wins over key ID + keyserver when both are set
  KeySource key_source() const;
};

// Reads the PGPCRYPT_* variables; unset variables keep their defaults.
// Throws crypto::ConfigurationError on malformed values.
ServiceConfig load_from_environment();

// Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
// Throws crypto::ConfigurationError otherwise.
bool parse_bool(const std::string& name, const std::string& value);

} // namespace config
} // namespace pgpcrypt

#endif // PGPCRYPT_SERVICE_CONFIG_HPP
