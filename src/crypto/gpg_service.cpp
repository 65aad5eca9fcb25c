#include "pgpcrypt/crypto/gpg_service.hpp"
#include <sstream>
#include <type_traits>
#include <variant>
#include <boost/log/trivial.hpp>

namespace pgpcrypt::crypto {

namespace {

std::vector<uint8_t> to_bytes(const std::string& data) {
  return std::vector<uint8_t>(data.begin(), data.end());
}

std::string to_string(const std::vector<uint8_t>& data) {
  return std::string(data.begin(), data.end());
}

} // namespace

//==============================================
// CONSTRUCTORS
//==============================================

GpgService::GpgService(config::ServiceConfig config)
  : GpgService(std::move(config),
               std::make_shared<ArmoredKeyReader>(),
               std::make_shared<RnpEngine>(),
               keyserver::make_hkp_client_factory()) {
}

GpgService::GpgService(config::ServiceConfig config,
                       std::shared_ptr<KeyReader> key_reader,
                       std::shared_ptr<OpenPgpEngine> engine,
                       keyserver::ClientFactory client_factory)
  : config_(std::move(config))
  , key_reader_(std::move(key_reader))
  , engine_(std::move(engine))
  , client_factory_(std::move(client_factory)) {
  if (!key_reader_ || !engine_ || !client_factory_) {
    throw InitializationError("GPG service requires a key reader, an engine and a keyserver client factory");
  }
  BOOST_LOG_TRIVIAL(debug) << "GPG service: Initialized";
}

std::unique_ptr<GpgService> GpgService::create(const std::string& public_key_path,
                                               const std::string& private_key_path,
                                               const std::string& passphrase,
                                               const std::string& key_id,
                                               const std::string& key_server) {
  config::ServiceConfig config;
  config.public_key_path = public_key_path;
  config.private_key_path = private_key_path;
  config.passphrase = passphrase;
  config.key_id = key_id;
  config.key_server = key_server;
  return std::make_unique<GpgService>(std::move(config));
}


//==============================================
// ENCRYPTION
//==============================================

std::vector<uint8_t> GpgService::encrypt(const std::vector<uint8_t>& plaintext) {
  std::istringstream input(to_string(plaintext));
  std::ostringstream output;
  encrypt(input, output);
  return to_bytes(output.str());
}

void GpgService::encrypt(std::istream& input, std::ostream& output) {
  BOOST_LOG_TRIVIAL(info) << "GPG service: Encrypting";

  const EntityList recipients = std::visit([this](const auto& source) -> EntityList {
    using Source = std::decay_t<decltype(source)>;
    if constexpr (std::is_same_v<Source, config::LocalKeyFile>) {
      return resolve_local(source);
    } else if constexpr (std::is_same_v<Source, config::RemoteKey>) {
      return resolve_remote(source);
    } else {
      BOOST_LOG_TRIVIAL(error) << "GPG service: No public key path and no key ID + keyserver configured";
      throw ConfigurationError("unsupported configuration: set a public key path or a key ID and keyserver");
    }
  }, config_.key_source());

  encrypt_to(recipients, input, output);
}

void GpgService::encrypt_to(const EntityList& recipients, std::istream& input, std::ostream& output) {
  EncryptOptions options;
  options.armor = config_.armor;
  options.cipher = config_.cipher;

  try {
    engine_->encrypt(input, output, recipients, options);
  }
  catch (const EncryptionError& e) {
    BOOST_LOG_TRIVIAL(error) << "GPG service: Failed to encrypt: " << e.reason();
    throw EncryptionError("failed to encrypt: " + e.reason());
  }
  BOOST_LOG_TRIVIAL(info) << "GPG service: Encryption complete";
}


//==============================================
// DECRYPTION
//==============================================

std::vector<uint8_t> GpgService::decrypt(const std::vector<uint8_t>& ciphertext) {
  std::istringstream input(to_string(ciphertext));
  std::ostringstream output;
  decrypt(input, output);
  return to_bytes(output.str());
}

void GpgService::decrypt(std::istream& input, std::ostream& output) {
  BOOST_LOG_TRIVIAL(info) << "GPG service: Decrypting";

  KeyEntity private_key = load_private_key();

  if (private_key.is_protected()) {
    if (config_.passphrase.empty()) {
      BOOST_LOG_TRIVIAL(error) << "GPG service: Private key " << private_key.fingerprint()
                               << " is passphrase-protected and no passphrase is configured";
      throw PassphraseError("failed to decrypt private key: no passphrase configured");
    }
    try {
      private_key.unlock(config_.passphrase);
    }
    catch (const PassphraseError& e) {
      BOOST_LOG_TRIVIAL(error) << "GPG service: Failed to decrypt private key: " << e.reason();
      throw PassphraseError("failed to decrypt private key: " + e.reason());
    }
  }

  EntityList keys;
  keys.push_back(std::move(private_key));

  try {
    engine_->decrypt(input, output, keys);
  }
  catch (const DecryptionError& e) {
    BOOST_LOG_TRIVIAL(error) << "GPG service: Failed to decrypt: " << e.reason();
    throw DecryptionError("failed to decrypt: " + e.reason());
  }
  BOOST_LOG_TRIVIAL(info) << "GPG service: Decryption complete";
}


//==============================================
// KEY ACQUISITION
//==============================================

EntityList GpgService::resolve_local(const config::LocalKeyFile& source) {
  BOOST_LOG_TRIVIAL(debug) << "GPG service: Using public key file " << source.path;

  EntityList recipients;
  try {
    recipients.push_back(key_reader_->read_entity(source.path));
  }
  catch (const KeyReadError& e) {
    BOOST_LOG_TRIVIAL(error) << "GPG service: Failed to read public key: " << e.reason();
    throw KeyReadError("failed to read public key: " + e.reason());
  }
  return recipients;
}

EntityList GpgService::resolve_remote(const config::RemoteKey& source) {
  BOOST_LOG_TRIVIAL(debug) << "GPG service: Using key " << source.key_id << " from " << source.key_server;

  keyserver::KeyserverAddress address;
  try {
    address = keyserver::parse_keyserver(source.key_server);
  }
  catch (const KeyserverError& e) {
    throw KeyserverError("failed to parse keyserver: " + e.reason());
  }

  keyserver::KeyId key_id;
  try {
    key_id = keyserver::parse_key_id(source.key_id);
  }
  catch (const KeyserverError& e) {
    throw KeyserverError("failed to parse key: " + e.reason());
  }

  auto client = client_factory_(address);
  if (!client) {
    throw KeyserverError("failed to create keyserver client for " + address.to_string());
  }

  EntityList entities;
  try {
    entities = client->get_keys_by_id(key_id);
  }
  catch (const KeyserverError& e) {
    BOOST_LOG_TRIVIAL(error) << "GPG service: Failed to get key: " << e.reason();
    throw KeyserverError("failed to get key: " + e.reason());
  }

  if (entities.empty()) {
    BOOST_LOG_TRIVIAL(error) << "GPG service: No key " << key_id.search_term() << " on " << address.to_string();
    throw KeyserverError("no key found for " + key_id.search_term() + " on " + address.to_string());
  }
  if (entities.size() > 1) {
    BOOST_LOG_TRIVIAL(error) << "GPG service: " << entities.size() << " keys match " << key_id.search_term();
    throw KeyserverError("more than one key for " + key_id.search_term() + " on " + address.to_string());
  }
  return entities;
}

KeyEntity GpgService::load_private_key() {
  if (config_.private_key_path.empty()) {
    BOOST_LOG_TRIVIAL(error) << "GPG service: No private key path configured";
    throw ConfigurationError("no private key path configured");
  }

  try {
    KeyEntity key = key_reader_->read_entity(config_.private_key_path);
    if (!key.has_secret()) {
      throw KeyReadError(config_.private_key_path + " does not contain secret key material");
    }
    return key;
  }
  catch (const KeyReadError& e) {
    BOOST_LOG_TRIVIAL(error) << "GPG service: Failed to read private key: " << e.reason();
    throw KeyReadError("failed to read private key: " + e.reason());
  }
}

} // namespace pgpcrypt::crypto
