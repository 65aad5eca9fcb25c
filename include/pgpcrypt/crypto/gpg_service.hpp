#ifndef PGPCRYPT_GPG_SERVICE_HPP
#define PGPCRYPT_GPG_SERVICE_HPP

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "crypt.hpp"
#include "key_reader.hpp"
#include "openpgp_engine.hpp"
#include "pgpcrypt/config/service_config.hpp"
#include "pgpcrypt/keyserver/keyserver_client.hpp"

namespace pgpcrypt::crypto {

// OpenPGP encryption with a local public key file or a key fetched from a
// keyserver, and decryption with a local (optionally passphrase-protected)
// secret key file. Key material is read fresh for every call.
class GpgService : public Crypt {
public:
  // ---- CONSTRUCTORS ----
  // Production collaborators: armored key files, librnp, HKP
  explicit GpgService(config::ServiceConfig config);
  GpgService(config::ServiceConfig config,
             std::shared_ptr<KeyReader> key_reader,
             std::shared_ptr<OpenPgpEngine> engine,
             keyserver::ClientFactory client_factory);

  static std::unique_ptr<GpgService> create(const std::string& public_key_path,
                                            const std::string& private_key_path,
                                            const std::string& passphrase,
                                            const std::string& key_id,
                                            const std::string& key_server);


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Throws ConfigurationError, KeyReadError, KeyserverError or EncryptionError
  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext) override;
  // Throws ConfigurationError, KeyReadError, PassphraseError or DecryptionError
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext) override;

  void encrypt(std::istream& input, std::ostream& output);
  void decrypt(std::istream& input, std::ostream& output);


  // ---- GETTERS ----
  const config::ServiceConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  config::ServiceConfig config_;
  std::shared_ptr<KeyReader> key_reader_;
  std::shared_ptr<OpenPgpEngine> engine_;
  keyserver::ClientFactory client_factory_;


  // ---- KEY ACQUISITION ----
  EntityList resolve_local(const config::LocalKeyFile& source);
  EntityList resolve_remote(const config::RemoteKey& source);
  KeyEntity load_private_key();


  // ---- ENGINE CALLS ----
  void encrypt_to(const EntityList& recipients, std::istream& input, std::ostream& output);
};

} // namespace pgpcrypt::crypto

#endif // PGPCRYPT_GPG_SERVICE_HPP
