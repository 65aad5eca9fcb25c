#ifndef PGPCRYPT_KEY_ENTITY_HPP
#define PGPCRYPT_KEY_ENTITY_HPP

#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace pgpcrypt::crypto {

// Forward declaration for the librnp keyring holding the entity
struct Keyring;

// One parsed OpenPGP identity: primary key plus its subkeys.
// Owns its own keyring, so an entity is self-contained and move-only.
class KeyEntity {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit KeyEntity(std::unique_ptr<Keyring> keyring);
  ~KeyEntity();

  KeyEntity(KeyEntity&& other) noexcept;
  KeyEntity& operator=(KeyEntity&& other) noexcept;
  KeyEntity(const KeyEntity&) = delete;
  KeyEntity& operator=(const KeyEntity&) = delete;


  // ---- QUERY OPERATIONS ----
  // Primary key fingerprint, upper-case hex
  const std::string& fingerprint() const;
  std::string key_id() const;
  // Empty when the key carries no user ID
  std::string primary_uid() const;
  size_t subkey_count() const;
  // True when secret material for the primary key or any subkey is present
  bool has_secret() const;
  // True when the primary key or any subkey is passphrase-protected
  bool is_protected() const;


  // ---- PASSPHRASE HANDLING ----
  // Decrypts the primary key and every protected subkey in memory.
  // Throws PassphraseError on a wrong passphrase.
  void unlock(const std::string& passphrase);


  // ---- GETTERS ----
  Keyring& keyring() const { return *keyring_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<Keyring> keyring_;
};

using EntityList = std::vector<KeyEntity>;

} // namespace pgpcrypt::crypto

#endif // PGPCRYPT_KEY_ENTITY_HPP
