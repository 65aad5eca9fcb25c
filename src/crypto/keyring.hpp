#ifndef PGPCRYPT_KEYRING_HPP
#define PGPCRYPT_KEYRING_HPP

#include <string>
#include <vector>
#include <cstdint>
#include "crypto/rnp_handle.hpp"
#include "pgpcrypt/crypto/key_entity.hpp"

namespace pgpcrypt::crypto {

// librnp state behind a KeyEntity
struct Keyring {
  rnp::FfiPtr ffi;
  rnp::KeyHandlePtr primary;
  std::string fingerprint;
};

// Parses the first key (public or secret) found in data. Throws KeyReadError.
KeyEntity load_entity(const std::vector<uint8_t>& data);

// Parses every public key in data, one entity per primary key. Empty input
// yields an empty list. Throws KeyReadError on unparsable input.
EntityList load_public_entities(const std::vector<uint8_t>& data);

// Binary transferable public key of the entity, subkeys included
std::vector<uint8_t> export_public(const KeyEntity& entity);

} // namespace pgpcrypt::crypto

#endif // PGPCRYPT_KEYRING_HPP
