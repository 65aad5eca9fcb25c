#include "crypto/keyring.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <boost/log/trivial.hpp>

namespace pgpcrypt::crypto {

namespace {

rnp::KeyHandlePtr locate_key(rnp_ffi_t ffi, const std::string& fingerprint) {
  rnp_key_handle_t handle = nullptr;
  rnp::check<KeyReadError>(rnp_locate_key(ffi, "fingerprint", fingerprint.c_str(), &handle),
                           "Failed to locate key " + fingerprint);
  if (!handle) {
    throw KeyReadError("Key " + fingerprint + " not found in keyring");
  }
  return rnp::KeyHandlePtr(handle);
}

// Fingerprints of all primary keys in the keyring, in keyring order, without duplicates
std::vector<std::string> primary_fingerprints(rnp_ffi_t ffi) {
  rnp_identifier_iterator_t raw_iterator = nullptr;
  rnp::check<KeyReadError>(rnp_identifier_iterator_create(ffi, &raw_iterator, "fingerprint"),
                           "Failed to iterate keyring");
  rnp::IteratorPtr iterator(raw_iterator);

  std::vector<std::string> fingerprints;
  const char* identifier = nullptr;
  while (true) {
    rnp::check<KeyReadError>(rnp_identifier_iterator_next(iterator.get(), &identifier),
                             "Failed to iterate keyring");
    if (!identifier) {
      break;
    }
    std::string fingerprint(identifier);
    if (std::find(fingerprints.begin(), fingerprints.end(), fingerprint) != fingerprints.end()) {
      continue;
    }

    auto handle = locate_key(ffi, fingerprint);
    bool primary = false;
    rnp::check<KeyReadError>(rnp_key_is_primary(handle.get(), &primary), "Failed to inspect key");
    if (primary) {
      fingerprints.push_back(std::move(fingerprint));
    }
  }
  return fingerprints;
}

std::unique_ptr<Keyring> make_keyring(rnp::FfiPtr ffi, const std::string& fingerprint) {
  auto keyring = std::make_unique<Keyring>();
  keyring->primary = locate_key(ffi.get(), fingerprint);
  keyring->ffi = std::move(ffi);
  keyring->fingerprint = fingerprint;
  return keyring;
}

std::vector<uint8_t> export_public_key(rnp_key_handle_t handle) {
  auto output = rnp::memory_output();
  rnp::check<KeyReadError>(rnp_key_export(handle, output.get(), RNP_KEY_EXPORT_PUBLIC | RNP_KEY_EXPORT_SUBKEYS),
                           "Failed to export public key");
  return rnp::output_contents(output.get());
}

// Calls visit on the primary key and then on each subkey
void for_each_key(const Keyring& keyring, const std::function<void(rnp_key_handle_t)>& visit) {
  visit(keyring.primary.get());

  size_t count = 0;
  rnp::check<KeyReadError>(rnp_key_get_subkey_count(keyring.primary.get(), &count),
                           "Failed to count subkeys");
  for (size_t i = 0; i < count; ++i) {
    rnp_key_handle_t raw_subkey = nullptr;
    rnp::check<KeyReadError>(rnp_key_get_subkey_at(keyring.primary.get(), i, &raw_subkey),
                             "Failed to access subkey");
    rnp::KeyHandlePtr subkey(raw_subkey);
    visit(subkey.get());
  }
}

bool has_secret_part(rnp_key_handle_t handle) {
  bool secret = false;
  rnp::check<KeyReadError>(rnp_key_have_secret(handle, &secret), "Failed to inspect key");
  return secret;
}

bool is_blank(const std::vector<uint8_t>& data) {
  return std::all_of(data.begin(), data.end(),
                     [](uint8_t c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

KeyEntity::KeyEntity(std::unique_ptr<Keyring> keyring) : keyring_(std::move(keyring)) {
  if (!keyring_ || !keyring_->ffi || !keyring_->primary) {
    throw KeyReadError("Key entity requires a loaded keyring");
  }
}

KeyEntity::~KeyEntity() = default;
KeyEntity::KeyEntity(KeyEntity&& other) noexcept = default;
KeyEntity& KeyEntity::operator=(KeyEntity&& other) noexcept = default;


//==============================================
// QUERY OPERATIONS
//==============================================

const std::string& KeyEntity::fingerprint() const {
  return keyring_->fingerprint;
}

std::string KeyEntity::key_id() const {
  char* key_id = nullptr;
  rnp::check<KeyReadError>(rnp_key_get_keyid(keyring_->primary.get(), &key_id), "Failed to read key ID");
  return rnp::take_string(key_id);
}

std::string KeyEntity::primary_uid() const {
  char* uid = nullptr;
  if (rnp_key_get_primary_uid(keyring_->primary.get(), &uid) != RNP_SUCCESS) {
    return {};
  }
  return rnp::take_string(uid);
}

size_t KeyEntity::subkey_count() const {
  size_t count = 0;
  rnp::check<KeyReadError>(rnp_key_get_subkey_count(keyring_->primary.get(), &count),
                           "Failed to count subkeys");
  return count;
}

bool KeyEntity::has_secret() const {
  bool secret = false;
  for_each_key(*keyring_, [&](rnp_key_handle_t handle) {
    secret = secret || has_secret_part(handle);
  });
  return secret;
}

bool KeyEntity::is_protected() const {
  bool result = false;
  for_each_key(*keyring_, [&](rnp_key_handle_t handle) {
    if (result || !has_secret_part(handle)) {
      return;
    }
    rnp::check<KeyReadError>(rnp_key_is_protected(handle, &result), "Failed to inspect key protection");
  });
  return result;
}


//==============================================
// PASSPHRASE HANDLING
//==============================================

void KeyEntity::unlock(const std::string& passphrase) {
  BOOST_LOG_TRIVIAL(debug) << "Key entity: Unlocking key " << keyring_->fingerprint;

  size_t unlocked = 0;
  for_each_key(*keyring_, [&](rnp_key_handle_t handle) {
    if (!has_secret_part(handle)) {
      return;
    }

    bool is_protected = false;
    bool is_locked = false;
    rnp::check<PassphraseError>(rnp_key_is_protected(handle, &is_protected), "Failed to inspect key protection");
    rnp::check<PassphraseError>(rnp_key_is_locked(handle, &is_locked), "Failed to inspect key lock");
    if (!is_protected || !is_locked) {
      return;
    }

    rnp_result_t result = rnp_key_unlock(handle, passphrase.c_str());
    if (result == RNP_ERROR_BAD_PASSWORD) {
      BOOST_LOG_TRIVIAL(error) << "Key entity: Wrong passphrase for key " << keyring_->fingerprint;
      throw PassphraseError("wrong passphrase for key " + keyring_->fingerprint);
    }
    rnp::check<PassphraseError>(result, "Failed to unlock key " + keyring_->fingerprint);
    ++unlocked;
  });

  BOOST_LOG_TRIVIAL(debug) << "Key entity: Unlocked " << unlocked << " key(s)";
}


//==============================================
// PARSING
//==============================================

KeyEntity load_entity(const std::vector<uint8_t>& data) {
  if (is_blank(data)) {
    throw KeyReadError("no key data");
  }

  auto ffi = rnp::make_ffi();
  auto input = rnp::input_from(data.data(), data.size());

  rnp_result_t result = rnp_import_keys(ffi.get(), input.get(),
                                        RNP_LOAD_SAVE_PUBLIC_KEYS | RNP_LOAD_SAVE_SECRET_KEYS | RNP_LOAD_SAVE_SINGLE,
                                        nullptr);
  if (result == RNP_ERROR_EOF) {
    throw KeyReadError("no key found");
  }
  rnp::check<KeyReadError>(result, "Failed to parse key");

  auto fingerprints = primary_fingerprints(ffi.get());
  if (fingerprints.empty()) {
    throw KeyReadError("data does not contain a primary key");
  }

  BOOST_LOG_TRIVIAL(debug) << "Key entity: Parsed key " << fingerprints.front();
  return KeyEntity(make_keyring(std::move(ffi), fingerprints.front()));
}

EntityList load_public_entities(const std::vector<uint8_t>& data) {
  EntityList entities;
  if (is_blank(data)) {
    return entities;
  }

  auto ffi = rnp::make_ffi();
  auto input = rnp::input_from(data.data(), data.size());
  rnp::check<KeyReadError>(rnp_import_keys(ffi.get(), input.get(), RNP_LOAD_SAVE_PUBLIC_KEYS, nullptr),
                           "Failed to parse keys");

  const auto fingerprints = primary_fingerprints(ffi.get());
  if (fingerprints.empty()) {
    throw KeyReadError("data does not contain a public key");
  }

  // Split the shared keyring so that each entity owns exactly one identity
  for (const auto& fingerprint : fingerprints) {
    auto handle = locate_key(ffi.get(), fingerprint);
    auto material = export_public_key(handle.get());

    auto entity_ffi = rnp::make_ffi();
    auto entity_input = rnp::input_from(material.data(), material.size());
    rnp::check<KeyReadError>(rnp_import_keys(entity_ffi.get(), entity_input.get(), RNP_LOAD_SAVE_PUBLIC_KEYS, nullptr),
                             "Failed to import key " + fingerprint);
    entities.emplace_back(make_keyring(std::move(entity_ffi), fingerprint));
  }

  BOOST_LOG_TRIVIAL(debug) << "Key entity: Parsed " << entities.size() << " public key(s)";
  return entities;
}

std::vector<uint8_t> export_public(const KeyEntity& entity) {
  return export_public_key(entity.keyring().primary.get());
}

} // namespace pgpcrypt::crypto
