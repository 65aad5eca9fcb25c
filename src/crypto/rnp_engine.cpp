#include "pgpcrypt/crypto/openpgp_engine.hpp"
#include "crypto/keyring.hpp"
#include <array>
#include <boost/log/trivial.hpp>

namespace pgpcrypt::crypto {

namespace {

// librnp input callback pulling plaintext from a std::istream
bool read_from_stream(void* app_ctx, void* buf, size_t len, size_t* read) {
  auto* input = static_cast<std::istream*>(app_ctx);
  input->read(static_cast<char*>(buf), static_cast<std::streamsize>(len));
  *read = static_cast<size_t>(input->gcount());
  return !input->bad();
}

// Builds one keyring holding the public part of every recipient
rnp::FfiPtr recipient_keyring(const EntityList& recipients) {
  auto ffi = rnp::make_ffi();
  for (const auto& recipient : recipients) {
    auto material = export_public(recipient);
    auto input = rnp::input_from(material.data(), material.size());
    rnp::check<EncryptionError>(rnp_import_keys(ffi.get(), input.get(), RNP_LOAD_SAVE_PUBLIC_KEYS, nullptr),
                                "Failed to add recipient " + recipient.fingerprint());
  }
  return ffi;
}

} // namespace

//==============================================
// ENCRYPTION
//==============================================

void RnpEngine::encrypt(std::istream& input, std::ostream& output,
                        const EntityList& recipients, const EncryptOptions& options) {
  BOOST_LOG_TRIVIAL(info) << "RNP engine: Encrypting for " << recipients.size() << " recipient(s)";

  if (recipients.empty()) {
    throw EncryptionError("no recipients");
  }
  if (!input.good() || !output.good()) {
    throw EncryptionError("invalid stream state");
  }

  try {
    auto ffi = recipient_keyring(recipients);

    rnp_input_t raw_input = nullptr;
    rnp::check<EncryptionError>(rnp_input_from_callback(&raw_input, read_from_stream, nullptr, &input),
                                "Failed to create plaintext input");
    rnp::InputPtr plaintext(raw_input);
    auto ciphertext = rnp::memory_output();

    rnp_op_encrypt_t raw_op = nullptr;
    rnp::check<EncryptionError>(rnp_op_encrypt_create(&raw_op, ffi.get(), plaintext.get(), ciphertext.get()),
                                "Failed to create encryption operation");
    rnp::EncryptOpPtr op(raw_op);

    for (const auto& recipient : recipients) {
      rnp_key_handle_t raw_key = nullptr;
      rnp::check<EncryptionError>(rnp_locate_key(ffi.get(), "fingerprint", recipient.fingerprint().c_str(), &raw_key),
                                  "Failed to locate recipient " + recipient.fingerprint());
      rnp::KeyHandlePtr key(raw_key);
      if (!key) {
        throw EncryptionError("recipient " + recipient.fingerprint() + " missing from keyring");
      }
      // librnp selects the recipient's encryption-capable subkey
      rnp::check<EncryptionError>(rnp_op_encrypt_add_recipient(op.get(), key.get()),
                                  "Failed to add recipient " + recipient.fingerprint());
      BOOST_LOG_TRIVIAL(debug) << "RNP engine: Added recipient " << recipient.fingerprint();
    }

    rnp::check<EncryptionError>(rnp_op_encrypt_set_armor(op.get(), options.armor), "Failed to set armor");
    rnp::check<EncryptionError>(rnp_op_encrypt_set_cipher(op.get(), options.cipher.c_str()),
                                "Unsupported cipher " + options.cipher);
    rnp::check<EncryptionError>(rnp_op_encrypt_execute(op.get()), "Failed to encrypt");

    auto data = rnp::output_contents(ciphertext.get());
    write_output(output, data);
    BOOST_LOG_TRIVIAL(info) << "RNP engine: Produced " << data.size() << " bytes of ciphertext";
  }
  catch (const EncryptionError& e) {
    BOOST_LOG_TRIVIAL(error) << "RNP engine: Encryption failed: " << e.reason();
    throw;
  }
  catch (const CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "RNP engine: Encryption failed: " << e.reason();
    throw EncryptionError(e.reason());
  }
}


//==============================================
// DECRYPTION
//==============================================

void RnpEngine::decrypt(std::istream& input, std::ostream& output, const EntityList& keys) {
  BOOST_LOG_TRIVIAL(info) << "RNP engine: Decrypting with " << keys.size() << " key(s)";

  if (keys.empty()) {
    throw DecryptionError("no decryption keys");
  }
  if (!input.good() || !output.good()) {
    throw DecryptionError("invalid stream state");
  }

  // The ciphertext is buffered so that each key can be tried from the start
  const auto ciphertext = read_all(input);
  if (ciphertext.empty()) {
    throw DecryptionError("empty ciphertext");
  }

  rnp_result_t last_result = RNP_ERROR_NO_SUITABLE_KEY;
  for (const auto& key : keys) {
    auto message = rnp::input_from(ciphertext.data(), ciphertext.size());
    auto plaintext = rnp::memory_output();

    last_result = rnp_decrypt(key.keyring().ffi.get(), message.get(), plaintext.get());
    if (last_result == RNP_SUCCESS) {
      auto data = rnp::output_contents(plaintext.get());
      write_output(output, data);
      BOOST_LOG_TRIVIAL(info) << "RNP engine: Decrypted " << data.size() << " bytes with key " << key.fingerprint();
      return;
    }

    BOOST_LOG_TRIVIAL(debug) << "RNP engine: Key " << key.fingerprint() << " cannot decrypt message: "
                             << rnp_result_to_string(last_result);
  }

  BOOST_LOG_TRIVIAL(error) << "RNP engine: Decryption failed: " << rnp_result_to_string(last_result);
  rnp::check<DecryptionError>(last_result, "Failed to decrypt");
}


//==============================================
// STREAM PROCESSING
//==============================================

std::vector<uint8_t> RnpEngine::read_all(std::istream& input) const {
  std::vector<uint8_t> data;
  std::array<char, BUFFER_SIZE> buffer;

  while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
    data.insert(data.end(), buffer.data(), buffer.data() + input.gcount());
  }
  if (input.bad()) {
    throw DecryptionError("failed to read ciphertext");
  }
  return data;
}

void RnpEngine::write_output(std::ostream& output, const std::vector<uint8_t>& data) const {
  if (data.empty()) {
    return;
  }
  output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!output.good()) {
    throw CryptoError("failed to write to output stream");
  }
}

} // namespace pgpcrypt::crypto
