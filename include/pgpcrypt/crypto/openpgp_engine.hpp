#ifndef PGPCRYPT_OPENPGP_ENGINE_HPP
#define PGPCRYPT_OPENPGP_ENGINE_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include "key_entity.hpp"

namespace pgpcrypt::crypto {

struct EncryptOptions {
  // ASCII-armor the produced message
  bool armor = false;
  // Symmetric cipher for the session key, in librnp naming ("AES256", "CAMELLIA256", ...)
  std::string cipher = "AES256";
};

// Packet-level OpenPGP message processing. Output is only written once the
// whole operation has succeeded.
class OpenPgpEngine {
public:
  virtual ~OpenPgpEngine() = default;

  // Encrypts input to every recipient. Throws EncryptionError.
  virtual void encrypt(std::istream& input, std::ostream& output,
                       const EntityList& recipients, const EncryptOptions& options) = 0;

  // Decrypts input with the first of keys able to do so and writes the
  // unverified literal body. Throws DecryptionError.
  virtual void decrypt(std::istream& input, std::ostream& output, const EntityList& keys) = 0;
};

class RnpEngine : public OpenPgpEngine {
public:
  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  void encrypt(std::istream& input, std::ostream& output,
               const EntityList& recipients, const EncryptOptions& options) override;
  void decrypt(std::istream& input, std::ostream& output, const EntityList& keys) override;

private:
  static constexpr size_t BUFFER_SIZE = 8192;

  // ---- STREAM PROCESSING ----
  // Reads the remaining input into memory
  std::vector<uint8_t> read_all(std::istream& input) const;
  // Safely writes processed data to the output stream
  void write_output(std::ostream& output, const std::vector<uint8_t>& data) const;
};

} // namespace pgpcrypt::crypto

#endif // PGPCRYPT_OPENPGP_ENGINE_HPP
