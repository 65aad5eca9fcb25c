#pragma once

#include <cstdint>
#include <vector>

namespace pgpcrypt {
namespace crypto {

// Encryption provider: turns plaintext into ciphertext and back
class Crypt {
public:
  virtual ~Crypt() = default;

  virtual std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext) = 0;
  virtual std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext) = 0;
};

} // namespace crypto
} // namespace pgpcrypt
