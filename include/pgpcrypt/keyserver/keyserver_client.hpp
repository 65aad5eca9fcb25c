#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include "pgpcrypt/crypto/key_entity.hpp"
#include "keyserver_address.hpp"

namespace pgpcrypt {
namespace keyserver {

class KeyserverClient {
public:
  virtual ~KeyserverClient() = default;

  // Returns every key the server holds for key_id, possibly none.
  // Throws crypto::KeyserverError on network or protocol failure.
  virtual crypto::EntityList get_keys_by_id(const KeyId& key_id) = 0;
};

struct KeyserverClientOptions {
  std::string user_agent = "pgpcrypt/1.0";
  // Verify the server certificate and host name for hkps
  bool verify_tls = true;
  // Larger responses are rejected
  size_t max_response_bytes = 8 * 1024 * 1024;
};

// Creates a client bound to one keyserver
using ClientFactory = std::function<std::unique_ptr<KeyserverClient>(const KeyserverAddress&)>;

// HTTP Keyserver Protocol client ("GET /pks/lookup?op=get&options=mr&search=0x...")
class HkpClient : public KeyserverClient {
public:
  // ---- CONSTRUCTOR ----
  HkpClient(KeyserverAddress address, KeyserverClientOptions options = {});


  // ---- KEY LOOKUP ----
  crypto::EntityList get_keys_by_id(const KeyId& key_id) override;

  // Request target for a machine-readable key lookup
  static std::string lookup_target(const KeyId& key_id);

  const KeyserverAddress& address() const { return address_; }

private:
  // ---- PARAMETERS ----
  KeyserverAddress address_;
  KeyserverClientOptions options_;

  struct Response {
    unsigned status = 0;
    std::string body;
  };

  // ---- HTTP TRANSPORT ----
  Response fetch(const std::string& target) const;
  Response fetch_plain(const std::string& target) const;
  Response fetch_tls(const std::string& target) const;
};

// Factory producing HkpClient instances with the given options
ClientFactory make_hkp_client_factory(KeyserverClientOptions options = {});

} // namespace keyserver
} // namespace pgpcrypt
