#ifndef PGPCRYPT_KEYSERVER_ADDRESS_HPP
#define PGPCRYPT_KEYSERVER_ADDRESS_HPP

#include <cstdint>
#include <string>

namespace pgpcrypt {
namespace keyserver {

enum class Scheme {
    Hkp,   // HKP over plain HTTP
    Hkps   // HKP over TLS
};

constexpr uint16_t HKP_DEFAULT_PORT = 11371;
constexpr uint16_t HTTP_DEFAULT_PORT = 80;
constexpr uint16_t HKPS_DEFAULT_PORT = 443;

struct KeyserverAddress {
    Scheme scheme = Scheme::Hkp;
    std::string host;
    uint16_t port = HKP_DEFAULT_PORT;

    // Value of the HTTP Host header; the port is omitted when it is the scheme default
    std::string host_header() const;
    std::string to_string() const;
};

struct KeyId {
    // Upper-case hex without "0x": 8, 16 or 40 digits
    std::string hex;

    // Form used in HKP search queries
    std::string search_term() const { return "0x" + hex; }
};

// Accepts hkp://, hkps://, http://, https:// or a bare host, each with an
// optional :port and an ignored trailing path. Throws crypto::KeyserverError.
KeyserverAddress parse_keyserver(const std::string& text);

// Accepts an optional 0x prefix followed by a short (8), long (16) key ID or a
// v4 fingerprint (40 hex digits). Throws crypto::KeyserverError.
KeyId parse_key_id(const std::string& text);

const char* scheme_to_string(Scheme scheme);

} // namespace keyserver
} // namespace pgpcrypt

#endif // PGPCRYPT_KEYSERVER_ADDRESS_HPP
