#include "pgpcrypt/keyserver/keyserver_address.hpp"
#include "pgpcrypt/crypto/crypto_error.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <boost/log/trivial.hpp>

namespace pgpcrypt {
namespace keyserver {

using crypto::KeyserverError;

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

uint16_t parse_port(const std::string& text, const std::string& address) {
  if (text.empty() || text.size() > 5 ||
      !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw KeyserverError("invalid port in keyserver address " + address);
  }
  const unsigned long port = std::stoul(text);
  if (port == 0 || port > 65535) {
    throw KeyserverError("port out of range in keyserver address " + address);
  }
  return static_cast<uint16_t>(port);
}

} // namespace

//==============================================
// KEYSERVER ADDRESS
//==============================================

const char* scheme_to_string(Scheme scheme) {
  switch (scheme) {
    case Scheme::Hkp:  return "hkp";
    case Scheme::Hkps: return "hkps";
    default:           return "unknown";
  }
}

std::string KeyserverAddress::host_header() const {
  const uint16_t default_port = scheme == Scheme::Hkps ? HKPS_DEFAULT_PORT : HKP_DEFAULT_PORT;
  const std::string name = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port == default_port || (scheme == Scheme::Hkp && port == HTTP_DEFAULT_PORT)) {
    return name;
  }
  return name + ":" + std::to_string(port);
}

std::string KeyserverAddress::to_string() const {
  return std::string(scheme_to_string(scheme)) + "://" + host + ":" + std::to_string(port);
}

KeyserverAddress parse_keyserver(const std::string& text) {
  BOOST_LOG_TRIVIAL(debug) << "Keyserver: Parsing address " << text;

  KeyserverAddress address;
  std::string rest = text;
  uint16_t default_port = HKP_DEFAULT_PORT;

  const auto separator = rest.find("://");
  if (separator != std::string::npos) {
    const std::string scheme = to_lower(rest.substr(0, separator));
    if (scheme == "hkp") {
      address.scheme = Scheme::Hkp;
      default_port = HKP_DEFAULT_PORT;
    } else if (scheme == "http") {
      address.scheme = Scheme::Hkp;
      default_port = HTTP_DEFAULT_PORT;
    } else if (scheme == "hkps" || scheme == "https") {
      address.scheme = Scheme::Hkps;
      default_port = HKPS_DEFAULT_PORT;
    } else {
      throw KeyserverError("unsupported keyserver scheme: " + scheme);
    }
    rest = rest.substr(separator + 3);
  }

  // Drop any path or query
  const auto path = rest.find_first_of("/?");
  if (path != std::string::npos) {
    rest = rest.substr(0, path);
  }

  // Bracketed IPv6 literal: [addr] or [addr]:port
  if (!rest.empty() && rest.front() == '[') {
    const auto close = rest.find(']');
    if (close == std::string::npos) {
      throw KeyserverError("unterminated IPv6 address in keyserver address: " + text);
    }
    address.host = rest.substr(1, close - 1);
    const std::string tail = rest.substr(close + 1);
    if (tail.empty()) {
      address.port = default_port;
    } else if (tail.front() == ':') {
      address.port = parse_port(tail.substr(1), text);
    } else {
      throw KeyserverError("malformed keyserver address: " + text);
    }
  } else if (const auto colon = rest.rfind(':'); colon != std::string::npos) {
    address.host = rest.substr(0, colon);
    address.port = parse_port(rest.substr(colon + 1), text);
  } else {
    address.host = rest;
    address.port = default_port;
  }

  if (address.host.empty()) {
    throw KeyserverError("missing host in keyserver address: " + text);
  }

  BOOST_LOG_TRIVIAL(debug) << "Keyserver: Parsed address " << address.to_string();
  return address;
}


//==============================================
// KEY ID
//==============================================

KeyId parse_key_id(const std::string& text) {
  // Fingerprints are commonly printed in space-separated groups
  std::string hex;
  std::copy_if(text.begin(), text.end(), std::back_inserter(hex),
               [](unsigned char c) { return std::isspace(c) == 0; });
  if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex = hex.substr(2);
  }

  if (hex.size() != 8 && hex.size() != 16 && hex.size() != 40) {
    throw KeyserverError("invalid key ID length: " + text);
  }
  if (!std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
    throw KeyserverError("key ID is not hexadecimal: " + text);
  }

  std::transform(hex.begin(), hex.end(), hex.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return KeyId{hex};
}

} // namespace keyserver
} // namespace pgpcrypt
