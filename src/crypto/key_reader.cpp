#include "pgpcrypt/crypto/key_reader.hpp"
#include "crypto/keyring.hpp"
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace pgpcrypt::crypto {

namespace {

constexpr const char* ARMOR_BEGIN = "-----BEGIN PGP ";
constexpr const char* PUBLIC_KEY_BLOCK = "PUBLIC KEY BLOCK-----";
constexpr const char* PRIVATE_KEY_BLOCK = "PRIVATE KEY BLOCK-----";
constexpr const char* SECRET_KEY_BLOCK = "SECRET KEY BLOCK-----";
constexpr const char* ARMOR_END = "-----END PGP ";

} // namespace

//==============================================
// KEY READING
//==============================================

KeyEntity ArmoredKeyReader::read_entity(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Key reader: Reading key from " << path;

  std::string content = read_file(path);
  verify_armor(content, path);

  try {
    KeyEntity entity = load_entity(std::vector<uint8_t>(content.begin(), content.end()));
    BOOST_LOG_TRIVIAL(info) << "Key reader: Loaded key " << entity.fingerprint() << " from " << path;
    return entity;
  }
  catch (const KeyReadError& e) {
    BOOST_LOG_TRIVIAL(error) << "Key reader: Failed to parse " << path << ": " << e.reason();
    throw KeyReadError(path + ": " + e.reason());
  }
}


//==============================================
// FILE ACCESS
//==============================================

std::string ArmoredKeyReader::read_file(const std::string& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Key reader: Cannot open " << path;
    throw KeyReadError("cannot open " + path);
  }

  std::ostringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Key reader: Failed while reading " << path;
    throw KeyReadError("failed to read " + path);
  }
  return content.str();
}

void ArmoredKeyReader::verify_armor(const std::string& content, const std::string& path) const {
  const auto begin = content.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    throw KeyReadError(path + " is empty");
  }

  if (content.compare(begin, std::char_traits<char>::length(ARMOR_BEGIN), ARMOR_BEGIN) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Key reader: " << path << " is not ASCII-armored";
    throw KeyReadError(path + " is not an armored OpenPGP key");
  }

  const auto header_end = content.find('\n', begin);
  const std::string header = content.substr(begin, header_end == std::string::npos ? std::string::npos : header_end - begin);
  const bool key_block = header.find(PUBLIC_KEY_BLOCK) != std::string::npos
                      || header.find(PRIVATE_KEY_BLOCK) != std::string::npos
                      || header.find(SECRET_KEY_BLOCK) != std::string::npos;
  if (!key_block) {
    BOOST_LOG_TRIVIAL(error) << "Key reader: Unexpected armor header in " << path << ": " << header;
    throw KeyReadError(path + " does not contain an armored key block");
  }

  if (content.find(ARMOR_END, begin) == std::string::npos) {
    throw KeyReadError(path + " has no armor tail");
  }
}

} // namespace pgpcrypt::crypto
