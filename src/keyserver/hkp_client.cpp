#include "pgpcrypt/keyserver/keyserver_client.hpp"
#include "crypto/keyring.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/ssl.h>

namespace pgpcrypt {
namespace keyserver {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using crypto::KeyserverError;

namespace {

constexpr int HTTP_VERSION = 11;
constexpr unsigned HTTP_OK = 200;
constexpr unsigned HTTP_NOT_FOUND = 404;

// Sends one GET request and reads the complete response
template <typename Stream>
http::response<http::string_body> exchange(Stream& stream, const std::string& target,
                                           const KeyserverAddress& address,
                                           const KeyserverClientOptions& options) {
  http::request<http::empty_body> request{http::verb::get, target, HTTP_VERSION};
  request.set(http::field::host, address.host_header());
  request.set(http::field::user_agent, options.user_agent);
  request.set(http::field::accept, "application/pgp-keys, text/plain");
  http::write(stream, request);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(static_cast<std::uint64_t>(options.max_response_bytes));
  http::read(stream, buffer, parser);
  return parser.release();
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

HkpClient::HkpClient(KeyserverAddress address, KeyserverClientOptions options)
  : address_(std::move(address))
  , options_(std::move(options)) {
  BOOST_LOG_TRIVIAL(debug) << "HKP client: Created client for " << address_.to_string();
}


//==============================================
// KEY LOOKUP
//==============================================

std::string HkpClient::lookup_target(const KeyId& key_id) {
  return "/pks/lookup?op=get&options=mr&search=" + key_id.search_term();
}

crypto::EntityList HkpClient::get_keys_by_id(const KeyId& key_id) {
  BOOST_LOG_TRIVIAL(info) << "HKP client: Looking up " << key_id.search_term() << " on " << address_.to_string();

  Response response = fetch(lookup_target(key_id));

  if (response.status == HTTP_NOT_FOUND) {
    BOOST_LOG_TRIVIAL(info) << "HKP client: No key found for " << key_id.search_term();
    return {};
  }
  if (response.status != HTTP_OK) {
    BOOST_LOG_TRIVIAL(error) << "HKP client: " << address_.to_string() << " answered HTTP " << response.status;
    throw KeyserverError(address_.to_string() + " answered HTTP " + std::to_string(response.status));
  }

  try {
    auto entities = crypto::load_public_entities(std::vector<uint8_t>(response.body.begin(), response.body.end()));
    BOOST_LOG_TRIVIAL(info) << "HKP client: Received " << entities.size() << " key(s) for " << key_id.search_term();
    return entities;
  }
  catch (const crypto::KeyReadError& e) {
    BOOST_LOG_TRIVIAL(error) << "HKP client: Invalid key data from " << address_.to_string() << ": " << e.reason();
    throw KeyserverError("invalid key data from " + address_.to_string() + ": " + e.reason());
  }
}


//==============================================
// HTTP TRANSPORT
//==============================================

HkpClient::Response HkpClient::fetch(const std::string& target) const {
  try {
    return address_.scheme == Scheme::Hkps ? fetch_tls(target) : fetch_plain(target);
  }
  catch (const KeyserverError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HKP client: Request to " << address_.to_string() << " failed: " << e.what();
    throw KeyserverError("request to " + address_.to_string() + " failed: " + e.what());
  }
}

HkpClient::Response HkpClient::fetch_plain(const std::string& target) const {
  net::io_context io_context;
  tcp::resolver resolver(io_context);
  beast::tcp_stream stream(io_context);

  BOOST_LOG_TRIVIAL(debug) << "HKP client: Connecting to " << address_.host << ":" << address_.port;
  stream.connect(resolver.resolve(address_.host, std::to_string(address_.port)));

  auto response = exchange(stream, target, address_, options_);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HKP client: Shutdown error: " << ec.message();
  }

  return Response{response.result_int(), std::move(response.body())};
}

HkpClient::Response HkpClient::fetch_tls(const std::string& target) const {
  net::io_context io_context;
  ssl::context ssl_context(ssl::context::tls_client);
  if (options_.verify_tls) {
    ssl_context.set_default_verify_paths();
    ssl_context.set_verify_mode(ssl::verify_peer);
  } else {
    BOOST_LOG_TRIVIAL(warning) << "HKP client: TLS certificate verification disabled for " << address_.host;
    ssl_context.set_verify_mode(ssl::verify_none);
  }

  tcp::resolver resolver(io_context);
  beast::ssl_stream<beast::tcp_stream> stream(io_context, ssl_context);

  // SNI
  if (!SSL_set_tlsext_host_name(stream.native_handle(), address_.host.c_str())) {
    throw KeyserverError("failed to set TLS server name " + address_.host);
  }
  if (options_.verify_tls) {
    stream.set_verify_callback(ssl::host_name_verification(address_.host));
  }

  BOOST_LOG_TRIVIAL(debug) << "HKP client: Connecting to " << address_.host << ":" << address_.port << " over TLS";
  beast::get_lowest_layer(stream).connect(resolver.resolve(address_.host, std::to_string(address_.port)));
  stream.handshake(ssl::stream_base::client);

  auto response = exchange(stream, target, address_, options_);

  beast::error_code ec;
  stream.shutdown(ec);
  if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
    BOOST_LOG_TRIVIAL(debug) << "HKP client: TLS shutdown error: " << ec.message();
  }

  return Response{response.result_int(), std::move(response.body())};
}


//==============================================
// FACTORY
//==============================================

ClientFactory make_hkp_client_factory(KeyserverClientOptions options) {
  return [options](const KeyserverAddress& address) -> std::unique_ptr<KeyserverClient> {
    return std::make_unique<HkpClient>(address, options);
  };
}

} // namespace keyserver
} // namespace pgpcrypt
