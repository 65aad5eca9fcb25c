#include <gtest/gtest.h>
#include <thread>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "pgpcrypt/keyserver/keyserver_client.hpp"
#include "test_utils.hpp"

using namespace pgpcrypt::keyserver;
using namespace pgpcrypt::test;
using pgpcrypt::crypto::KeyserverError;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Serves exactly one HTTP request on an ephemeral loopback port
class FakeKeyserver {
public:
    FakeKeyserver(http::status status, std::string body)
        : acceptor_(io_context_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , status_(status)
        , body_(std::move(body)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { serve(); });
    }

    ~FakeKeyserver() {
        wait();
    }

    uint16_t port() const { return port_; }

    std::string address(const std::string& scheme = "hkp") const {
        return scheme + "://127.0.0.1:" + std::to_string(port_);
    }

    const std::string& target() { wait(); return target_; }
    const std::string& host() { wait(); return host_; }

private:
    void serve() {
        try {
            tcp::socket socket(io_context_);
            acceptor_.accept(socket);

            beast::flat_buffer buffer;
            http::request<http::string_body> request;
            http::read(socket, buffer, request);
            target_ = std::string(request.target());
            host_ = std::string(request[http::field::host]);

            http::response<http::string_body> response{status_, request.version()};
            response.set(http::field::content_type, "application/pgp-keys");
            response.body() = body_;
            response.prepare_payload();
            http::write(socket, response);

            beast::error_code ec;
            socket.shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            // The client may hang up early in failure tests
            BOOST_LOG_TRIVIAL(debug) << "Fake keyserver: " << e.what();
        }
    }

    void wait() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    net::io_context io_context_;
    tcp::acceptor acceptor_;
    http::status status_;
    std::string body_;
    uint16_t port_{0};
    std::thread thread_;
    std::string target_;
    std::string host_;
};

class HkpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging();
    }

    static KeyId alice_id() {
        return parse_key_id(alice_key().key_id);
    }
};

TEST_F(HkpClientTest, LookupTarget) {
    EXPECT_EQ(HkpClient::lookup_target(parse_key_id("deadbeef")),
              "/pks/lookup?op=get&options=mr&search=0xDEADBEEF");
}

TEST_F(HkpClientTest, ReturnsKeyOnSuccess) {
    FakeKeyserver server(http::status::ok, alice_key().public_armored);
    HkpClient client(parse_keyserver(server.address()));

    auto entities = client.get_keys_by_id(alice_id());

    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].fingerprint(), alice_key().fingerprint);
    EXPECT_EQ(server.target(), "/pks/lookup?op=get&options=mr&search=0x" + alice_key().key_id);
    EXPECT_EQ(server.host(), "127.0.0.1:" + std::to_string(server.port()));
}

TEST_F(HkpClientTest, ReturnsEveryKeyInResponse) {
    FakeKeyserver server(http::status::ok, armor_public_keys({alice_key(), bob_key()}));
    HkpClient client(parse_keyserver(server.address()));

    auto entities = client.get_keys_by_id(alice_id());

    ASSERT_EQ(entities.size(), 2u);
    EXPECT_EQ(entities[1].fingerprint(), bob_key().fingerprint);
}

TEST_F(HkpClientTest, NotFoundYieldsNoKeys) {
    FakeKeyserver server(http::status::not_found, "No results found");
    HkpClient client(parse_keyserver(server.address()));

    EXPECT_TRUE(client.get_keys_by_id(alice_id()).empty());
}

TEST_F(HkpClientTest, EmptyBodyYieldsNoKeys) {
    FakeKeyserver server(http::status::ok, "");
    HkpClient client(parse_keyserver(server.address()));

    EXPECT_TRUE(client.get_keys_by_id(alice_id()).empty());
}

TEST_F(HkpClientTest, ServerErrorThrows) {
    FakeKeyserver server(http::status::internal_server_error, "boom");
    HkpClient client(parse_keyserver(server.address()));

    EXPECT_THROW(client.get_keys_by_id(alice_id()), KeyserverError);
}

TEST_F(HkpClientTest, InvalidKeyDataThrows) {
    FakeKeyserver server(http::status::ok, "<html>maintenance</html>");
    HkpClient client(parse_keyserver(server.address()));

    EXPECT_THROW(client.get_keys_by_id(alice_id()), KeyserverError);
}

TEST_F(HkpClientTest, OversizedResponseThrows) {
    FakeKeyserver server(http::status::ok, alice_key().public_armored);
    KeyserverClientOptions options;
    options.max_response_bytes = 16;
    HkpClient client(parse_keyserver(server.address()), options);

    EXPECT_THROW(client.get_keys_by_id(alice_id()), KeyserverError);
}

TEST_F(HkpClientTest, ConnectionRefusedThrows) {
    uint16_t port = 0;
    {
        net::io_context io_context;
        tcp::acceptor acceptor(io_context, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }
    HkpClient client(parse_keyserver("hkp://127.0.0.1:" + std::to_string(port)));

    EXPECT_THROW(client.get_keys_by_id(alice_id()), KeyserverError);
}

TEST_F(HkpClientTest, TlsAgainstPlainServerThrows) {
    FakeKeyserver server(http::status::ok, alice_key().public_armored);
    KeyserverClientOptions options;
    options.verify_tls = false;
    HkpClient client(parse_keyserver(server.address("hkps")), options);

    EXPECT_THROW(client.get_keys_by_id(alice_id()), KeyserverError);
}

TEST_F(HkpClientTest, FactoryBindsAddress) {
    auto factory = make_hkp_client_factory();
    auto client = factory(parse_keyserver("hkps://keys.openpgp.org"));

    auto* hkp = dynamic_cast<HkpClient*>(client.get());
    ASSERT_NE(hkp, nullptr);
    EXPECT_EQ(hkp->address().host, "keys.openpgp.org");
    EXPECT_EQ(hkp->address().scheme, Scheme::Hkps);
}
