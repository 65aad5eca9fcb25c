#ifndef PGPCRYPT_TEST_UTILS_HPP
#define PGPCRYPT_TEST_UTILS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include "crypto/rnp_handle.hpp"

namespace pgpcrypt::test {

// Set logging severity level and configure logging
inline void init_test_logging() {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::debug
    );
    boost::log::core::get()->set_logging_enabled(true);

    boost::log::add_common_attributes();
}

// Unique directory under the system temp path, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("pgpcrypt-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

    std::string write(const std::string& name, const std::string& content) const {
        const std::string target = file(name);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
        return target;
    }

private:
    std::filesystem::path path_;
};

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

inline std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::string to_text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// Armored key material of a freshly generated EdDSA + Curve25519 ECDH key pair
struct TestKey {
    std::string fingerprint;
    std::string key_id;
    std::string public_armored;
    std::string secret_armored;
    std::vector<uint8_t> public_binary;
};

inline std::string export_key(rnp_key_handle_t key, uint32_t flags) {
    auto output = crypto::rnp::memory_output();
    if (rnp_key_export(key, output.get(), flags) != RNP_SUCCESS) {
        throw std::runtime_error("test key export failed");
    }
    auto data = crypto::rnp::output_contents(output.get());
    return std::string(data.begin(), data.end());
}

// An empty passphrase leaves the secret key unprotected
inline TestKey generate_test_key(const std::string& user_id, const std::string& passphrase = "") {
    auto ffi = crypto::rnp::make_ffi();

    rnp_key_handle_t raw_key = nullptr;
    const rnp_result_t result = rnp_generate_key_ex(ffi.get(), "EDDSA", "ECDH", 0, 0, nullptr, "Curve25519",
                                                    user_id.c_str(),
                                                    passphrase.empty() ? nullptr : passphrase.c_str(),
                                                    &raw_key);
    if (result != RNP_SUCCESS) {
        throw std::runtime_error(std::string("test key generation failed: ") + rnp_result_to_string(result));
    }
    crypto::rnp::KeyHandlePtr key(raw_key);

    TestKey generated;
    char* fingerprint = nullptr;
    char* key_id = nullptr;
    if (rnp_key_get_fprint(key.get(), &fingerprint) != RNP_SUCCESS ||
        rnp_key_get_keyid(key.get(), &key_id) != RNP_SUCCESS) {
        throw std::runtime_error("test key inspection failed");
    }
    generated.fingerprint = crypto::rnp::take_string(fingerprint);
    generated.key_id = crypto::rnp::take_string(key_id);

    generated.public_armored = export_key(key.get(), RNP_KEY_EXPORT_ARMORED | RNP_KEY_EXPORT_PUBLIC | RNP_KEY_EXPORT_SUBKEYS);
    generated.secret_armored = export_key(key.get(), RNP_KEY_EXPORT_ARMORED | RNP_KEY_EXPORT_SECRET | RNP_KEY_EXPORT_SUBKEYS);
    generated.public_binary = to_bytes(export_key(key.get(), RNP_KEY_EXPORT_PUBLIC | RNP_KEY_EXPORT_SUBKEYS));
    return generated;
}

// One armored public key block holding several keys
inline std::string armor_public_keys(const std::vector<TestKey>& keys) {
    std::vector<uint8_t> concatenated;
    for (const auto& key : keys) {
        concatenated.insert(concatenated.end(), key.public_binary.begin(), key.public_binary.end());
    }

    auto input = crypto::rnp::input_from(concatenated.data(), concatenated.size());
    auto output = crypto::rnp::memory_output();
    if (rnp_enarmor(input.get(), output.get(), "public key") != RNP_SUCCESS) {
        throw std::runtime_error("test armoring failed");
    }
    auto data = crypto::rnp::output_contents(output.get());
    return std::string(data.begin(), data.end());
}

// Key generation is slow; every suite shares the same pairs
inline const TestKey& alice_key() {
    static const TestKey key = generate_test_key("Alice <alice@example.org>");
    return key;
}

inline const TestKey& bob_key() {
    static const TestKey key = generate_test_key("Bob <bob@example.org>", "correct horse");
    return key;
}

constexpr const char* BOB_PASSPHRASE = "correct horse";

} // namespace pgpcrypt::test

#endif // PGPCRYPT_TEST_UTILS_HPP
