#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include "pgpcrypt/logger/logger.hpp"
#include "pgpcrypt/crypto/crypto_error.hpp"
#include "test_utils.hpp"

using namespace pgpcrypt::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = dir.file("pgpcrypt.log");
        init_logging(log_path, boost::log::trivial::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        enable_logging();
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        return pgpcrypt::test::read_text(log_path).find(text) != std::string::npos;
    }

    pgpcrypt::test::TempDir dir;
    std::string log_path;
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
}

TEST_F(LoggerTest, RecordFormat) {
    BOOST_LOG_TRIVIAL(warning) << "Formatted message";

    const std::string content = pgpcrypt::test::read_text(log_path);
    EXPECT_NE(content.find(" [warning] Formatted message"), std::string::npos);
    // Starts with a "YYYY-MM-DD " date
    ASSERT_GE(content.size(), 11u);
    EXPECT_EQ(content[4], '-');
    EXPECT_EQ(content[7], '-');
    EXPECT_EQ(content[10], ' ');
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, SeverityLevels) {
    set_log_level(boost::log::trivial::trace);

    BOOST_LOG_TRIVIAL(trace) << "Trace message";
    BOOST_LOG_TRIVIAL(debug) << "Debug message";
    BOOST_LOG_TRIVIAL(info) << "Info message";
    BOOST_LOG_TRIVIAL(warning) << "Warning message";
    BOOST_LOG_TRIVIAL(error) << "Error message";
    BOOST_LOG_TRIVIAL(fatal) << "Fatal message";

    EXPECT_TRUE(log_contains("Trace message"));
    EXPECT_TRUE(log_contains("Debug message"));
    EXPECT_TRUE(log_contains("Info message"));
    EXPECT_TRUE(log_contains("Warning message"));
    EXPECT_TRUE(log_contains("Error message"));
    EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
    disable_logging();
    BOOST_LOG_TRIVIAL(info) << "Should not appear";

    enable_logging();
    BOOST_LOG_TRIVIAL(info) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ParseSeverity) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("DEBUG"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("Info"), boost::log::trivial::info);
    EXPECT_EQ(parse_severity("warn"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("error"), boost::log::trivial::error);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("verbose"), pgpcrypt::crypto::ConfigurationError);
}
