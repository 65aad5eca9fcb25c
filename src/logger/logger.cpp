#include "pgpcrypt/logger/logger.hpp"
#include "pgpcrypt/crypto/crypto_error.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

namespace pgpcrypt::logging {

namespace {

namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

// "2024-01-31 12:00:00.000000 [warning] message"
template <typename Sink>
void apply_format(Sink& sink) {
  sink.set_formatter(
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage
  );
}

} // namespace

severity_level parse_severity(const std::string& name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace")                       return boost::log::trivial::trace;
  if (lowered == "debug")                       return boost::log::trivial::debug;
  if (lowered == "info")                        return boost::log::trivial::info;
  if (lowered == "warning" || lowered == "warn") return boost::log::trivial::warning;
  if (lowered == "error")                       return boost::log::trivial::error;
  if (lowered == "fatal")                       return boost::log::trivial::fatal;
  throw crypto::ConfigurationError("unknown log level: " + name);
}

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    auto core = boost::log::core::get();
    core->remove_all_sinks();

    if (log_file.empty()) {
      auto backend = boost::make_shared<sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      auto sink = boost::make_shared<sinks::synchronous_sink<sinks::text_ostream_backend>>(backend);
      apply_format(*sink);
      core->add_sink(sink);
    } else {
      auto backend = boost::make_shared<sinks::text_file_backend>();
      const std::filesystem::path log_path = std::filesystem::absolute(log_file);
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->auto_flush(true);

      auto sink = boost::make_shared<sinks::synchronous_sink<sinks::text_file_backend>>(backend);
      apply_format(*sink);
      core->add_sink(sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    core->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

} // namespace pgpcrypt::logging
