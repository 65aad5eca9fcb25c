#ifndef PGPCRYPT_LOGGER_HPP
#define PGPCRYPT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace pgpcrypt::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a single synchronous text sink. An empty log_file
// logs to stderr. Records below min_level are dropped.
void init_logging(const std::string& log_file, severity_level min_level = boost::log::trivial::warning);

void set_log_level(severity_level level);
void enable_logging();
void disable_logging();

// Accepts trace, debug, info, warning (or warn), error, fatal in any case.
// Throws crypto::ConfigurationError for anything else.
severity_level parse_severity(const std::string& name);

} // namespace pgpcrypt::logging

#endif // PGPCRYPT_LOGGER_HPP
