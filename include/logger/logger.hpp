#ifndef ORACLE_LOGGER_HPP
#define ORACLE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace oracle::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous text-file sink (and optionally a console sink) on
// the Boost.Log core, replacing any existing sinks
void init_logging(const std::string& log_file = "oracle.log",
                  severity_level min_level = boost::log::trivial::info,
                  bool console = false);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Parses trace|debug|info|warning|error|fatal
bool parse_severity(const std::string& name, severity_level& level);

} // namespace oracle::logging

#endif // ORACLE_LOGGER_HPP
