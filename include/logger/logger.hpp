#ifndef UPSTREAM_LOGGER_HPP
#define UPSTREAM_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace upstream::logging {

struct LogOptions {
  // Minimum severity written to any sink
  boost::log::trivial::severity_level min_level = boost::log::trivial::warning;
  // Console sink on std::clog, never on stdout
  bool console = true;
  // Empty means no file sink
  std::string log_file;
};

// Replaces all sinks with the ones described by options
void init_logging(const LogOptions& options);

void set_log_level(boost::log::trivial::severity_level level);
void enable_logging();
void disable_logging();

} // namespace upstream::logging

#endif // UPSTREAM_LOGGER_HPP
