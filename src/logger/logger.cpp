#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace upstream::logging {

namespace {

namespace expr = boost::log::expressions;

// Shared by both sinks so console and file lines look the same
auto make_formatter() {
  return expr::stream
      << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage;
}

void add_console_sink() {
  using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<text_sink>(backend);
  sink->set_formatter(make_formatter());
  boost::log::core::get()->add_sink(sink);
}

void add_file_sink(const std::string& log_file) {
  using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;

  auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

  // Convert to absolute path
  std::filesystem::path log_path = std::filesystem::absolute(log_file);
  backend->set_file_name_pattern(log_path.string());
  backend->set_open_mode(std::ios::out | std::ios::trunc);  // Start with a fresh log
  backend->auto_flush(true);

  auto sink = boost::make_shared<text_sink>(backend);
  sink->set_formatter(make_formatter());
  boost::log::core::get()->add_sink(sink);
}

} // namespace

void init_logging(const LogOptions& options) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    if (options.console) {
      add_console_sink();
    }
    if (!options.log_file.empty()) {
      add_file_sink(options.log_file);
    }

    set_log_level(options.min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                             << (options.log_file.empty() ? "" : " with file: " + options.log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

} // namespace upstream::logging
