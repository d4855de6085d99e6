#include <gtest/gtest.h>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace upstream::logging;
using namespace upstream::test;

class LoggerTest : public ::testing::Test {
protected:
  void TearDown() override {
    // Leave the default quiet setup for the other suites
    upstream::test::init_logging();
  }

  void flush() {
    boost::log::core::get()->flush();
  }

  TempDir dir_;
};

TEST_F(LoggerTest, FileSinkReceivesMessages) {
  const auto log_path = dir_ / "client.log";

  LogOptions options;
  options.min_level = boost::log::trivial::debug;
  options.console = false;
  options.log_file = log_path.string();
  init_logging(options);

  BOOST_LOG_TRIVIAL(info) << "Logger test: shard uploaded";
  flush();

  const std::string contents = read_file(log_path);
  EXPECT_NE(contents.find("Logger test: shard uploaded"), std::string::npos);
  EXPECT_NE(contents.find("[info]"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersLowerSeverities) {
  const auto log_path = dir_ / "filtered.log";

  LogOptions options;
  options.console = false;
  options.log_file = log_path.string();
  init_logging(options);

  BOOST_LOG_TRIVIAL(info) << "Logger test: hidden by default";
  BOOST_LOG_TRIVIAL(warning) << "Logger test: warning shown";

  set_log_level(boost::log::trivial::trace);
  BOOST_LOG_TRIVIAL(debug) << "Logger test: debug after lowering level";
  flush();

  const std::string contents = read_file(log_path);
  EXPECT_EQ(contents.find("hidden by default"), std::string::npos);
  EXPECT_NE(contents.find("warning shown"), std::string::npos);
  EXPECT_NE(contents.find("debug after lowering level"), std::string::npos);
}

TEST_F(LoggerTest, DisabledLoggingWritesNothing) {
  const auto log_path = dir_ / "disabled.log";

  LogOptions options;
  options.console = false;
  options.log_file = log_path.string();
  init_logging(options);

  disable_logging();
  BOOST_LOG_TRIVIAL(error) << "Logger test: suppressed";
  enable_logging();
  flush();

  EXPECT_EQ(read_file(log_path).find("suppressed"), std::string::npos);
}
