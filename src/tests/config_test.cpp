#include <gtest/gtest.h>
#include <cstdlib>
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace upstream::config;
using namespace upstream::test;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    unsetenv(SERVER_ENV_VAR);
  }

  void TearDown() override {
    unsetenv(SERVER_ENV_VAR);
  }

  std::string write_config(const std::string& body) {
    auto path = dir_ / "upstream.json";
    write_file(path, body);
    return path.string();
  }

  TempDir dir_;
};

TEST_F(ConfigTest, Defaults) {
  ClientConfig config;
  EXPECT_EQ(config.server, "http://node1.metadisk.org");
  EXPECT_EQ(config.shard_size, 250ULL * 1024 * 1024);
  EXPECT_EQ(config.download_slice, 1024u);
  EXPECT_EQ(config.probe_timeout, std::chrono::milliseconds(1000));
  EXPECT_TRUE(config.log_file.empty());
  EXPECT_FALSE(config.verbose);
}

TEST_F(ConfigTest, FileOverridesPresentKeysOnly) {
  ClientConfig config;
  load_file(write_config(R"({
    "server": "http://localhost:5000",
    "shard_size": "25m",
    "probe_timeout_ms": 250,
    "unknown": true
  })"), config);

  EXPECT_EQ(config.server, "http://localhost:5000");
  EXPECT_EQ(config.shard_size, 25ULL * 1024 * 1024);
  EXPECT_EQ(config.probe_timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(config.download_slice, 1024u);
}

TEST_F(ConfigTest, IntegerShardSizeAndSlice) {
  ClientConfig config;
  load_file(write_config(R"({"shard_size": 4096, "download_slice": 8192, "log_file": "client.log"})"), config);
  EXPECT_EQ(config.shard_size, 4096u);
  EXPECT_EQ(config.download_slice, 8192u);
  EXPECT_EQ(config.log_file, "client.log");
}

TEST_F(ConfigTest, InvalidFilesThrow) {
  std::vector<std::string> bodies = {
    "not json",
    "[]",
    R"({"server": 5})",
    R"({"shard_size": "10x"})",
    R"({"shard_size": -1})",
    R"({"download_slice": 0})",
    R"({"probe_timeout_ms": "fast"})",
    R"({"log_file": false})"
  };

  for (const auto& body : bodies) {
    ClientConfig config;
    EXPECT_THROW(load_file(write_config(body), config), ConfigError) << "Body: " << body;
  }
}

TEST_F(ConfigTest, MissingFileThrows) {
  ClientConfig config;
  EXPECT_THROW(load_file((dir_ / "absent.json").string(), config), ConfigError);
}

TEST_F(ConfigTest, EnvironmentOverridesServer) {
  ClientConfig config;
  setenv(SERVER_ENV_VAR, "http://env.example:9000", 1);
  apply_environment(config);
  EXPECT_EQ(config.server, "http://env.example:9000");
}

TEST_F(ConfigTest, EmptyEnvironmentIsIgnored) {
  ClientConfig config;
  setenv(SERVER_ENV_VAR, "", 1);
  apply_environment(config);
  EXPECT_EQ(config.server, DEFAULT_SERVER);
}
