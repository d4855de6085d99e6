#include "config/config.hpp"
#include "shard/size_parser.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>

using json = nlohmann::json;

namespace upstream {
namespace config {

namespace {

std::uint64_t read_size(const json& value, const std::string& key) {
  if (value.is_string()) {
    try {
      return shard::parse_size(value.get<std::string>());
    } catch (const shard::InvalidSizeFormat& e) {
      throw ConfigError("Config: " + key + ": " + e.what());
    }
  }
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  throw ConfigError("Config: " + key + " must be a size string or a non-negative integer");
}

std::uint64_t read_positive(const json& value, const std::string& key) {
  if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
    throw ConfigError("Config: " + key + " must be a positive integer");
  }
  return value.get<std::uint64_t>();
}

} // namespace

void load_file(const std::string& path, ClientConfig& config) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading " << path;

  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to open " << path;
    throw ConfigError("Config: Failed to open " + path);
  }

  json body = json::parse(file, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    BOOST_LOG_TRIVIAL(error) << "Config: " << path << " is not a JSON object";
    throw ConfigError("Config: " + path + " is not a JSON object");
  }

  if (auto it = body.find("server"); it != body.end()) {
    if (!it->is_string()) {
      throw ConfigError("Config: server must be a string");
    }
    config.server = it->get<std::string>();
  }
  if (auto it = body.find("shard_size"); it != body.end()) {
    config.shard_size = read_size(*it, "shard_size");
  }
  if (auto it = body.find("download_slice"); it != body.end()) {
    config.download_slice = static_cast<std::size_t>(read_positive(*it, "download_slice"));
  }
  if (auto it = body.find("probe_timeout_ms"); it != body.end()) {
    config.probe_timeout = std::chrono::milliseconds(read_positive(*it, "probe_timeout_ms"));
  }
  if (auto it = body.find("log_file"); it != body.end()) {
    if (!it->is_string()) {
      throw ConfigError("Config: log_file must be a string");
    }
    config.log_file = it->get<std::string>();
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Loaded " << path << ", server " << config.server
                           << ", shard size " << config.shard_size;
}

void apply_environment(ClientConfig& config) {
  const char* server = std::getenv(SERVER_ENV_VAR);
  if (server != nullptr && *server != '\0') {
    BOOST_LOG_TRIVIAL(debug) << "Config: " << SERVER_ENV_VAR << " overrides server with " << server;
    config.server = server;
  }
}

} // namespace config
} // namespace upstream
