#ifndef UPSTREAM_CONFIG_CONFIG_HPP
#define UPSTREAM_CONFIG_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace upstream {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

constexpr const char* DEFAULT_SERVER = "http://node1.metadisk.org";
constexpr const char* SERVER_ENV_VAR = "UPSTREAM_SERVER";

struct ClientConfig {
  std::string server = DEFAULT_SERVER;
  // Upload shard size in bytes (250 MiB)
  std::uint64_t shard_size = 250ULL * 1024 * 1024;
  // Write slice used while streaming a download to disk
  std::size_t download_slice = 1024;
  std::chrono::milliseconds probe_timeout{1000};
  std::string log_file;
  bool verbose = false;
};

// Overlays the keys present in a JSON config file onto config.
// Keys: server, shard_size (string like "25m" or integer), download_slice,
// probe_timeout_ms, log_file. Unknown keys are ignored.
void load_file(const std::string& path, ClientConfig& config);

// Overlays UPSTREAM_SERVER when it is set and non-empty
void apply_environment(ClientConfig& config);

} // namespace config
} // namespace upstream

#endif // UPSTREAM_CONFIG_CONFIG_HPP
