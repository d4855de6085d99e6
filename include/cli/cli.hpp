#pragma once

#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "network/transport.hpp"

namespace upstream {
namespace cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FILE_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;
constexpr int EXIT_TRANSFER_ERROR = 3;

class UsageError : public std::invalid_argument {
public:
  explicit UsageError(const std::string& message) : std::invalid_argument(message) {}
};

enum class Command {
  None,
  Upload,
  Download,
  Help,
  Version
};

struct ProgramOptions {
  Command command{Command::None};

  // Global flags
  std::optional<std::string> server;
  std::optional<std::string> config_path;
  std::optional<std::string> log_file;
  bool verbose{false};

  // Upload: shard size string. Download: write slice size.
  std::optional<std::string> shard_size;

  // Upload
  std::string file;

  // Download
  std::vector<std::string> uris;
  std::optional<std::string> dest;
};

// Parses argv[1..]. Throws UsageError on unknown flags or missing arguments.
ProgramOptions parse_command_line(const std::vector<std::string>& args);
std::string usage(const std::string& program_name);

// Defaults, then config file, then UPSTREAM_SERVER, then flags
config::ClientConfig build_config(const ProgramOptions& options);

class CLI {
public:
  using TransportFactory = std::function<std::unique_ptr<network::Transport>(const config::ClientConfig&)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(config::ClientConfig config, std::filesystem::path working_dir,
      std::ostream& out = std::cout, std::ostream& err = std::cerr,
      TransportFactory transport_factory = default_transport_factory());

  // Transport over BeastHttpClient, probing config.server
  static TransportFactory default_transport_factory();


  // ---- COMMANDS ----
  // Dispatches the command and maps errors to an exit code
  int run(const ProgramOptions& options);

  // Both throw on failure; run() is the error boundary
  std::vector<shard::Shard> upload(const std::string& file);
  std::filesystem::path download(const std::vector<std::string>& uris,
                                 const std::optional<std::string>& dest);

private:
  // ---- PARAMETERS ----
  config::ClientConfig config_;
  std::filesystem::path working_dir_;
  std::ostream& out_;
  std::ostream& err_;
  TransportFactory transport_factory_;


  // ---- HELPERS ----
  // Expands a leading "~/" and anchors relative paths at working_dir_
  std::filesystem::path absolute_path(const std::string& path) const;
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace upstream
