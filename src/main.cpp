#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const std::string& program_name) {
  std::cerr << upstream::cli::usage(program_name);
}

int run_client(const upstream::cli::ProgramOptions& options) {
  upstream::config::ClientConfig config = upstream::cli::build_config(options);

  upstream::logging::LogOptions log_options;
  log_options.min_level = config.verbose ? boost::log::trivial::debug : boost::log::trivial::warning;
  log_options.log_file = config.log_file;
  upstream::logging::init_logging(log_options);

  upstream::cli::CLI cli(config, std::filesystem::current_path());
  return cli.run(options);
}

} // namespace

int main(int argc, char* argv[]) {
  const std::string program_name = "upstream";
  const std::vector<std::string> args(argv + 1, argv + argc);

  upstream::cli::ProgramOptions options;
  try {
    options = upstream::cli::parse_command_line(args);
  } catch (const upstream::cli::UsageError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(program_name);
    return upstream::cli::EXIT_USAGE_ERROR;
  }

  if (options.command == upstream::cli::Command::Help) {
    std::cout << upstream::cli::usage(program_name);
    return upstream::cli::EXIT_OK;
  }
  if (options.command == upstream::cli::Command::Version) {
    std::cout << program_name << " " << UPSTREAM_VERSION << '\n';
    return upstream::cli::EXIT_OK;
  }

  try {
    return run_client(options);
  } catch (const upstream::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return upstream::cli::EXIT_USAGE_ERROR;
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return upstream::cli::EXIT_USAGE_ERROR;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
