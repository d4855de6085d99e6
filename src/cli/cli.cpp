#include "cli/cli.hpp"
#include "cli/progress_bar.hpp"
#include "network/beast_http_client.hpp"
#include "network/destination.hpp"
#include "network/transfer_error.hpp"
#include "shard/shard_planner.hpp"
#include "shard/size_parser.hpp"
#include "utils/random.hpp"
#include <cstdlib>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace upstream {
namespace cli {

namespace {

bool is_flag(const std::string& token) {
  return token.size() > 1 && token[0] == '-';
}

const std::string& take_value(const std::vector<std::string>& args, std::size_t& i) {
  if (i + 1 >= args.size() || is_flag(args[i + 1])) {
    throw UsageError("Missing value for " + args[i]);
  }
  return args[++i];
}

} // namespace

//==============================================
// COMMAND LINE
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args) {
  ProgramOptions options;
  std::vector<std::string> positionals;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.command = Command::Help;
      return options;
    }
    if (arg == "--version") {
      options.command = Command::Version;
      return options;
    }

    if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--server") {
      options.server = take_value(args, i);
    } else if (arg == "--config") {
      options.config_path = take_value(args, i);
    } else if (arg == "--log-file") {
      options.log_file = take_value(args, i);
    } else if (arg == "--shard-size") {
      options.shard_size = take_value(args, i);
    } else if (arg == "--dest") {
      options.dest = take_value(args, i);
    } else if (arg == "--uri") {
      // One or more values, up to the next flag
      if (i + 1 >= args.size() || is_flag(args[i + 1])) {
        throw UsageError("--uri requires at least one URI");
      }
      while (i + 1 < args.size() && !is_flag(args[i + 1])) {
        options.uris.push_back(args[++i]);
      }
    } else if (is_flag(arg)) {
      throw UsageError("Unknown argument: " + arg);
    } else {
      positionals.push_back(arg);
    }
  }

  if (positionals.empty()) {
    throw UsageError("No command given");
  }

  const std::string& command = positionals.front();
  if (command == "upload") {
    options.command = Command::Upload;
    if (positionals.size() != 2) {
      throw UsageError("upload takes exactly one file");
    }
    if (!options.uris.empty() || options.dest) {
      throw UsageError("--uri and --dest only apply to download");
    }
    options.file = positionals[1];
  } else if (command == "download") {
    options.command = Command::Download;
    if (positionals.size() != 1) {
      throw UsageError("Unexpected argument: " + positionals[1]);
    }
    if (options.uris.empty()) {
      throw UsageError("download requires --uri");
    }
  } else {
    throw UsageError("Unknown command: " + command);
  }

  return options;
}

std::string usage(const std::string& program_name) {
  std::ostringstream ss;
  ss << "Usage: " << program_name << " [--server URL] [--config PATH] [--log-file PATH] [-v] <command>\n"
     << "Commands:\n"
     << "  upload <file> [--shard-size SIZE]\n"
     << "      Split <file> into shards of SIZE (e.g. 25m, 512k, 1024b; default 250m)\n"
     << "      and upload them one by one\n"
     << "  download --uri URI [URI ...] [--dest PATH] [--shard-size N]\n"
     << "      Download the shards in order and join them into PATH\n"
     << "      (N is the write slice in bytes, default 1024)\n"
     << "Options:\n"
     << "  --server URL     Storage node to connect to (default " << config::DEFAULT_SERVER << ")\n"
     << "  --config PATH    JSON config file\n"
     << "  --log-file PATH  Also write logs to PATH\n"
     << "  -v               Verbose output\n"
     << "  --version        Display version\n"
     << "  -h, --help       Display this help message\n"
     << "Example: " << program_name << " upload --shard-size 25m video.mp4\n";
  return ss.str();
}

config::ClientConfig build_config(const ProgramOptions& options) {
  config::ClientConfig result;

  if (options.config_path) {
    config::load_file(*options.config_path, result);
  }
  config::apply_environment(result);

  if (options.server) {
    result.server = *options.server;
  }
  if (options.log_file) {
    result.log_file = *options.log_file;
  }
  result.verbose = options.verbose;

  if (options.shard_size) {
    const std::uint64_t size = shard::parse_size(*options.shard_size);
    if (options.command == Command::Download) {
      if (size == 0) {
        throw shard::InvalidShardSize();
      }
      result.download_slice = static_cast<std::size_t>(size);
    } else {
      result.shard_size = size;
    }
  }

  return result;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(config::ClientConfig config, std::filesystem::path working_dir,
         std::ostream& out, std::ostream& err, TransportFactory transport_factory)
  : config_(std::move(config))
  , working_dir_(std::move(working_dir))
  , out_(out)
  , err_(err)
  , transport_factory_(std::move(transport_factory)) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Initialized with server " << config_.server
                           << " in " << working_dir_.string();
}

CLI::TransportFactory CLI::default_transport_factory() {
  return [](const config::ClientConfig& config) {
    return std::make_unique<network::Transport>(
      config.server, std::make_unique<network::BeastHttpClient>(), config.probe_timeout);
  };
}


//==============================================
// COMMANDS
//==============================================

int CLI::run(const ProgramOptions& options) {
  try {
    switch (options.command) {
      case Command::Upload:
        upload(options.file);
        return EXIT_OK;
      case Command::Download:
        download(options.uris, options.dest);
        return EXIT_OK;
      default:
        throw UsageError("No command given");
    }
  }
  catch (const network::FileError& e) {
    BOOST_LOG_TRIVIAL(debug) << "CLI: File error kind: " << network::file_error_kind_to_string(e.kind());
    log_and_display_error("File error", e.what());
    return EXIT_FILE_ERROR;
  }
  catch (const network::ResponseError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << e.what();
    err_ << "\nError!\n"
         << e.status() << "  " << e.reason() << "\n"
         << e.body() << std::endl;
    return EXIT_TRANSFER_ERROR;
  }
  catch (const network::TransferError& e) {
    log_and_display_error("Transfer failed", e.what());
    return EXIT_TRANSFER_ERROR;
  }
  catch (const std::invalid_argument& e) {
    // Bad sizes and usage mistakes
    log_and_display_error("Invalid argument", e.what());
    return EXIT_USAGE_ERROR;
  }
}

std::vector<shard::Shard> CLI::upload(const std::string& file) {
  // Pre-flight: everything local is checked before the server is contacted
  const std::filesystem::path path = network::check_source_file(absolute_path(file));
  const std::uint64_t file_size = std::filesystem::file_size(path);
  if (file_size == 0) {
    throw network::FileError(network::FileError::Kind::Empty, path.string() + " is empty");
  }

  const shard::ShardPlanner planner(config_.shard_size);
  const std::vector<shard::ByteRange> ranges = planner.plan(file_size);

  if (config_.verbose) {
    for (std::size_t i = 0; i < ranges.size(); ++i) {
      out_ << "Shard " << i << " - Start: " << ranges[i].start << "; End: " << ranges[i].end << "\n";
    }
    out_ << "File will be uploaded in " << ranges.size() << " piece(s)." << std::endl;
  }

  std::unique_ptr<network::Transport> transport = transport_factory_(config_);

  std::vector<shard::Shard> shards;
  shards.reserve(ranges.size());
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    BOOST_LOG_TRIVIAL(info) << "CLI: Uploading shard " << i + 1 << " of " << ranges.size();

    ProgressBar bar(err_, "Uploading Shard: ");
    shards.push_back(transport->upload(path, ranges[i].start, planner.shard_size(), bar.callback()));
    bar.finish();

    out_ << "Shard " << i + 1 << " - URI: " << shards.back().uri() << std::endl;
  }

  std::string uris;
  for (const auto& shard : shards) {
    uris += (uris.empty() ? "" : " ") + shard.uri();
  }

  out_ << "\nDownload this file by using the following command: \n"
       << "upstream download --uri " << uris << " --dest <filename>" << std::endl;
  return shards;
}

std::filesystem::path CLI::download(const std::vector<std::string>& uris,
                                    const std::optional<std::string>& dest) {
  std::vector<shard::Shard> shards;
  shards.reserve(uris.size());
  for (const auto& uri : uris) {
    if (config_.verbose) {
      out_ << "Creating shard." << std::endl;
    }
    shards.push_back(shard::Shard::from_uri(uri));
  }

  if (config_.verbose) {
    out_ << "There are " << shards.size() << " shards to download." << std::endl;
  }

  // The destination is validated once; every shard is then appended to it
  std::optional<std::filesystem::path> dest_path;
  if (dest) {
    dest_path = absolute_path(*dest);
  }
  const std::filesystem::path save_path =
    network::resolve_destination(dest_path, working_dir_, utils::random_hex(16));

  if (config_.verbose) {
    out_ << "Connecting to " << config_.server << "..." << std::endl;
  }
  std::unique_ptr<network::Transport> transport = transport_factory_(config_);

  for (std::size_t i = 0; i < shards.size(); ++i) {
    if (config_.verbose) {
      out_ << "Downloading file " << shards[i].uri() << "..." << std::endl;
    } else {
      out_ << "Downloading file " << i + 1 << "..." << std::endl;
    }
    transport->append(shards[i], save_path, config_.download_slice);
    if (config_.verbose) {
      out_ << "Writing shard." << std::endl;
    }
  }

  out_ << "\nDownloaded to " << save_path.string() << "." << std::endl;
  return save_path;
}


//==============================================
// HELPERS
//==============================================

std::filesystem::path CLI::absolute_path(const std::string& path) const {
  std::filesystem::path expanded(path);

  if (path == "~" || path.rfind("~/", 0) == 0) {
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
      expanded = path == "~" ? std::filesystem::path(home) : std::filesystem::path(home) / path.substr(2);
    }
  }

  if (expanded.is_relative()) {
    expanded = working_dir_ / expanded;
  }
  return expanded;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace upstream
