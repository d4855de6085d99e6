#include "network/destination.hpp"
#include "network/transfer_error.hpp"
#include <boost/log/trivial.hpp>

namespace upstream::network {

std::filesystem::path resolve_destination(const std::optional<std::filesystem::path>& dest,
                                          const std::filesystem::path& working_dir,
                                          const std::string& fallback_name) {
  if (!dest) {
    std::filesystem::path path = working_dir / fallback_name;
    BOOST_LOG_TRIVIAL(debug) << "Destination: No destination given, using " << path.string();
    return path;
  }

  // Relative destinations live under working_dir
  const std::filesystem::path candidate = dest->is_relative() ? working_dir / *dest : *dest;

  std::error_code ec;
  if (std::filesystem::exists(candidate, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Destination: " << candidate.string() << " already exists";
    throw FileError(FileError::Kind::AlreadyExists, candidate.string() + " already exists");
  }

  const std::filesystem::path directory = candidate.parent_path();
  const std::filesystem::path filename = candidate.filename();

  if (filename.empty() || !std::filesystem::is_directory(directory, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Destination: " << directory.string() << " is not a valid path";
    throw FileError(FileError::Kind::InvalidDirectory, directory.string() + " is not a valid path");
  }

  return directory / filename;
}

std::filesystem::path check_source_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Destination: Upload source is not a file: " << path.string();
    throw FileError(FileError::Kind::NotFound, path.string() + " not a file or not found");
  }
  return path;
}

} // namespace upstream::network
