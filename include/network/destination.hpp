#ifndef UPSTREAM_NETWORK_DESTINATION_HPP
#define UPSTREAM_NETWORK_DESTINATION_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace upstream::network {

// Picks the file a download is written to. Touches the filesystem only to check it.
//  - dest given: a relative dest is anchored at working_dir first. The anchored path
//    must not exist (FileError AlreadyExists) and its directory must exist (FileError InvalidDirectory)
//  - dest absent: working_dir / fallback_name
std::filesystem::path resolve_destination(const std::optional<std::filesystem::path>& dest,
                                          const std::filesystem::path& working_dir,
                                          const std::string& fallback_name);

// Source of an upload must be an existing regular file (FileError NotFound otherwise)
std::filesystem::path check_source_file(const std::filesystem::path& path);

} // namespace upstream::network

#endif // UPSTREAM_NETWORK_DESTINATION_HPP
