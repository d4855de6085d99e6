#ifndef UPSTREAM_SHARD_SIZE_PARSER_HPP
#define UPSTREAM_SHARD_SIZE_PARSER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace upstream {
namespace shard {

class InvalidSizeFormat : public std::invalid_argument {
public:
  explicit InvalidSizeFormat(const std::string& input)
    : std::invalid_argument("Invalid size format: '" + input + "' (expected e.g. 250m, 512k, 1024b)") {}
};

constexpr std::uint64_t KIB = 1024;
constexpr std::uint64_t MIB = 1024 * KIB;

// Parses "250m", "512k", "1024b" or plain "100" into a byte count.
// Suffixes are case-insensitive; anything else throws InvalidSizeFormat.
std::uint64_t parse_size(const std::string& input);

} // namespace shard
} // namespace upstream

#endif // UPSTREAM_SHARD_SIZE_PARSER_HPP
