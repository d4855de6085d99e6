#include "shard/size_parser.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <boost/log/trivial.hpp>

namespace upstream {
namespace shard {

namespace {

bool all_digits(const std::string& text) {
  return !text.empty() && std::all_of(text.begin(), text.end(),
    [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::uint64_t to_magnitude(const std::string& digits, const std::string& input) {
  try {
    return std::stoull(digits);
  } catch (const std::out_of_range&) {
    throw InvalidSizeFormat(input);
  }
}

} // namespace

std::uint64_t parse_size(const std::string& input) {
  BOOST_LOG_TRIVIAL(debug) << "Size parser: Parsing size string: " << input;

  if (all_digits(input)) {
    return to_magnitude(input, input);
  }

  if (input.size() < 2) {
    throw InvalidSizeFormat(input);
  }

  const char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(input.back())));
  const std::string number = input.substr(0, input.size() - 1);
  if (!all_digits(number)) {
    throw InvalidSizeFormat(input);
  }

  std::uint64_t multiplier = 0;
  switch (unit) {
    case 'b': multiplier = 1; break;
    case 'k': multiplier = KIB; break;
    case 'm': multiplier = MIB; break;
    default:
      BOOST_LOG_TRIVIAL(error) << "Size parser: Unknown size suffix '" << input.back() << "' in: " << input;
      throw InvalidSizeFormat(input);
  }

  const std::uint64_t magnitude = to_magnitude(number, input);
  if (magnitude > std::numeric_limits<std::uint64_t>::max() / multiplier) {
    throw InvalidSizeFormat(input);
  }

  const std::uint64_t bytes = magnitude * multiplier;
  BOOST_LOG_TRIVIAL(debug) << "Size parser: " << input << " = " << bytes << " bytes";
  return bytes;
}

} // namespace shard
} // namespace upstream
