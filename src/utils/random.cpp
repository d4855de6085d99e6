#include "utils/random.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace upstream {
namespace utils {

std::string random_hex(std::size_t byte_count) {
  std::vector<unsigned char> bytes(byte_count);
  if (byte_count > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Random: RAND_bytes failed";
    throw std::runtime_error("Random: Failed to generate random bytes");
  }

  std::stringstream ss;
  for (unsigned char byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace utils
} // namespace upstream
