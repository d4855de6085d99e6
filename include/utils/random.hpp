#pragma once

#include <cstddef>
#include <string>

namespace upstream {
namespace utils {

// Lowercase hex of byte_count bytes from OpenSSL's CSPRNG (2 chars per byte)
std::string random_hex(std::size_t byte_count);

} // namespace utils
} // namespace upstream
