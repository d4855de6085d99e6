#include "network/multipart_encoder.hpp"
#include "network/transfer_error.hpp"
#include "utils/random.hpp"
#include <algorithm>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace upstream::network {

namespace {

// Copies what is left of section into buffer, advancing pos
std::size_t copy_section(const std::string& section, std::size_t& pos, char* buffer, std::size_t size) {
  const std::size_t count = std::min(size, section.size() - pos);
  std::memcpy(buffer, section.data() + pos, count);
  pos += count;
  return count;
}

// Quotes and backslashes would end the quoted filename early
std::string escape_filename(const std::string& filename) {
  std::string escaped;
  for (char c : filename) {
    if (c == '"' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MultipartEncoder::MultipartEncoder(const std::filesystem::path& path, std::uint64_t offset,
                                   std::uint64_t length, const std::string& filename,
                                   const std::string& boundary, const std::string& field)
  : path_(path)
  , file_(path, std::ios::binary)
  , length_(length)
  , boundary_(boundary) {

  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Multipart encoder: Failed to open file: " << path_.string();
    throw FileError(FileError::Kind::Io, "Failed to open " + path_.string());
  }

  file_.seekg(static_cast<std::streamoff>(offset));
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Multipart encoder: Failed to seek to offset " << offset
                             << " in " << path_.string();
    throw FileError(FileError::Kind::Io, "Failed to seek in " + path_.string());
  }

  preamble_ = "--" + boundary_ + "\r\n"
            + "Content-Disposition: form-data; name=\"" + field
            + "\"; filename=\"" + escape_filename(filename) + "\"\r\n"
            + "Content-Type: application/octet-stream\r\n"
            + "\r\n";
  epilogue_ = "\r\n--" + boundary_ + "--\r\n";

  BOOST_LOG_TRIVIAL(debug) << "Multipart encoder: Encoding " << length_ << " bytes from offset "
                           << offset << " of " << path_.string();
}

std::string MultipartEncoder::generate_boundary() {
  return utils::random_hex(16);
}


//==============================================
// BodySource
//==============================================

std::string MultipartEncoder::content_type() const {
  return "multipart/form-data; boundary=" + boundary_;
}

std::uint64_t MultipartEncoder::content_length() const {
  return preamble_.size() + length_ + epilogue_.size();
}

std::size_t MultipartEncoder::read(char* buffer, std::size_t size) {
  std::size_t written = 0;

  if (preamble_pos_ < preamble_.size()) {
    written += copy_section(preamble_, preamble_pos_, buffer, size);
  }

  if (written < size && payload_pos_ < length_) {
    written += read_payload(buffer + written, size - written);
  }

  if (written < size && payload_pos_ == length_ && epilogue_pos_ < epilogue_.size()) {
    written += copy_section(epilogue_, epilogue_pos_, buffer + written, size - written);
  }

  return written;
}

std::size_t MultipartEncoder::read_payload(char* buffer, std::size_t size) {
  const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(size, length_ - payload_pos_));
  file_.read(buffer, static_cast<std::streamsize>(wanted));
  const auto got = static_cast<std::size_t>(file_.gcount());

  // The slice was clamped to the file size, so a short read means the file changed underneath us
  if (got != wanted) {
    BOOST_LOG_TRIVIAL(error) << "Multipart encoder: Short read from " << path_.string()
                             << " (" << got << " of " << wanted << " bytes)";
    throw FileError(FileError::Kind::Io, "Unexpected end of file while reading " + path_.string());
  }

  payload_pos_ += got;
  return got;
}

} // namespace upstream::network
