#ifndef UPSTREAM_NETWORK_MULTIPART_ENCODER_HPP
#define UPSTREAM_NETWORK_MULTIPART_ENCODER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include "network/http_client.hpp"

namespace upstream::network {

// multipart/form-data body with a single file field whose content is a
// byte slice of a local file, read lazily as the body is pulled.
//
// Layout:
//   --<boundary>\r\n
//   Content-Disposition: form-data; name="<field>"; filename="<filename>"\r\n
//   Content-Type: application/octet-stream\r\n
//   \r\n
//   <slice bytes>\r\n
//   --<boundary>--\r\n
class MultipartEncoder : public BodySource {
public:
  static constexpr const char* DEFAULT_FIELD = "file";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens path and seeks to offset. length must already be clamped to the file.
  // Throws FileError if the file cannot be opened or positioned.
  MultipartEncoder(const std::filesystem::path& path, std::uint64_t offset, std::uint64_t length,
                   const std::string& filename, const std::string& boundary,
                   const std::string& field = DEFAULT_FIELD);

  // Boundary of 32 random hex characters
  static std::string generate_boundary();


  // ---- BodySource ----
  std::string content_type() const override;
  std::uint64_t content_length() const override;
  std::size_t read(char* buffer, std::size_t size) override;


  // ---- GETTERS ----
  const std::string& boundary() const { return boundary_; }
  // Bytes of framing written before the file content
  std::uint64_t preamble_size() const { return preamble_.size(); }
  std::uint64_t payload_size() const { return length_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::ifstream file_;
  std::uint64_t length_;
  std::string boundary_;
  std::string preamble_;
  std::string epilogue_;

  // Read cursors for the three body sections
  std::size_t preamble_pos_{0};
  std::uint64_t payload_pos_{0};
  std::size_t epilogue_pos_{0};

  std::size_t read_payload(char* buffer, std::size_t size);
};

} // namespace upstream::network

#endif // UPSTREAM_NETWORK_MULTIPART_ENCODER_HPP
