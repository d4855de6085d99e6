#ifndef UPSTREAM_SHARD_SHARD_HPP
#define UPSTREAM_SHARD_SHARD_HPP

#include <string>

namespace upstream {
namespace shard {

// Immutable handle to one stored piece of a file.
// Built either from the server's upload response or from a user-supplied URI.
class Shard {
public:
  // URI separator between the content hash and the decryption key
  static constexpr const char* KEY_SEPARATOR = "?key=";

  // ---- CONSTRUCTION ----
  Shard(std::string filehash, std::string decrypt_key = "", std::string filename = "");

  // Parses a 201 upload response body: {"filehash": ..., "key": ..., "filename": ...}.
  // Throws std::invalid_argument when the body is not JSON or has no filehash.
  static Shard from_json(const std::string& json_text);
  // Parses "<hash>" or "<hash>?key=<key>". Throws network::ChunkError on an empty hash.
  static Shard from_uri(const std::string& uri);


  // ---- GETTERS ----
  const std::string& filehash() const { return filehash_; }
  const std::string& decrypt_key() const { return decrypt_key_; }
  const std::string& filename() const { return filename_; }
  bool has_hash() const { return !filehash_.empty(); }

  // "<hash>" without a key, "<hash>?key=<key>" with one
  std::string uri() const;
  std::string to_json() const;

  bool operator==(const Shard& other) const;

private:
  // ---- PARAMETERS ----
  std::string filehash_;
  std::string decrypt_key_;
  std::string filename_;
};

} // namespace shard
} // namespace upstream

#endif // UPSTREAM_SHARD_SHARD_HPP
