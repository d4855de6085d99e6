#include "shard/shard.hpp"
#include "network/transfer_error.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>

using json = nlohmann::json;

namespace upstream {
namespace shard {

Shard::Shard(std::string filehash, std::string decrypt_key, std::string filename)
  : filehash_(std::move(filehash))
  , decrypt_key_(std::move(decrypt_key))
  , filename_(std::move(filename)) {}

Shard Shard::from_json(const std::string& json_text) {
  json body = json::parse(json_text, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    BOOST_LOG_TRIVIAL(error) << "Shard: Failed to parse JSON: " << json_text;
    throw std::invalid_argument("Shard: Response body is not a JSON object");
  }

  auto hash_it = body.find("filehash");
  if (hash_it == body.end() || !hash_it->is_string() || hash_it->get<std::string>().empty()) {
    BOOST_LOG_TRIVIAL(error) << "Shard: JSON has no filehash: " << json_text;
    throw std::invalid_argument("Shard: Response has no filehash");
  }

  // Optional fields may be absent or null
  auto optional_string = [&body](const char* field) -> std::string {
    auto it = body.find(field);
    if (it == body.end() || !it->is_string()) {
      return "";
    }
    return it->get<std::string>();
  };

  Shard shard(hash_it->get<std::string>(), optional_string("key"), optional_string("filename"));
  BOOST_LOG_TRIVIAL(debug) << "Shard: Parsed shard from JSON: " << shard.uri();
  return shard;
}

Shard Shard::from_uri(const std::string& uri) {
  const std::string separator(KEY_SEPARATOR);

  std::string hash = uri;
  std::string key;
  auto pos = uri.find(separator);
  if (pos != std::string::npos) {
    hash = uri.substr(0, pos);
    key = uri.substr(pos + separator.size());
  }

  if (hash.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Shard: URI has no content hash: " << uri;
    throw network::ChunkError("Shard: URI has no content hash: " + uri);
  }

  return Shard(hash, key);
}

std::string Shard::uri() const {
  if (decrypt_key_.empty()) {
    return filehash_;
  }
  return filehash_ + KEY_SEPARATOR + decrypt_key_;
}

std::string Shard::to_json() const {
  json body = {{"filehash", filehash_}};
  if (!decrypt_key_.empty()) {
    body["key"] = decrypt_key_;
  }
  if (!filename_.empty()) {
    body["filename"] = filename_;
  }
  return body.dump();
}

bool Shard::operator==(const Shard& other) const {
  return filehash_ == other.filehash_
      && decrypt_key_ == other.decrypt_key_
      && filename_ == other.filename_;
}

} // namespace shard
} // namespace upstream
