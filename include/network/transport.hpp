#ifndef UPSTREAM_NETWORK_TRANSPORT_HPP
#define UPSTREAM_NETWORK_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include "network/http_client.hpp"
#include "network/progress_sink.hpp"
#include "network/server_url.hpp"
#include "shard/shard.hpp"

namespace upstream::network {

enum class TransportState {
  Disconnected,
  Ready,
  Busy
};

const char* transport_state_to_string(TransportState state);

// Single point of contact with one storage server.
// Probes the server on construction; a failed probe throws ConnectError, so an
// instance that exists is always reachable-at-creation. No reconnect logic.
class Transport {
public:
  static constexpr const char* UPLOAD_PATH = "/api/upload";
  static constexpr const char* DOWNLOAD_PATH = "/api/download/";
  static constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{1000};
  static constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024;

  // Delete copy operations, one instance owns one server session
  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Transport(const std::string& server_url, std::unique_ptr<HttpClient> client,
            std::chrono::milliseconds probe_timeout = DEFAULT_PROBE_TIMEOUT);
  ~Transport();


  // ---- UPLOAD ----
  // Sends [start_offset, start_offset + shard_size) of file_path, clamped to
  // end-of-file, as multipart/form-data to POST {server}/api/upload.
  // progress receives (shard bytes sent, shard bytes total), first with (0, total).
  // Throws FileError for a missing source, InvalidShardSize for a zero shard_size and
  // std::invalid_argument when start_offset is at or past end-of-file.
  shard::Shard upload(const std::filesystem::path& file_path, std::uint64_t start_offset,
                      std::uint64_t shard_size, const ProgressCallback& progress = nullptr);


  // ---- DOWNLOAD ----
  // Validates dest (see resolve_destination), then writes the shard to it.
  // Without dest the file lands in working_dir named after the shard's filename or hash.
  std::filesystem::path download(const shard::Shard& shard,
                                 const std::optional<std::filesystem::path>& dest,
                                 const std::filesystem::path& working_dir,
                                 std::size_t chunk_size = DEFAULT_CHUNK_SIZE);
  // Appends the shard to path without destination checks; sequential calls concatenate.
  // The file is only opened once the server has answered 200.
  std::uint64_t append(const shard::Shard& shard, const std::filesystem::path& path,
                       std::size_t chunk_size = DEFAULT_CHUNK_SIZE);
  // Streams the shard into output, returns the byte count
  std::uint64_t fetch(const shard::Shard& shard, std::ostream& output,
                      std::size_t chunk_size = DEFAULT_CHUNK_SIZE);


  // ---- GETTERS ----
  const ServerUrl& server() const { return server_; }
  TransportState state() const { return state_; }

private:
  // ---- PARAMETERS ----
  ServerUrl server_;
  std::unique_ptr<HttpClient> client_;
  TransportState state_{TransportState::Disconnected};

  // Marks the transport Busy for the lifetime of one call
  class BusyGuard {
  public:
    explicit BusyGuard(Transport& transport);
    ~BusyGuard();
  private:
    Transport& transport_;
  };


  // ---- CONNECTIVITY ----
  void check_connectivity(std::chrono::milliseconds timeout);


  // ---- RESPONSE HANDLING ----
  // Maps an upload response to a Shard or throws ResponseError
  shard::Shard interpret_upload_response(const HttpResponse& response) const;
  // Issues the GET for shard and passes a 200 body to sink, throws ResponseError otherwise
  void request_shard(const shard::Shard& shard, std::size_t chunk_size, const HttpClient::BodySink& sink);
};

} // namespace upstream::network

#endif // UPSTREAM_NETWORK_TRANSPORT_HPP
