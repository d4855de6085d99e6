#include "network/transport.hpp"
#include "network/destination.hpp"
#include "network/multipart_encoder.hpp"
#include "network/transfer_error.hpp"
#include "shard/shard_planner.hpp"
#include <algorithm>
#include <fstream>
#include <boost/log/trivial.hpp>

namespace upstream::network {

const char* transport_state_to_string(TransportState state) {
  switch (state) {
    case TransportState::Disconnected: return "Disconnected";
    case TransportState::Ready: return "Ready";
    case TransportState::Busy: return "Busy";
    default: return "Unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Transport::Transport(const std::string& server_url, std::unique_ptr<HttpClient> client,
                     std::chrono::milliseconds probe_timeout)
  : server_(ServerUrl::parse(server_url))
  , client_(std::move(client)) {

  if (!client_) {
    throw std::invalid_argument("Transport: HTTP client must not be null");
  }

  BOOST_LOG_TRIVIAL(info) << "Transport: Connecting to " << server_.to_string();
  check_connectivity(probe_timeout);
  state_ = TransportState::Ready;
  BOOST_LOG_TRIVIAL(info) << "Transport: Server " << server_.to_string() << " is reachable";
}

Transport::~Transport() = default;

Transport::BusyGuard::BusyGuard(Transport& transport) : transport_(transport) {
  if (transport_.state_ != TransportState::Ready) {
    throw std::logic_error(std::string("Transport: Not ready, state is ")
                           + transport_state_to_string(transport_.state_));
  }
  transport_.state_ = TransportState::Busy;
}

Transport::BusyGuard::~BusyGuard() {
  transport_.state_ = TransportState::Ready;
}


//==============================================
// CONNECTIVITY
//==============================================

void Transport::check_connectivity(std::chrono::milliseconds timeout) {
  if (!client_->probe(server_, timeout)) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Could not connect to " << server_.to_string();
    throw ConnectError("Could not connect to server.");
  }
}


//==============================================
// UPLOAD
//==============================================

shard::Shard Transport::upload(const std::filesystem::path& file_path, std::uint64_t start_offset,
                               std::uint64_t shard_size, const ProgressCallback& progress) {
  // All local checks happen before the request is built
  check_source_file(file_path);
  if (shard_size == 0) {
    throw shard::InvalidShardSize();
  }

  const std::uint64_t file_size = std::filesystem::file_size(file_path);
  if (start_offset >= file_size && !(start_offset == 0 && file_size == 0)) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Offset " << start_offset << " is past the end of "
                             << file_path.string() << " (" << file_size << " bytes)";
    throw std::invalid_argument("Transport: Upload offset is past end of file");
  }

  // Clamped without forming start + shard_size, which can overflow
  const std::uint64_t length = std::min(shard_size, file_size - start_offset);

  BusyGuard guard(*this);
  BOOST_LOG_TRIVIAL(info) << "Transport: Uploading " << length << " bytes of " << file_path.string()
                          << " from offset " << start_offset;

  MultipartEncoder encoder(file_path, start_offset, length, file_path.filename().string(),
                           MultipartEncoder::generate_boundary());

  // Report shard bytes rather than multipart framing bytes
  const std::uint64_t preamble = encoder.preamble_size();
  auto body_progress = [&progress, preamble, length](std::uint64_t sent, std::uint64_t /*total*/) {
    const std::uint64_t payload_sent = sent > preamble ? std::min(sent - preamble, length) : 0;
    notify_progress(progress, payload_sent, length);
  };

  notify_progress(progress, 0, length);
  HttpResponse response = client_->post(server_, server_.target(UPLOAD_PATH), encoder, body_progress);

  return interpret_upload_response(response);
}

shard::Shard Transport::interpret_upload_response(const HttpResponse& response) const {
  BOOST_LOG_TRIVIAL(debug) << "Transport: Upload answered " << response.status << " " << response.reason;

  switch (response.status) {
    case 201:
      try {
        shard::Shard result = shard::Shard::from_json(response.body);
        BOOST_LOG_TRIVIAL(info) << "Transport: Upload stored as " << result.uri();
        return result;
      } catch (const std::invalid_argument& e) {
        BOOST_LOG_TRIVIAL(error) << "Transport: " << e.what();
        throw ResponseError("Malformed upload response.", response.status, response.reason, response.body);
      }
    case 402:
      throw ResponseError("Payment required.", response.status, response.reason, response.body);
    case 404:
      throw ResponseError("API call not found.", response.status, response.reason, response.body);
    case 500:
      throw ResponseError("Server error.", response.status, response.reason, response.body);
    default:
      BOOST_LOG_TRIVIAL(error) << "Transport: Unexpected upload status " << response.status;
      throw ResponseError("Received status code " + std::to_string(response.status) + " " + response.reason,
                          response.status, response.reason, response.body);
  }
}


//==============================================
// DOWNLOAD
//==============================================

std::filesystem::path Transport::download(const shard::Shard& shard,
                                          const std::optional<std::filesystem::path>& dest,
                                          const std::filesystem::path& working_dir,
                                          std::size_t chunk_size) {
  if (!shard.has_hash()) {
    throw ChunkError();
  }

  const std::string fallback = shard.filename().empty() ? shard.filehash() : shard.filename();
  std::filesystem::path save_path = resolve_destination(dest, working_dir, fallback);

  append(shard, save_path, chunk_size);
  return save_path;
}

std::uint64_t Transport::append(const shard::Shard& shard, const std::filesystem::path& path,
                                std::size_t chunk_size) {
  std::ofstream file;
  std::uint64_t written = 0;

  auto open_file = [&file, &path]() {
    file.open(path, std::ios::binary | std::ios::app);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Transport: Failed to open " << path.string() << " for writing";
      throw FileError(FileError::Kind::Io, "Failed to open " + path.string() + " for writing");
    }
  };

  request_shard(shard, chunk_size, [&](const char* data, std::size_t size) {
    if (!file.is_open()) {
      open_file();
    }
    if (!file.write(data, static_cast<std::streamsize>(size))) {
      throw FileError(FileError::Kind::Io, "Failed to write to " + path.string());
    }
    written += size;
  });

  // A 200 with an empty body still creates the file
  if (!file.is_open()) {
    open_file();
  }
  file.close();
  if (file.fail()) {
    throw FileError(FileError::Kind::Io, "Failed to write to " + path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Transport: Wrote " << written << " bytes of " << shard.uri()
                          << " to " << path.string();
  return written;
}

std::uint64_t Transport::fetch(const shard::Shard& shard, std::ostream& output, std::size_t chunk_size) {
  std::uint64_t written = 0;
  request_shard(shard, chunk_size, [&output, &written](const char* data, std::size_t size) {
    if (!output.write(data, static_cast<std::streamsize>(size))) {
      throw FileError(FileError::Kind::Io, "Failed to write to output stream");
    }
    written += size;
  });
  return written;
}

void Transport::request_shard(const shard::Shard& shard, std::size_t chunk_size,
                              const HttpClient::BodySink& sink) {
  if (!shard.has_hash()) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Refusing to download a shard without a hash";
    throw ChunkError();
  }
  if (chunk_size == 0) {
    throw std::invalid_argument("Transport: Chunk size must be greater than zero");
  }

  BusyGuard guard(*this);
  const std::string target = server_.target(DOWNLOAD_PATH + shard.uri());
  BOOST_LOG_TRIVIAL(info) << "Transport: Downloading " << shard.uri();

  HttpResponse response = client_->get(server_, target, chunk_size, sink);
  if (response.status != 200) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Download of " << shard.uri() << " answered "
                             << response.status << " " << response.reason;
    throw ResponseError("Received status code " + std::to_string(response.status) + " " + response.reason,
                        response.status, response.reason, response.body);
  }
}

} // namespace upstream::network
