#ifndef UPSTREAM_NETWORK_HTTP_CLIENT_HPP
#define UPSTREAM_NETWORK_HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include "network/progress_sink.hpp"
#include "network/server_url.hpp"

namespace upstream::network {

struct HttpResponse {
  unsigned status = 0;
  std::string reason;
  // Full body for non-streamed responses; empty when the body went to a sink
  std::string body;
};

// Pull-style request body with a length known up front
class BodySource {
public:
  virtual ~BodySource() = default;

  virtual std::string content_type() const = 0;
  virtual std::uint64_t content_length() const = 0;
  // Copies up to size bytes into buffer, returns 0 once exhausted
  virtual std::size_t read(char* buffer, std::size_t size) = 0;

protected:
  BodySource() = default;
};

class HttpClient {
public:
  using BodySink = std::function<void(const char* data, std::size_t size)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  virtual ~HttpClient() = default;


  // ---- REQUESTS ----
  // Lightweight request against the server root. True if any HTTP response arrived in time.
  virtual bool probe(const ServerUrl& server, std::chrono::milliseconds timeout) = 0;
  // Streams body as a POST, calling progress with (body bytes sent, content length)
  virtual HttpResponse post(const ServerUrl& server, const std::string& target,
                            BodySource& body, const ProgressCallback& progress) = 0;
  // GET whose 200 body is passed to sink in slices of at most slice_size bytes.
  // Any other status has its body buffered into HttpResponse::body instead.
  virtual HttpResponse get(const ServerUrl& server, const std::string& target,
                           std::size_t slice_size, const BodySink& sink) = 0;

protected:
  HttpClient() = default;
};

} // namespace upstream::network

#endif // UPSTREAM_NETWORK_HTTP_CLIENT_HPP
