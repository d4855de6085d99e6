#ifndef UPSTREAM_NETWORK_BEAST_HTTP_CLIENT_HPP
#define UPSTREAM_NETWORK_BEAST_HTTP_CLIENT_HPP

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <string>
#include "network/http_client.hpp"

namespace upstream::network {

// HTTP/1.1 over plain TCP with Boost.Beast. One connection per request
// ("Connection: close"), blocking I/O on the calling thread.
// Socket and protocol failures are thrown as ConnectError.
class BeastHttpClient : public HttpClient {
public:
  static constexpr std::size_t UPLOAD_SLICE_SIZE = 64 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BeastHttpClient();
  ~BeastHttpClient() override = default;


  // ---- REQUESTS ----
  bool probe(const ServerUrl& server, std::chrono::milliseconds timeout) override;
  HttpResponse post(const ServerUrl& server, const std::string& target,
                    BodySource& body, const ProgressCallback& progress) override;
  HttpResponse get(const ServerUrl& server, const std::string& target,
                   std::size_t slice_size, const BodySink& sink) override;

private:
  // ---- PARAMETERS ----
  std::string user_agent_;


  // ---- CONNECTION HANDLING ----
  // Resolves the server and connects stream to the first endpoint that answers
  void connect(boost::beast::tcp_stream& stream, const ServerUrl& server);
  // Half-closes the socket after the response has been read
  void close(boost::beast::tcp_stream& stream);
};

} // namespace upstream::network

#endif // UPSTREAM_NETWORK_BEAST_HTTP_CLIENT_HPP
