#include "network/beast_http_client.hpp"
#include "network/transfer_error.hpp"
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/log/trivial.hpp>
#include <vector>

namespace upstream::network {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

std::string to_std_string(beast::string_view view) {
  return std::string(view.data(), view.size());
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeastHttpClient::BeastHttpClient()
  : user_agent_(std::string("upstream/") + UPSTREAM_VERSION + " " + BOOST_BEAST_VERSION_STRING) {}


//==============================================
// REQUESTS
//==============================================

bool BeastHttpClient::probe(const ServerUrl& server, std::chrono::milliseconds timeout) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: Probing " << server.to_string()
                           << " with timeout " << timeout.count() << "ms";

  boost::asio::io_context io_context;
  tcp::resolver resolver(io_context);
  beast::tcp_stream stream(io_context);
  beast::flat_buffer buffer;
  http::response_parser<http::empty_body> parser;
  bool reachable = false;

  http::request<http::empty_body> req{http::verb::head, server.root_target(), 11};
  req.set(http::field::host, server.host_header());
  req.set(http::field::user_agent, user_agent_);
  req.set(http::field::connection, "close");

  auto on_failure = [](const char* stage, const boost::system::error_code& ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: Probe failed during " << stage << ": " << ec.message();
  };

  // Any response header counts as reachable, whatever the status
  auto on_read = [&](const boost::system::error_code& ec, std::size_t) {
    if (ec) {
      on_failure("read", ec);
      return;
    }
    reachable = true;
  };

  auto on_write = [&](const boost::system::error_code& ec, std::size_t) {
    if (ec) {
      on_failure("write", ec);
      return;
    }
    http::async_read_header(stream, buffer, parser, on_read);
  };

  auto on_connect = [&](const boost::system::error_code& ec, const tcp::endpoint&) {
    if (ec) {
      on_failure("connect", ec);
      return;
    }
    http::async_write(stream, req, on_write);
  };

  auto on_resolve = [&](const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
    if (ec) {
      on_failure("resolve", ec);
      return;
    }
    stream.expires_after(timeout);
    stream.async_connect(results, on_connect);
  };

  resolver.async_resolve(server.host(), std::to_string(server.port()), on_resolve);

  // The resolver has no deadline of its own; bound the whole exchange here
  io_context.run_for(timeout);

  if (!reachable) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP client: " << server.to_string() << " did not answer within "
                               << timeout.count() << "ms";
  }
  return reachable;
}

HttpResponse BeastHttpClient::post(const ServerUrl& server, const std::string& target,
                                   BodySource& body, const ProgressCallback& progress) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: POST " << target << " (" << body.content_length() << " bytes)";

  try {
    boost::asio::io_context io_context;
    beast::tcp_stream stream(io_context);
    connect(stream, server);

    http::request<http::buffer_body> req{http::verb::post, target, 11};
    req.set(http::field::host, server.host_header());
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::content_type, body.content_type());
    req.set(http::field::connection, "close");
    req.content_length(body.content_length());
    req.body().data = nullptr;
    req.body().more = true;

    http::request_serializer<http::buffer_body> serializer{req};
    http::write_header(stream, serializer);

    const std::uint64_t total = body.content_length();
    std::uint64_t sent = 0;
    std::vector<char> slice(UPLOAD_SLICE_SIZE);
    boost::system::error_code ec;

    // Pull slices from the body until it is exhausted
    while (std::size_t count = body.read(slice.data(), slice.size())) {
      req.body().data = slice.data();
      req.body().size = count;
      req.body().more = true;

      http::write(stream, serializer, ec);
      if (ec == http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        throw boost::system::system_error(ec);
      }

      sent += count;
      notify_progress(progress, sent, total);
    }

    req.body().data = nullptr;
    req.body().size = 0;
    req.body().more = false;
    http::write(stream, serializer, ec);
    if (ec) {
      throw boost::system::system_error(ec);
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    close(stream);

    BOOST_LOG_TRIVIAL(debug) << "HTTP client: POST " << target << " answered " << res.result_int();
    return HttpResponse{res.result_int(), to_std_string(res.reason()), res.body()};
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP client: POST " << target << " failed: " << e.code().message();
    throw ConnectError("Upload to " + server.to_string() + " failed: " + e.code().message());
  }
}

HttpResponse BeastHttpClient::get(const ServerUrl& server, const std::string& target,
                                  std::size_t slice_size, const BodySink& sink) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: GET " << target;

  try {
    boost::asio::io_context io_context;
    beast::tcp_stream stream(io_context);
    connect(stream, server);

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, server.host_header());
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::connection, "close");
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(boost::none);  // Shards can be hundreds of MiB
    http::read_header(stream, buffer, parser);

    HttpResponse result;
    result.status = parser.get().result_int();
    result.reason = to_std_string(parser.get().reason());
    const bool stream_body = result.status == 200;

    std::vector<char> slice(slice_size);
    boost::system::error_code ec;
    while (!parser.is_done()) {
      parser.get().body().data = slice.data();
      parser.get().body().size = slice.size();

      http::read(stream, buffer, parser, ec);
      if (ec == http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        throw boost::system::system_error(ec);
      }

      const std::size_t count = slice.size() - parser.get().body().size;
      if (count == 0) {
        continue;
      }
      if (stream_body) {
        sink(slice.data(), count);
      } else {
        result.body.append(slice.data(), count);
      }
    }
    close(stream);

    BOOST_LOG_TRIVIAL(debug) << "HTTP client: GET " << target << " answered " << result.status;
    return result;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP client: GET " << target << " failed: " << e.code().message();
    throw ConnectError("Download from " + server.to_string() + " failed: " + e.code().message());
  }
}


//==============================================
// CONNECTION HANDLING
//==============================================

void BeastHttpClient::connect(beast::tcp_stream& stream, const ServerUrl& server) {
  tcp::resolver resolver(stream.get_executor());
  auto const results = resolver.resolve(server.host(), std::to_string(server.port()));
  stream.connect(results);
  BOOST_LOG_TRIVIAL(trace) << "HTTP client: Connected to " << server.host_header();
}

void BeastHttpClient::close(beast::tcp_stream& stream) {
  boost::system::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: Socket shutdown reported: " << ec.message();
  }
}

} // namespace upstream::network
