#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>
#include "network/beast_http_client.hpp"
#include "network/multipart_encoder.hpp"
#include "network/transfer_error.hpp"
#include "network/transport.hpp"
#include "test_utils.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

using namespace upstream;
using namespace upstream::network;
using namespace upstream::test;

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Single-threaded HTTP server on 127.0.0.1 with an OS-assigned port.
// Each connection carries one request and is closed after the response.
class LoopbackServer {
public:
  using Handler = std::function<Response(const Request&)>;

  explicit LoopbackServer(Handler handler)
    : acceptor_(io_context_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
    , handler_(std::move(handler)) {
    accept();
    thread_ = std::thread([this]() { io_context_.run(); });
  }

  ~LoopbackServer() {
    io_context_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  std::string url() const {
    return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port());
  }

  std::vector<Request> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

private:
  boost::asio::io_context io_context_;
  tcp::acceptor acceptor_;
  Handler handler_;
  std::thread thread_;
  mutable std::mutex mutex_;
  std::vector<Request> requests_;

  void accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
      if (ec) {
        return;
      }
      serve(socket);
      accept();
    });
  }

  void serve(tcp::socket& socket) {
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);

    boost::system::error_code ec;
    http::read(socket, buffer, parser, ec);
    if (ec) {
      return;
    }

    Request req = parser.release();
    Response res = handler_(req);
    res.version(req.version());
    res.set(http::field::connection, "close");
    res.prepare_payload();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(req);
    }

    http::write(socket, res, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }
};

Response make_response(http::status status, std::string body = "") {
  Response res{status, 11};
  res.body() = std::move(body);
  return res;
}

// Port that nothing listens on
std::uint16_t closed_port() {
  boost::asio::io_context io_context;
  tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const std::uint16_t port = acceptor.local_endpoint().port();
  acceptor.close();
  return port;
}

// File content of a single-part multipart body
std::string multipart_payload(const std::string& body) {
  const auto start = body.find("\r\n\r\n") + 4;
  const auto end = body.rfind("\r\n--");
  return body.substr(start, end - start);
}

} // namespace

class BeastHttpClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  TempDir dir_;
  BeastHttpClient client_;
};

TEST_F(BeastHttpClientTest, ProbeAcceptsAnyStatus) {
  LoopbackServer server([](const Request&) { return make_response(http::status::not_found); });

  EXPECT_TRUE(client_.probe(ServerUrl::parse(server.url()), std::chrono::milliseconds(2000)));

  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method(), http::verb::head);
  EXPECT_EQ(requests[0].target(), "/");
}

TEST_F(BeastHttpClientTest, ProbeClosedPortIsUnreachable) {
  auto url = ServerUrl::parse("http://127.0.0.1:" + std::to_string(closed_port()));
  EXPECT_FALSE(client_.probe(url, std::chrono::milliseconds(500)));
}

TEST_F(BeastHttpClientTest, TransportToClosedPortThrowsConnectError) {
  const std::string url = "http://127.0.0.1:" + std::to_string(closed_port());
  EXPECT_THROW(Transport(url, std::make_unique<BeastHttpClient>(), std::chrono::milliseconds(500)),
               ConnectError);
}

TEST_F(BeastHttpClientTest, PostStreamsBodyAndReportsProgress) {
  const std::string content = make_pattern(200 * 1024);
  write_file(dir_ / "big.bin", content);

  LoopbackServer server([](const Request&) {
    return make_response(http::status::created, R"({"filehash": "abc"})");
  });

  MultipartEncoder encoder(dir_ / "big.bin", 0, content.size(), "big.bin", "b0undary");
  const std::uint64_t total = encoder.content_length();
  std::uint64_t last_sent = 0;
  int calls = 0;

  auto response = client_.post(ServerUrl::parse(server.url()), "/api/upload", encoder,
    [&](std::uint64_t sent, std::uint64_t reported_total) {
      EXPECT_EQ(reported_total, total);
      EXPECT_GE(sent, last_sent);
      last_sent = sent;
      ++calls;
    });

  EXPECT_EQ(response.status, 201u);
  EXPECT_EQ(response.body, R"({"filehash": "abc"})");
  EXPECT_EQ(last_sent, total);
  EXPECT_GT(calls, 1);

  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method(), http::verb::post);
  EXPECT_EQ(requests[0].target(), "/api/upload");
  EXPECT_EQ(requests[0][http::field::content_type], "multipart/form-data; boundary=b0undary");
  EXPECT_EQ(requests[0].body().size(), total);
  EXPECT_EQ(multipart_payload(requests[0].body()), content);
}

TEST_F(BeastHttpClientTest, GetStreams200BodyInSlices) {
  const std::string content = make_pattern(100 * 1000 + 7);
  LoopbackServer server([&content](const Request&) { return make_response(http::status::ok, content); });

  std::string received;
  std::size_t largest_slice = 0;
  auto response = client_.get(ServerUrl::parse(server.url()), "/api/download/abc", 1000,
    [&](const char* data, std::size_t size) {
      received.append(data, size);
      largest_slice = std::max(largest_slice, size);
    });

  EXPECT_EQ(response.status, 200u);
  EXPECT_TRUE(response.body.empty());
  EXPECT_EQ(received, content);
  EXPECT_LE(largest_slice, 1000u);
}

TEST_F(BeastHttpClientTest, GetBuffersErrorBody) {
  LoopbackServer server([](const Request&) { return make_response(http::status::not_found, "missing"); });

  bool sink_called = false;
  auto response = client_.get(ServerUrl::parse(server.url()), "/api/download/abc", 16,
    [&sink_called](const char*, std::size_t) { sink_called = true; });

  EXPECT_EQ(response.status, 404u);
  EXPECT_EQ(response.reason, "Not Found");
  EXPECT_EQ(response.body, "missing");
  EXPECT_FALSE(sink_called);
}

TEST_F(BeastHttpClientTest, RequestsToClosedPortThrowConnectError) {
  auto url = ServerUrl::parse("http://127.0.0.1:" + std::to_string(closed_port()));
  write_file(dir_ / "small.bin", "abc");
  MultipartEncoder encoder(dir_ / "small.bin", 0, 3, "small.bin", "b");

  EXPECT_THROW(client_.post(url, "/api/upload", encoder, nullptr), ConnectError);
  EXPECT_THROW(client_.get(url, "/api/download/abc", 16, [](const char*, std::size_t) {}), ConnectError);
}

TEST_F(BeastHttpClientTest, UploadThenDownloadThroughTransport) {
  std::mutex store_mutex;
  std::map<std::string, std::string> store;

  LoopbackServer server([&](const Request& req) {
    std::lock_guard<std::mutex> lock(store_mutex);
    if (req.method() == http::verb::head) {
      return make_response(http::status::ok);
    }
    if (req.method() == http::verb::post && req.target() == "/api/upload") {
      const std::string hash = "hash" + std::to_string(store.size());
      store[hash] = multipart_payload(req.body());
      return make_response(http::status::created, R"({"filehash": ")" + hash + R"(", "key": "k"})");
    }
    const std::string prefix = "/api/download/";
    std::string target(req.target());
    if (target.rfind(prefix, 0) == 0) {
      std::string hash = target.substr(prefix.size());
      hash = hash.substr(0, hash.find('?'));
      auto it = store.find(hash);
      if (it != store.end()) {
        return make_response(http::status::ok, it->second);
      }
    }
    return make_response(http::status::not_found, "no such shard");
  });

  const std::string content = make_pattern(5000);
  write_file(dir_ / "source.bin", content);

  Transport transport(server.url(), std::make_unique<BeastHttpClient>(), std::chrono::milliseconds(2000));
  std::vector<shard::Shard> shards;
  for (std::uint64_t start = 0; start < content.size(); start += 2048) {
    shards.push_back(transport.upload(dir_ / "source.bin", start, 2048));
  }
  ASSERT_EQ(shards.size(), 3u);
  EXPECT_EQ(shards[2].uri(), "hash2?key=k");

  const auto joined = dir_ / "joined.bin";
  for (const auto& shard : shards) {
    transport.append(shard, joined, 100);
  }
  EXPECT_EQ(read_file(joined), content);

  EXPECT_THROW(transport.append(shard::Shard("unknown"), dir_ / "other.bin"), ResponseError);
  EXPECT_FALSE(std::filesystem::exists(dir_ / "other.bin"));
}
