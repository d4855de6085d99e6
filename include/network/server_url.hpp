#ifndef UPSTREAM_NETWORK_SERVER_URL_HPP
#define UPSTREAM_NETWORK_SERVER_URL_HPP

#include <cstdint>
#include <string>

namespace upstream::network {

// Base URL of the storage API: http://host[:port][/base]
class ServerUrl {
public:
  static constexpr std::uint16_t DEFAULT_PORT = 80;

  // Throws ConnectError for unsupported schemes or a missing host
  static ServerUrl parse(const std::string& url);

  const std::string& host() const { return host_; }
  std::uint16_t port() const { return port_; }
  const std::string& base_path() const { return base_path_; }

  // Value for the Host header, port omitted when it is the default
  std::string host_header() const;
  // base path joined with an API path starting with '/'
  std::string target(const std::string& api_path) const;
  // Request target for the connectivity probe
  std::string root_target() const;
  std::string to_string() const;

private:
  ServerUrl(std::string host, std::uint16_t port, std::string base_path);

  std::string host_;
  std::uint16_t port_;
  std::string base_path_;
};

} // namespace upstream::network

#endif // UPSTREAM_NETWORK_SERVER_URL_HPP
