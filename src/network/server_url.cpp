#include "network/server_url.hpp"
#include "network/transfer_error.hpp"
#include <algorithm>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace upstream::network {

ServerUrl::ServerUrl(std::string host, std::uint16_t port, std::string base_path)
  : host_(std::move(host))
  , port_(port)
  , base_path_(std::move(base_path)) {}

ServerUrl ServerUrl::parse(const std::string& url) {
  std::string rest = url;

  auto scheme_end = rest.find("://");
  if (scheme_end != std::string::npos) {
    std::string scheme = rest.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http") {
      BOOST_LOG_TRIVIAL(error) << "Server URL: Unsupported scheme '" << scheme << "' in " << url;
      throw ConnectError("Unsupported server URL: " + url);
    }
    rest = rest.substr(scheme_end + 3);
  }

  std::string authority = rest;
  std::string base_path;
  auto path_start = rest.find('/');
  if (path_start != std::string::npos) {
    authority = rest.substr(0, path_start);
    base_path = rest.substr(path_start);
  }

  // Drop trailing slashes so "{base}/api/..." never doubles up
  while (!base_path.empty() && base_path.back() == '/') {
    base_path.pop_back();
  }

  std::string host = authority;
  std::uint16_t port = DEFAULT_PORT;
  auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    host = authority.substr(0, colon);
    const std::string port_str = authority.substr(colon + 1);
    try {
      std::size_t consumed = 0;
      unsigned long value = std::stoul(port_str, &consumed);
      if (consumed != port_str.size() || value == 0 || value > 65535) {
        throw std::out_of_range(port_str);
      }
      port = static_cast<std::uint16_t>(value);
    } catch (const std::logic_error&) {
      BOOST_LOG_TRIVIAL(error) << "Server URL: Invalid port '" << port_str << "' in " << url;
      throw ConnectError("Unsupported server URL: " + url);
    }
  }

  if (host.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Server URL: Missing host in " << url;
    throw ConnectError("Unsupported server URL: " + url);
  }

  return ServerUrl(host, port, base_path);
}

std::string ServerUrl::host_header() const {
  if (port_ == DEFAULT_PORT) {
    return host_;
  }
  return host_ + ":" + std::to_string(port_);
}

std::string ServerUrl::target(const std::string& api_path) const {
  return base_path_ + api_path;
}

std::string ServerUrl::root_target() const {
  return base_path_.empty() ? "/" : base_path_;
}

std::string ServerUrl::to_string() const {
  return "http://" + host_header() + base_path_;
}

} // namespace upstream::network
