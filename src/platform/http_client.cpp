#include "platform/http_client.hpp"

#include <stdexcept>
#include <string>

#include "httplib.h"
#include "notepress/text.hpp"

namespace platform {
namespace {

constexpr const char* kHttpScheme = "http://";

// Splits "http://host[:port][/...]" into host and port. Any path component is
// ignored; request paths are always absolute.
void SplitAuthority(const std::string& base_url, std::string& host, int& port) {
  const auto url = notepress::text::Trim(base_url);
  if (!notepress::text::StartsWith(url, kHttpScheme)) {
    throw std::invalid_argument("Render client needs an http:// base URL, got '" + url + "'");
  }
  auto authority = url.substr(std::char_traits<char>::length(kHttpScheme));
  authority = authority.substr(0, authority.find('/'));

  const auto colon = authority.rfind(':');
  host = authority.substr(0, colon);
  if (host.empty()) {
    throw std::invalid_argument("Base URL has no host: '" + url + "'");
  }
  if (colon == std::string::npos) {
    port = 80;
    return;
  }
  try {
    port = std::stoi(authority.substr(colon + 1));
  } catch (const std::exception&) {
    throw std::invalid_argument("Base URL has a malformed port: '" + url + "'");
  }
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Base URL port out of range: '" + url + "'");
  }
}

}  // namespace

HttpClient::HttpClient(const std::string& base_url, int timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
  SplitAuthority(base_url, host_, port_);
}

HttpClientResponse HttpClient::Get(const std::string& path) const {
  return Send("GET", path, [&path](httplib::Client& client) { return client.Get(path); });
}

HttpClientResponse HttpClient::Post(const std::string& path, const std::string& body,
                                    const std::string& content_type) const {
  return Send("POST", path, [&](httplib::Client& client) {
    return client.Post(path, body, content_type);
  });
}

HttpClientResponse HttpClient::Options(const std::string& path) const {
  return Send("OPTIONS", path, [&path](httplib::Client& client) { return client.Options(path); });
}

HttpClientResponse HttpClient::Send(const std::string& method, const std::string& path,
                                    const Call& call) const {
  httplib::Client client(host_, port_);
  client.set_connection_timeout(timeout_seconds_);
  client.set_read_timeout(timeout_seconds_);
  client.set_write_timeout(timeout_seconds_);

  const auto result = call(client);
  if (!result) {
    throw std::runtime_error(method + " " + host_ + ":" + std::to_string(port_) + path +
                             " failed: " + httplib::to_string(result.error()));
  }

  HttpClientResponse response;
  response.status = result->status;
  response.content_type = notepress::text::Trim(result->get_header_value("Content-Type"));
  response.body = result->body;
  for (const auto& [name, value] : result->headers) {
    response.headers[name] = value;
  }
  return response;
}

}  // namespace platform
