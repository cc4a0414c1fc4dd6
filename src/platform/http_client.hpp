#pragma once

#include <functional>
#include <map>
#include <string>

namespace httplib {
class Client;
class Result;
}  // namespace httplib

namespace platform {

struct HttpClientResponse {
  int status = 0;
  std::string content_type;
  std::string body;
  std::map<std::string, std::string> headers;
};

// Blocking client for a plain http:// endpoint. Transport failures throw
// std::runtime_error; any HTTP status, including 4xx and 5xx, is returned.
class HttpClient {
 public:
  explicit HttpClient(const std::string& base_url, int timeout_seconds = 5);

  HttpClientResponse Get(const std::string& path) const;
  HttpClientResponse Post(const std::string& path, const std::string& body,
                          const std::string& content_type = "application/json") const;
  // Sends a CORS preflight for |path|.
  HttpClientResponse Options(const std::string& path) const;

  const std::string& host() const { return host_; }
  int port() const { return port_; }

 private:
  using Call = std::function<httplib::Result(httplib::Client&)>;

  HttpClientResponse Send(const std::string& method, const std::string& path,
                          const Call& call) const;

  std::string host_;
  int port_ = 80;
  int timeout_seconds_;
};

}  // namespace platform
