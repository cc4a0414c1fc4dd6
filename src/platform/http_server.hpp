#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace platform {

enum class HttpMethod { kGet = 0, kPost, kOptions };

struct HttpRequest {
  std::string method;
  std::string path;
  std::string body;
  std::map<std::string, std::string> headers;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::map<std::string, std::string> headers;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

// Thin wrapper over httplib::Server. Handler exceptions become 500 responses
// with a JSON {"error"} body; unknown routes get a JSON 404.
class HttpServer {
 public:
  HttpServer();
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void AddHandler(HttpMethod method, const std::string& path, HttpHandler handler);
  // Requests with a larger body are rejected with 413 before any handler runs.
  void SetPayloadLimit(std::size_t max_bytes);
  // Blocks until Stop() is called from another thread.
  void Start(const std::string& host, int port);
  void Stop();
  bool IsRunning() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace platform
