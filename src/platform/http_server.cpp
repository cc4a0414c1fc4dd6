#include "platform/http_server.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "notepress/logging.hpp"

namespace platform {
namespace {

namespace logging = notepress::logging;

void WriteJsonError(httplib::Response& res, int status, const std::string& message) {
  res.status = status;
  res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
}

HttpResponse Dispatch(const HttpHandler& handler, const httplib::Request& req) {
  HttpRequest request{req.method, req.path, req.body, {}};
  for (const auto& [name, value] : req.headers) {
    request.headers.emplace(name, value);
  }
  return handler(request);
}

void Apply(const HttpResponse& response, httplib::Response& res) {
  for (const auto& [name, value] : response.headers) {
    res.set_header(name, value);
  }
  res.status = response.status;
  res.set_content(response.body,
                  response.content_type.empty() ? "text/plain" : response.content_type);
}

}  // namespace

class HttpServer::Impl {
 public:
  Impl() {
    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
      if (logging::IsDebugEnabled()) {
        logging::LogDebug(req.method + " " + req.path + " -> " + std::to_string(res.status));
      }
    });
    server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
      if (res.status == 404 && res.body.empty()) {
        WriteJsonError(res, 404, "No route for " + req.method + " " + req.path);
      }
    });
  }

  httplib::Server::Handler Wrap(HttpHandler handler) const {
    return [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
      try {
        Apply(Dispatch(handler, req), res);
      } catch (const std::exception& ex) {
        logging::LogError(req.method + " " + req.path + " failed: " + ex.what());
        WriteJsonError(res, 500, ex.what());
      }
    };
  }

  httplib::Server server;
  mutable std::mutex mutex;
  bool running = false;
};

HttpServer::HttpServer() : impl_(std::make_unique<Impl>()) {}

HttpServer::~HttpServer() = default;

void HttpServer::AddHandler(HttpMethod method, const std::string& path, HttpHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Empty handler for " + path);
  }
  auto wrapped = impl_->Wrap(std::move(handler));
  switch (method) {
    case HttpMethod::kGet:
      impl_->server.Get(path, std::move(wrapped));
      return;
    case HttpMethod::kPost:
      impl_->server.Post(path, std::move(wrapped));
      return;
    case HttpMethod::kOptions:
      impl_->server.Options(path, std::move(wrapped));
      return;
  }
  throw std::invalid_argument("Unsupported HTTP method for " + path);
}

void HttpServer::SetPayloadLimit(std::size_t max_bytes) {
  impl_->server.set_payload_max_length(max_bytes);
}

void HttpServer::Start(const std::string& host, int port) {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->running) {
      throw std::runtime_error("Render server already running");
    }
    impl_->running = true;
  }

  const bool clean_exit = impl_->server.listen(host, port);

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->running = false;
  }
  if (!clean_exit) {
    throw std::runtime_error("Could not listen on " + host + ":" + std::to_string(port));
  }
}

void HttpServer::Stop() { impl_->server.stop(); }

bool HttpServer::IsRunning() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->running && impl_->server.is_running();
}

}  // namespace platform
