#pragma once

#include <cstddef>
#include <string>

#include "notepress/config.hpp"

namespace platform {
class HttpServer;
}  // namespace platform

namespace notepress {

namespace markdown {
class Renderer;
}  // namespace markdown

struct ServerConfig {
  std::string host = "127.0.0.1";
  int port = 8080;
  std::size_t max_body_bytes = 1024 * 1024;
  RenderConfig render;
};

inline const std::string kVersion = "0.3.0";

void ConfigureServer(platform::HttpServer& server, const markdown::Renderer& renderer);
ServerConfig LoadServerConfig();

}  // namespace notepress
