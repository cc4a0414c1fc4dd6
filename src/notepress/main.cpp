#include <exception>
#include <string>

#include "notepress/app.hpp"
#include "notepress/logging.hpp"
#include "notepress/renderer.hpp"
#include "platform/http_server.hpp"

int main() {
  notepress::logging::InitializeFromEnvironment();
  const auto config = notepress::LoadServerConfig();

  const auto renderer =
      notepress::markdown::MakeRenderer(config.render.renderer, config.render.block_options);
  notepress::logging::LogInfo("Rendering with the " + renderer->Name() + " renderer" +
                              (config.render.block_options.link_blockquotes
                                   ? " (links in blockquotes enabled)"
                                   : ""));

  platform::HttpServer server;
  server.SetPayloadLimit(config.max_body_bytes);
  notepress::ConfigureServer(server, *renderer);

  notepress::logging::LogInfo("Starting notepress render server on " + config.host + ":" +
                              std::to_string(config.port));

  try {
    server.Start(config.host, config.port);
  } catch (const std::exception& ex) {
    notepress::logging::LogError(std::string{"Server terminated with error: "} + ex.what());
    return 1;
  }

  notepress::logging::LogInfo("Server shut down gracefully.");
  return 0;
}
