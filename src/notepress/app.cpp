#include "notepress/app.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"
#include "notepress/engine.hpp"
#include "notepress/inline_html.hpp"
#include "notepress/logging.hpp"
#include "notepress/note_json.hpp"
#include "notepress/renderer.hpp"
#include "notepress/slug.hpp"
#include "platform/http_server.hpp"

namespace notepress {
namespace {

using logging::LogInfo;
using logging::LogWarn;
using nlohmann::json;

struct RouteInfo {
  std::string_view method;
  std::string_view path;
  std::string_view description;
};

const std::vector<RouteInfo> kCommandCatalog = {
    {"GET", "/api/commands", "List every API command exposed by the server."},
    {"GET", "/api/health", "Report server readiness, uptime, version and renderer."},
    {"POST", "/api/render",
     "Convert one markdown document. Body: {\"text\", \"source\", \"sequence\"}."},
    {"POST", "/api/slugify", "Compute a slug. Body: {\"title\", \"fallback\", \"sequence\"}."},
    {"POST", "/api/inline", "Escape text and render [label](url) links. Body: {\"text\"}."},
};

const auto kServerStart = std::chrono::steady_clock::now();

void ApplyCors(platform::HttpResponse& response) {
  response.headers["Access-Control-Allow-Origin"] = "*";
  response.headers["Access-Control-Allow-Methods"] = "GET,POST,OPTIONS";
  response.headers["Access-Control-Allow-Headers"] = "Content-Type";
}

platform::HttpResponse JsonResponse(const json& body, int status = 200) {
  platform::HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body.dump();
  ApplyCors(response);
  return response;
}

platform::HttpResponse ErrorResponse(const std::string& message, int status = 400) {
  return JsonResponse(json{{"error", message}}, status);
}

json ParseObjectPayload(const platform::HttpRequest& request) {
  auto payload = json::parse(request.body, nullptr, false);
  if (payload.is_discarded()) {
    throw std::invalid_argument("Invalid JSON payload.");
  }
  if (!payload.is_object()) {
    throw std::invalid_argument("Payload must be a JSON object.");
  }
  return payload;
}

std::string RequireString(const json& payload, const char* field) {
  const auto it = payload.find(field);
  if (it == payload.end() || !it->is_string()) {
    throw std::invalid_argument(std::string{"Field '"} + field +
                                "' is required and must be a string.");
  }
  return it->get<std::string>();
}

std::string OptionalString(const json& payload, const char* field) {
  const auto it = payload.find(field);
  if (it == payload.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string{"Field '"} + field +
                                "' must be a string when provided.");
  }
  return it->get<std::string>();
}

int OptionalSequence(const json& payload) {
  const auto it = payload.find("sequence");
  if (it == payload.end() || it->is_null()) {
    return 1;
  }
  if (!it->is_number_integer()) {
    throw std::invalid_argument("Field 'sequence' must be an integer when provided.");
  }
  if (it->is_number_unsigned()) {
    if (it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      throw std::invalid_argument("Field 'sequence' is out of range.");
    }
    return static_cast<int>(it->get<std::uint64_t>());
  }
  const auto value = it->get<std::int64_t>();
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("Field 'sequence' is out of range.");
  }
  return static_cast<int>(value);
}

platform::HttpResponse HandleCorsPreflight(const platform::HttpRequest&) {
  platform::HttpResponse response;
  response.status = 204;
  response.content_type = "text/plain";
  ApplyCors(response);
  return response;
}

}  // namespace

void ConfigureServer(platform::HttpServer& server, const markdown::Renderer& renderer) {
  auto handle_commands = [](const platform::HttpRequest&) {
    json commands = json::array();
    for (const auto& cmd : kCommandCatalog) {
      commands.push_back(
          {{"method", cmd.method}, {"path", cmd.path}, {"description", cmd.description}});
    }
    LogInfo("GET /api/commands");
    return JsonResponse(json{{"commands", commands}});
  };

  auto handle_health = [&renderer](const platform::HttpRequest&) {
    const auto now = std::chrono::steady_clock::now();
    const auto uptime_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - kServerStart).count();
    json payload{{"status", "ok"},
                 {"uptime_ms", uptime_ms},
                 {"version", kVersion},
                 {"renderer", renderer.Name()}};
    LogInfo("GET /api/health");
    return JsonResponse(payload);
  };

  auto handle_render = [&renderer](const platform::HttpRequest& request) {
    try {
      const auto payload = ParseObjectPayload(request);
      SourceDocument document;
      document.text = RequireString(payload, "text");
      document.stem = OptionalString(payload, "source");
      document.sequence = OptionalSequence(payload);
      const auto note = ConvertDocument(document, renderer);
      LogInfo("POST /api/render source=" + document.stem + " slug=" + note.slug);
      return JsonResponse(RenderedNoteToJson(note));
    } catch (const std::invalid_argument& ex) {
      return ErrorResponse(ex.what(), 400);
    }
  };

  auto handle_slugify = [](const platform::HttpRequest& request) {
    try {
      const auto payload = ParseObjectPayload(request);
      const auto slug = Slugify(OptionalString(payload, "title"),
                                OptionalString(payload, "fallback"), OptionalSequence(payload));
      LogInfo("POST /api/slugify slug=" + slug);
      return JsonResponse(json{{"slug", slug}});
    } catch (const std::invalid_argument& ex) {
      return ErrorResponse(ex.what(), 400);
    }
  };

  auto handle_inline = [](const platform::HttpRequest& request) {
    try {
      const auto payload = ParseObjectPayload(request);
      const auto html = markdown::RenderInline(RequireString(payload, "text"));
      LogInfo("POST /api/inline bytes=" + std::to_string(request.body.size()));
      return JsonResponse(json{{"html", html}});
    } catch (const std::invalid_argument& ex) {
      return ErrorResponse(ex.what(), 400);
    }
  };

  server.AddHandler(platform::HttpMethod::kGet, "/api/commands", handle_commands);
  server.AddHandler(platform::HttpMethod::kGet, "/api/health", handle_health);
  server.AddHandler(platform::HttpMethod::kPost, "/api/render", handle_render);
  server.AddHandler(platform::HttpMethod::kPost, "/api/slugify", handle_slugify);
  server.AddHandler(platform::HttpMethod::kPost, "/api/inline", handle_inline);

  for (const auto& cmd : kCommandCatalog) {
    server.AddHandler(platform::HttpMethod::kOptions, std::string(cmd.path), HandleCorsPreflight);
  }
}

ServerConfig LoadServerConfig() {
  ServerConfig config;
  if (const char* host = std::getenv("NOTEPRESS_HOST")) {
    config.host = host;
  }
  if (const char* port = std::getenv("NOTEPRESS_PORT")) {
    try {
      const int parsed = std::stoi(port);
      if (parsed > 0 && parsed <= 65535) {
        config.port = parsed;
      } else {
        LogWarn("NOTEPRESS_PORT is outside the valid range, falling back to default 8080");
      }
    } catch (const std::exception& ex) {
      LogWarn(std::string{"Failed to parse NOTEPRESS_PORT: "} + ex.what());
    }
  }
  if (const char* max_body = std::getenv("NOTEPRESS_MAX_BODY")) {
    try {
      const auto parsed = std::stoull(max_body);
      if (parsed > 0) {
        config.max_body_bytes = static_cast<std::size_t>(parsed);
      }
    } catch (const std::exception& ex) {
      LogWarn(std::string{"Failed to parse NOTEPRESS_MAX_BODY: "} + ex.what());
    }
  }
  config.render = LoadRenderConfig();
  return config;
}

}  // namespace notepress
