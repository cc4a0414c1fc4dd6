#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "nlohmann/json.hpp"
#include "notepress/app.hpp"
#include "notepress/renderer.hpp"
#include "platform/http_client.hpp"
#include "platform/http_server.hpp"

namespace {

using nlohmann::json;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

class TestServer {
 public:
  TestServer() {
    server_.SetPayloadLimit(4096);
    notepress::ConfigureServer(server_, renderer_);
  }

  void Start(const std::string& host, int port) {
    host_ = host;
    port_ = port;
    worker_ = std::thread([this] {
      try {
        server_.Start(host_, port_);
      } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = ex.what();
      }
    });
    for (int attempt = 0; attempt < 40 && !server_.IsRunning(); ++attempt) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    Assert(server_.IsRunning(), "render server did not come up");
  }

  void Stop() {
    server_.Stop();
    if (worker_.joinable()) {
      worker_.join();
    }
    if (!error_.empty()) {
      throw std::runtime_error(error_);
    }
  }

 private:
  notepress::markdown::SimpleRenderer renderer_;
  platform::HttpServer server_;
  std::thread worker_;
  std::string host_;
  int port_ = 0;
  std::string error_;
  std::mutex mutex_;
};

json ParseBody(const platform::HttpClientResponse& response) {
  auto parsed = json::parse(response.body, nullptr, false);
  Assert(!parsed.is_discarded(), "Response body must be JSON: " + response.body);
  return parsed;
}

void TestHealthAndCatalog(const platform::HttpClient& client) {
  const auto health = client.Get("/api/health");
  Assert(health.status == 200, "health status must be 200");
  const auto health_json = ParseBody(health);
  Assert(health_json.value("status", "") == "ok", "health status field");
  Assert(health_json.value("renderer", "") == "simple", "health names the renderer");
  Assert(health_json.value("version", "") == notepress::kVersion, "health version");

  const auto commands = ParseBody(client.Get("/api/commands"));
  Assert(commands.at("commands").is_array(), "commands must be an array");
  Assert(commands.at("commands").size() == 5, "unexpected number of commands");
}

void TestRender(const platform::HttpClient& client) {
  const json request{{"text", "# Hello\n> tags: a, b\n\nBody with [x](javascript:alert(1)).\n"},
                     {"source", "hello"},
                     {"sequence", 3}};
  const auto response = client.Post("/api/render", request.dump());
  Assert(response.status == 200, "render status must be 200");
  Assert(response.headers.count("Access-Control-Allow-Origin") == 1, "CORS header on render");
  const auto note = ParseBody(response);
  Assert(note.value("slug", "") == "hello", "render slug");
  Assert(note.value("title", "") == "Hello", "render title");
  Assert(note.at("tags") == json::array({"a", "b"}), "render tags");
  Assert(note.value("summary", "") == "Body with [x](javascript:alert(1)).", "render summary");
  Assert(note.value("sort_key", "") == "oldest", "undated sort key");
  const auto html = note.value("html", "");
  Assert(html.find("<h1>Hello</h1>") != std::string::npos, "render heading");
  Assert(html.find("tags:") == std::string::npos, "annotation removed from html");

  const auto missing = client.Post("/api/render", json{{"source", "x"}}.dump());
  Assert(missing.status == 400, "missing text must be rejected");
  Assert(ParseBody(missing).contains("error"), "error body on missing text");
}

void TestSlugifyAndInline(const platform::HttpClient& client) {
  const auto slug = ParseBody(
      client.Post("/api/slugify", json{{"title", "Café Déjà Vu"}, {"sequence", 2}}.dump()));
  Assert(slug.value("slug", "") == "cafe-deja-vu", "slugify transliterates");

  const auto numbered =
      ParseBody(client.Post("/api/slugify", json{{"title", "???"}, {"sequence", 7}}.dump()));
  Assert(numbered.value("slug", "") == "note-007", "slugify sequence fallback");

  const auto inline_html =
      ParseBody(client.Post("/api/inline", json{{"text", "<b> [a](b?c=1&d=2)"}}.dump()));
  Assert(inline_html.value("html", "") == "&lt;b&gt; <a href=\"b?c=1&amp;d=2\">a</a>",
         "inline escapes and links");

  const auto bad_json = client.Post("/api/inline", "{not json");
  Assert(bad_json.status == 400, "invalid JSON must be rejected");

  const auto not_object = client.Post("/api/slugify", "[1, 2]");
  Assert(not_object.status == 400, "non-object payload must be rejected");

  const auto bad_sequence =
      client.Post("/api/slugify", json{{"title", "x"}, {"sequence", "seven"}}.dump());
  Assert(bad_sequence.status == 400, "non-integer sequence must be rejected");

  for (const char* sequence : {"-2147483649", "2147483648", "18446744073709551615"}) {
    const auto out_of_range = client.Post(
        "/api/slugify", std::string{R"({"title": "???", "sequence": )"} + sequence + "}");
    Assert(out_of_range.status == 400,
           std::string{"sequence "} + sequence + " must be rejected as out of range");
  }
  const auto lowest = ParseBody(client.Post(
      "/api/slugify", R"({"title": "???", "sequence": -2147483648})"));
  Assert(lowest.value("slug", "") == "note-2147483648", "lowest int sequence is accepted");
}

void TestPreflight(const platform::HttpClient& client) {
  const auto preflight = client.Options("/api/render");
  Assert(preflight.status == 204, "preflight status must be 204");
  Assert(preflight.headers.count("Access-Control-Allow-Methods") == 1,
         "preflight advertises methods");
}

void RunTests() {
  constexpr int kTestPort = 18889;
  TestServer server;
  server.Start("127.0.0.1", kTestPort);

  const platform::HttpClient client("http://127.0.0.1:" + std::to_string(kTestPort));
  TestHealthAndCatalog(client);
  TestRender(client);
  TestSlugifyAndInline(client);
  TestPreflight(client);

  server.Stop();
}

}  // namespace

int main() {
  try {
    RunTests();
  } catch (const std::exception& ex) {
    std::cerr << "Render server test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
