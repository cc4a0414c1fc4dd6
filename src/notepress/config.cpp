#include "notepress/config.hpp"

#include <cstdlib>

#include "notepress/logging.hpp"
#include "notepress/text.hpp"

namespace notepress {

std::string GetEnv(const char* key, const std::string& fallback) {
  if (const char* value = std::getenv(key)) {
    return value;
  }
  return fallback;
}

bool ParseFlag(const std::string& value, bool fallback) {
  const auto lowered = text::ToLower(text::Trim(value));
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  if (!lowered.empty()) {
    logging::LogWarn("Ignoring unrecognized flag value '" + value + "'");
  }
  return fallback;
}

RenderConfig LoadRenderConfig() {
  RenderConfig config;
  if (const char* renderer = std::getenv("NOTEPRESS_RENDERER")) {
    config.renderer = markdown::ParseRendererKind(renderer);
  }
  if (const char* link_quotes = std::getenv("NOTEPRESS_LINK_BLOCKQUOTES")) {
    config.block_options.link_blockquotes = ParseFlag(link_quotes, false);
  }
  return config;
}

}  // namespace notepress
