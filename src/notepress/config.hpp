#pragma once

#include <string>

#include "notepress/block_parser.hpp"
#include "notepress/renderer.hpp"

namespace notepress {

struct RenderConfig {
  markdown::RendererKind renderer = markdown::RendererKind::kSimple;
  markdown::BlockOptions block_options;
};

std::string GetEnv(const char* key, const std::string& fallback);
bool ParseFlag(const std::string& value, bool fallback);

// NOTEPRESS_RENDERER and NOTEPRESS_LINK_BLOCKQUOTES.
RenderConfig LoadRenderConfig();

}  // namespace notepress
