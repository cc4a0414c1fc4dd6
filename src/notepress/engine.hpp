#pragma once

#include <string>

#include "notepress/note.hpp"
#include "notepress/renderer.hpp"

namespace notepress {

struct SourceDocument {
  std::string text;
  // File name without extension; fallback title and slug seed.
  std::string stem;
  // 1-based position in the build, used only by the slug fallback chain.
  int sequence = 0;
};

// Converts one document: metadata record, slug and HTML fragment. Total for
// any input text.
RenderedNote ConvertDocument(const SourceDocument& document, const markdown::Renderer& renderer);

}  // namespace notepress
