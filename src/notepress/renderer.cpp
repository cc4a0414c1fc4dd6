#include "notepress/renderer.hpp"

#include "notepress/logging.hpp"
#include "notepress/text.hpp"

#if defined(NOTEPRESS_HAVE_CMARK)
#include "notepress/cmark_renderer.hpp"
#endif

namespace notepress::markdown {

SimpleRenderer::SimpleRenderer(BlockOptions options) : options_(options) {}

std::string SimpleRenderer::Name() const { return "simple"; }

std::string SimpleRenderer::Render(const std::string& body) const {
  return RenderBlocks(body, options_);
}

RendererKind ParseRendererKind(const std::string& value) {
  const auto lowered = text::ToLower(text::Trim(value));
  if (lowered == "cmark" || lowered == "commonmark") {
    return RendererKind::kCmark;
  }
  if (!lowered.empty() && lowered != "simple" && lowered != "builtin") {
    logging::LogWarn("Unknown renderer '" + value + "', using the built-in renderer");
  }
  return RendererKind::kSimple;
}

std::string RendererKindName(RendererKind kind) {
  switch (kind) {
    case RendererKind::kSimple:
      return "simple";
    case RendererKind::kCmark:
      return "cmark";
  }
  return "simple";
}

bool IsRendererAvailable(RendererKind kind) {
  if (kind == RendererKind::kCmark) {
#if defined(NOTEPRESS_HAVE_CMARK)
    return true;
#else
    return false;
#endif
  }
  return true;
}

std::unique_ptr<Renderer> MakeRenderer(RendererKind kind, const BlockOptions& options) {
#if defined(NOTEPRESS_HAVE_CMARK)
  if (kind == RendererKind::kCmark) {
    logging::LogDebug("Using the cmark renderer");
    return std::make_unique<CmarkRenderer>();
  }
#else
  if (kind == RendererKind::kCmark) {
    logging::LogWarn("cmark renderer requested but not built in, using the built-in renderer");
  }
#endif
  logging::LogDebug("Using the built-in renderer");
  return std::make_unique<SimpleRenderer>(options);
}

}  // namespace notepress::markdown
