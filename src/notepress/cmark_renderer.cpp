#include "notepress/cmark_renderer.hpp"

#include <cstdlib>
#include <memory>

#include <cmark.h>

namespace notepress::markdown {

std::string CmarkRenderer::Name() const { return "cmark"; }

std::string CmarkRenderer::Render(const std::string& body) const {
  std::unique_ptr<char, decltype(&std::free)> html(
      cmark_markdown_to_html(body.c_str(), body.size(), CMARK_OPT_SAFE), &std::free);
  if (!html) {
    return {};
  }
  std::string rendered(html.get());
  while (!rendered.empty() && rendered.back() == '\n') {
    rendered.pop_back();
  }
  return rendered;
}

}  // namespace notepress::markdown
