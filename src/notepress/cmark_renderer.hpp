#pragma once

#include <string>

#include "notepress/renderer.hpp"

namespace notepress::markdown {

// Full CommonMark rendering through libcmark. Raw HTML and unsafe link
// schemes are suppressed (CMARK_OPT_SAFE).
class CmarkRenderer : public Renderer {
 public:
  std::string Name() const override;
  std::string Render(const std::string& body) const override;
};

}  // namespace notepress::markdown
