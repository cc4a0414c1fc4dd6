#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace notepress::markdown {

struct InlineSpan {
  enum class Kind { kText, kLink };

  Kind kind = Kind::kText;
  std::string text;  // literal text, or the link label
  std::string url;
};

// Escapes &, <, >, " and ' for use in element content and quoted attributes.
// Applying it twice escapes the ampersands of the first pass again.
std::string EscapeHtml(std::string_view text);

// Splits |text| into literal spans and [label](url) links. Links are matched
// leftmost-first and never overlap; neither part may be empty.
std::vector<InlineSpan> TokenizeInline(std::string_view text);

// Renders |text| with every recognized link turned into an anchor and all
// remaining characters escaped.
std::string RenderInline(std::string_view text);

}  // namespace notepress::markdown
