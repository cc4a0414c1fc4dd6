#pragma once

#include <cstddef>
#include <string>

namespace notepress {

constexpr std::size_t kSummaryBudget = 140;
inline const std::string kEllipsis = "…";

// Removes inline and line-leading markdown punctuation: code spans keep their
// text; '*', '_' and '~' go; quote, heading and bullet markers and rule lines
// are dropped line by line.
std::string StripMarkdown(const std::string& text);

// Plain-text teaser from the first paragraph of |body|. Headings and
// blockquote lines never contribute. Truncated to |budget| code points with
// an ellipsis appended when cut.
std::string ExtractSummary(const std::string& body, std::size_t budget = kSummaryBudget);

}  // namespace notepress
