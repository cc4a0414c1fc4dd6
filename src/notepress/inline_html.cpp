#include "notepress/inline_html.hpp"

#include <cstddef>
#include <utility>

namespace notepress::markdown {
namespace {

struct LinkMatch {
  std::size_t end = 0;  // one past the closing ')'
  std::string label;
  std::string url;
};

// Matches \[([^\]]+)\]\(([^)]+)\) anchored at |start|.
bool MatchLinkAt(std::string_view text, std::size_t start, LinkMatch& match) {
  if (text[start] != '[') {
    return false;
  }
  const auto label_end = text.find(']', start + 1);
  if (label_end == std::string_view::npos || label_end == start + 1) {
    return false;
  }
  if (label_end + 1 >= text.size() || text[label_end + 1] != '(') {
    return false;
  }
  const auto url_start = label_end + 2;
  const auto url_end = text.find(')', url_start);
  if (url_end == std::string_view::npos || url_end == url_start) {
    return false;
  }
  match.label = std::string(text.substr(start + 1, label_end - start - 1));
  match.url = std::string(text.substr(url_start, url_end - url_start));
  match.end = url_end + 1;
  return true;
}

void AppendText(std::vector<InlineSpan>& spans, std::string_view text) {
  if (text.empty()) {
    return;
  }
  if (!spans.empty() && spans.back().kind == InlineSpan::Kind::kText) {
    spans.back().text.append(text);
    return;
  }
  spans.push_back(InlineSpan{InlineSpan::Kind::kText, std::string(text), {}});
}

}  // namespace

std::string EscapeHtml(std::string_view text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (const char ch : text) {
    switch (ch) {
      case '&':
        escaped.append("&amp;");
        break;
      case '<':
        escaped.append("&lt;");
        break;
      case '>':
        escaped.append("&gt;");
        break;
      case '"':
        escaped.append("&quot;");
        break;
      case '\'':
        escaped.append("&#x27;");
        break;
      default:
        escaped.push_back(ch);
        break;
    }
  }
  return escaped;
}

std::vector<InlineSpan> TokenizeInline(std::string_view text) {
  std::vector<InlineSpan> spans;
  std::size_t literal_start = 0;
  std::size_t pos = 0;
  LinkMatch match;
  while (pos < text.size()) {
    if (!MatchLinkAt(text, pos, match)) {
      ++pos;
      continue;
    }
    AppendText(spans, text.substr(literal_start, pos - literal_start));
    spans.push_back(
        InlineSpan{InlineSpan::Kind::kLink, std::move(match.label), std::move(match.url)});
    pos = match.end;
    literal_start = pos;
  }
  AppendText(spans, text.substr(literal_start));
  return spans;
}

std::string RenderInline(std::string_view text) {
  std::string html;
  html.reserve(text.size());
  for (const auto& span : TokenizeInline(text)) {
    if (span.kind == InlineSpan::Kind::kText) {
      html.append(EscapeHtml(span.text));
      continue;
    }
    html.append("<a href=\"");
    html.append(EscapeHtml(span.url));
    html.append("\">");
    html.append(EscapeHtml(span.text));
    html.append("</a>");
  }
  return html;
}

}  // namespace notepress::markdown
