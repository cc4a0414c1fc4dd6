#include "notepress/summary.hpp"

#include <cctype>
#include <string_view>
#include <vector>

#include "notepress/block_parser.hpp"
#include "notepress/text.hpp"

namespace notepress {
namespace {

using text::Trim;

bool IsSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

// `code` -> code; unmatched backticks stay.
std::string UnwrapCodeSpans(const std::string& text) {
  std::string out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto open = text.find('`', pos);
    if (open == std::string::npos) {
      break;
    }
    const auto close = text.find('`', open + 1);
    if (close == std::string::npos) {
      break;
    }
    if (close == open + 1) {
      out.append(text, pos, open + 1 - pos);
      pos = open + 1;
      continue;
    }
    out.append(text, pos, open - pos);
    out.append(text, open + 1, close - open - 1);
    pos = close + 1;
  }
  out.append(text, pos, std::string::npos);
  return out;
}

std::string StripLineMarkers(std::string line) {
  if (!line.empty() && line.front() == '>') {
    line.erase(0, 1);
    if (!line.empty() && IsSpace(line.front())) {
      line.erase(0, 1);
    }
  }

  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  if (hashes >= 1 && hashes <= 6 && hashes < line.size() && IsSpace(line[hashes])) {
    auto rest = hashes;
    while (rest < line.size() && IsSpace(line[rest])) {
      ++rest;
    }
    line.erase(0, rest);
  }

  if (line.size() > 1 && (line[0] == '-' || line[0] == '+') && IsSpace(line[1])) {
    auto rest = std::size_t{1};
    while (rest < line.size() && IsSpace(line[rest])) {
      ++rest;
    }
    line.erase(0, rest);
  }

  if (markdown::IsHorizontalRule(line)) {
    return {};
  }
  return line;
}

}  // namespace

std::string StripMarkdown(const std::string& text) {
  std::string unwrapped = UnwrapCodeSpans(text);
  std::string plain;
  plain.reserve(unwrapped.size());
  for (const char ch : unwrapped) {
    if (ch != '*' && ch != '_' && ch != '~') {
      plain.push_back(ch);
    }
  }

  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const auto end = plain.find('\n', start);
    lines.push_back(StripLineMarkers(plain.substr(start, end - start)));
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return text::JoinLines(lines);
}

std::string ExtractSummary(const std::string& body, std::size_t budget) {
  std::vector<std::string> paragraph;
  for (const auto& line : text::SplitLines(body)) {
    const auto stripped = Trim(line);
    const bool skipped = stripped.empty() || stripped.front() == '>' || stripped.front() == '#';
    if (skipped) {
      if (!paragraph.empty()) {
        break;
      }
      continue;
    }
    paragraph.push_back(line);
  }

  std::string plain = Trim(StripMarkdown(Trim(text::JoinLines(paragraph))));
  for (auto& ch : plain) {
    if (ch == '\n') {
      ch = ' ';
    }
  }
  if (text::Utf8Length(plain) > budget) {
    return text::Utf8Prefix(plain, budget) + kEllipsis;
  }
  return plain;
}

}  // namespace notepress
