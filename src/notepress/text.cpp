#include "notepress/text.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

bool IsSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool IsContinuationByte(char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0u) == 0x80u;
}

constexpr std::array<std::string_view, 3> kListDelimiters = {",", "\xEF\xBC\x8C" /* ， */,
                                                             "\xE3\x80\x81" /* 、 */};

}  // namespace

namespace notepress::text {

std::string Trim(std::string_view value) {
  std::size_t start = 0;
  std::size_t end = value.size();
  while (start < value.size() && IsSpace(value[start])) {
    ++start;
  }
  while (end > start && IsSpace(value[end - 1])) {
    --end;
  }
  return std::string(value.substr(start, end - start));
}

std::string TrimRight(std::string_view value) {
  std::size_t end = value.size();
  while (end > 0 && IsSpace(value[end - 1])) {
    --end;
  }
  return std::string(value.substr(0, end));
}

std::string TrimLeft(std::string_view value) {
  std::size_t start = 0;
  while (start < value.size() && IsSpace(value[start])) {
    ++start;
  }
  return std::string(value.substr(start));
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool IsBlank(std::string_view value) {
  return std::all_of(value.begin(), value.end(), IsSpace);
}

std::vector<std::string> SplitLines(const std::string& content) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < content.size()) {
    auto end = content.find('\n', start);
    if (end == std::string::npos) {
      end = content.size();
    }
    std::string line = content.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

std::string JoinLines(const std::vector<std::string>& lines, std::string_view separator) {
  std::string joined;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      joined.append(separator);
    }
    joined.append(lines[i]);
  }
  return joined;
}

std::vector<std::string> SplitListValue(std::string_view value) {
  std::vector<std::string> pieces;
  std::size_t piece_start = 0;
  std::size_t pos = 0;
  while (pos < value.size()) {
    std::size_t matched = 0;
    for (const auto delimiter : kListDelimiters) {
      if (value.compare(pos, delimiter.size(), delimiter) == 0) {
        matched = delimiter.size();
        break;
      }
    }
    if (matched == 0) {
      ++pos;
      continue;
    }
    auto piece = Trim(value.substr(piece_start, pos - piece_start));
    if (!piece.empty()) {
      pieces.push_back(std::move(piece));
    }
    pos += matched;
    piece_start = pos;
  }
  auto tail = Trim(value.substr(piece_start));
  if (!tail.empty()) {
    pieces.push_back(std::move(tail));
  }
  return pieces;
}

std::size_t Utf8Length(std::string_view value) {
  return static_cast<std::size_t>(
      std::count_if(value.begin(), value.end(), [](char ch) { return !IsContinuationByte(ch); }));
}

std::string Utf8Prefix(std::string_view value, std::size_t count) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (!IsContinuationByte(value[i])) {
      if (seen == count) {
        return std::string(value.substr(0, i));
      }
      ++seen;
    }
  }
  return std::string(value);
}

}  // namespace notepress::text
