#include "notepress/front_matter.hpp"

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

#include "nlohmann/json.hpp"
#include "notepress/logging.hpp"
#include "notepress/text.hpp"

namespace notepress {
namespace {

using logging::LogDebug;
using text::StartsWith;
using text::Trim;

constexpr std::string_view kFrontMatterMarker = "---";
constexpr std::string_view kFullwidthColon = "\xEF\xBC\x9A";  // ：

struct AnnotationLabel {
  std::string_view key;
  std::array<std::string_view, 2> labels;
};

constexpr std::array<AnnotationLabel, 3> kAnnotationLabels = {{
    {"date", {"日期", "date"}},
    {"tags", {"标签", "tags"}},
    {"summary", {"摘要", "summary"}},
}};

// Blockquote lines containing any of these are dropped from the rendered
// body. Matching is case-sensitive and by substring.
constexpr std::array<std::string_view, 3> kHiddenQuoteMarkers = {"date", "tags", "title"};

bool IsKeyStart(char ch) { return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_'; }

bool IsKeyChar(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

// Matches ^[A-Za-z_][A-Za-z0-9_-]*:\s*(.+)$ on an already trimmed line.
bool SplitKeyValue(const std::string& line, std::string& key, std::string& value) {
  if (line.empty() || !IsKeyStart(line.front())) {
    return false;
  }
  std::size_t pos = 1;
  while (pos < line.size() && IsKeyChar(line[pos])) {
    ++pos;
  }
  if (pos >= line.size() || line[pos] != ':') {
    return false;
  }
  value = Trim(std::string_view(line).substr(pos + 1));
  if (value.empty()) {
    return false;
  }
  key = text::ToLower(line.substr(0, pos));
  return true;
}

std::string StripBrackets(const std::string& value) {
  std::size_t start = 0;
  std::size_t end = value.size();
  while (start < end && (value[start] == '[' || value[start] == ']')) {
    ++start;
  }
  while (end > start && (value[end - 1] == '[' || value[end - 1] == ']')) {
    --end;
  }
  return value.substr(start, end - start);
}

// CJK labels match as plain substrings. ASCII labels match case-insensitively
// as whole words, so "update" does not carry a date label.
bool ContainsLabel(const std::string& line, std::string_view label) {
  if (static_cast<unsigned char>(label.front()) >= 0x80) {
    return line.find(label) != std::string::npos;
  }
  const std::string lowered = text::ToLower(line);
  for (auto pos = lowered.find(label); pos != std::string::npos;
       pos = lowered.find(label, pos + 1)) {
    const auto end = pos + label.size();
    const bool starts_word =
        pos == 0 || std::isalpha(static_cast<unsigned char>(lowered[pos - 1])) == 0;
    const bool ends_word =
        end == lowered.size() || std::isalpha(static_cast<unsigned char>(lowered[end])) == 0;
    if (starts_word && ends_word) {
      return true;
    }
  }
  return false;
}

bool HasLabel(const std::string& line, std::string_view key) {
  for (const auto& entry : kAnnotationLabels) {
    if (entry.key != key) {
      continue;
    }
    for (const auto label : entry.labels) {
      if (ContainsLabel(line, label)) {
        return true;
      }
    }
  }
  return false;
}

// Text after the first fullwidth colon, else after the first ASCII colon,
// else the whole line.
std::string AnnotationValue(const std::string& line) {
  if (const auto pos = line.find(kFullwidthColon); pos != std::string::npos) {
    return line.substr(pos + kFullwidthColon.size());
  }
  if (const auto pos = line.find(':'); pos != std::string::npos) {
    return line.substr(pos + 1);
  }
  return line;
}

// Finds the first \d{4}-\d{2}-\d{2} in |line|.
std::string FindIsoDate(const std::string& line) {
  static constexpr std::string_view kShape = "dddd-dd-dd";
  if (line.size() < kShape.size()) {
    return {};
  }
  for (std::size_t start = 0; start + kShape.size() <= line.size(); ++start) {
    bool matched = true;
    for (std::size_t i = 0; i < kShape.size() && matched; ++i) {
      const char ch = line[start + i];
      matched = kShape[i] == 'd' ? std::isdigit(static_cast<unsigned char>(ch)) != 0 : ch == '-';
    }
    if (matched) {
      return line.substr(start, kShape.size());
    }
  }
  return {};
}

// Removes the leading run of '>' and ' ' characters.
std::string StripQuoteMarkers(const std::string& line) {
  const auto pos = line.find_first_not_of("> ");
  return pos == std::string::npos ? std::string{} : line.substr(pos);
}

void ApplyAnnotations(const std::vector<std::string>& body_lines, MetadataMap& meta) {
  for (const auto& line : body_lines) {
    if (!StartsWith(text::TrimLeft(line), ">")) {
      continue;
    }
    const std::string clean = StripQuoteMarkers(line);
    if (meta.count("date") == 0 && HasLabel(clean, "date")) {
      if (auto date = FindIsoDate(clean); !date.empty()) {
        meta.emplace("date", std::move(date));
      }
    }
    if (meta.count("tags") == 0 && HasLabel(clean, "tags")) {
      meta.emplace("tags", text::SplitListValue(AnnotationValue(clean)));
    }
    if (meta.count("summary") == 0 && HasLabel(clean, "summary")) {
      meta.emplace("summary", Trim(AnnotationValue(clean)));
    }
  }
}

std::vector<std::size_t> FindHiddenQuoteLines(const std::vector<std::string>& body_lines) {
  std::vector<std::size_t> hidden;
  for (std::size_t index = 0; index < body_lines.size(); ++index) {
    const auto stripped = Trim(body_lines[index]);
    if (!StartsWith(stripped, ">")) {
      continue;
    }
    for (const auto marker : kHiddenQuoteMarkers) {
      if (stripped.find(marker) != std::string::npos) {
        hidden.push_back(index);
        break;
      }
    }
  }
  return hidden;
}

}  // namespace

std::string ExtractedDocument::Body() const { return text::JoinLines(body_lines); }

std::vector<std::string> ParseListValue(const std::string& value) {
  const auto parsed = nlohmann::json::parse(value, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    LogDebug("List value is not a JSON array, splitting on delimiters: " + value);
    return text::SplitListValue(StripBrackets(value));
  }
  std::vector<std::string> items;
  for (const auto& item : parsed) {
    if (item.is_string()) {
      items.push_back(item.get<std::string>());
    } else if (!item.is_null()) {
      items.push_back(item.dump());
    }
  }
  return items;
}

MetadataMap ParseFrontMatter(const std::vector<std::string>& lines) {
  MetadataMap meta;
  std::string key;
  std::string value;
  for (const auto& raw_line : lines) {
    if (!SplitKeyValue(Trim(raw_line), key, value)) {
      continue;
    }
    if (value.front() == '[' && value.back() == ']') {
      meta[key] = ParseListValue(value);
    } else {
      meta[key] = value;
    }
  }
  return meta;
}

ExtractedDocument ExtractFrontMatter(const std::string& text, const std::string& stem) {
  const auto lines = text::SplitLines(text);
  ExtractedDocument doc;

  std::size_t body_start = 0;
  if (!lines.empty() && Trim(lines.front()) == kFrontMatterMarker) {
    std::size_t end = 1;
    while (end < lines.size() && Trim(lines[end]) != kFrontMatterMarker) {
      ++end;
    }
    doc.metadata = ParseFrontMatter(
        std::vector<std::string>(lines.begin() + 1, lines.begin() + static_cast<long>(end)));
    body_start = end < lines.size() ? end + 1 : lines.size();
  }
  doc.body_lines.assign(lines.begin() + static_cast<long>(body_start), lines.end());

  if (doc.metadata.count("title") == 0) {
    std::string title = stem;
    for (const auto& line : doc.body_lines) {
      if (StartsWith(line, "# ")) {
        title = Trim(std::string_view(line).substr(2));
        break;
      }
    }
    doc.metadata.emplace("title", std::move(title));
  }

  ApplyAnnotations(doc.body_lines, doc.metadata);
  doc.annotation_lines = FindHiddenQuoteLines(doc.body_lines);

  if (doc.metadata.count("tags") == 0) {
    doc.metadata.emplace("tags", std::vector<std::string>{});
  }
  return doc;
}

}  // namespace notepress
