#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace notepress {

using MetaValue = std::variant<std::string, std::vector<std::string>>;
using MetadataMap = std::map<std::string, MetaValue>;

constexpr int64_t kOldestSortKey = std::numeric_limits<int64_t>::min();
inline const std::string kUndatedDisplay = "未注明日期";
inline const std::string kDefaultCategory = "basics";

struct NoteMetadata {
  std::string title;
  std::string date_display = kUndatedDisplay;
  std::string summary;
  std::vector<std::string> tags;
  std::string category = kDefaultCategory;
  // Days since 1970-01-01, or kOldestSortKey when the date did not parse.
  int64_t sort_key = kOldestSortKey;
  // Front-matter keys without a dedicated field, kept verbatim.
  MetadataMap extra;

  bool HasDate() const { return sort_key != kOldestSortKey; }
};

struct RenderedNote {
  NoteMetadata metadata;
  std::string slug;
  std::string html_body;
  std::string source_stem;
};

// Parses "YYYY-MM-DD" into days since the epoch. Month and day may have one or
// two digits; the date must exist and nothing may follow it.
int64_t ParseSortKey(const std::string& date_display);

std::string MetaValueToString(const MetaValue& value);
std::vector<std::string> MetaValueToList(const MetaValue& value);

// Builds the record from an extracted metadata map. The sort key is derived
// here, once. |fallback_title| is used only if the map carries no title.
NoteMetadata MakeNoteMetadata(const MetadataMap& metadata, const std::string& fallback_title);

// Newest first; undated notes last; ties by title then slug, descending.
bool NewerFirst(const RenderedNote& a, const RenderedNote& b);

}  // namespace notepress
