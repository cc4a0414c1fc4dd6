#include "notepress/note.hpp"

#include <cctype>

#include "notepress/text.hpp"

namespace notepress {
namespace {

bool ReadNumber(const std::string& value, std::size_t& pos, std::size_t min_digits,
                std::size_t max_digits, int& out) {
  const std::size_t start = pos;
  out = 0;
  while (pos < value.size() && pos - start < max_digits &&
         std::isdigit(static_cast<unsigned char>(value[pos])) != 0) {
    out = out * 10 + (value[pos] - '0');
    ++pos;
  }
  return pos - start >= min_digits;
}

bool IsLeapYear(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int DaysInMonth(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

// Howard Hinnant's days_from_civil.
int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

}  // namespace

int64_t ParseSortKey(const std::string& date_display) {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  if (!ReadNumber(date_display, pos, 4, 4, year) || pos >= date_display.size() ||
      date_display[pos++] != '-') {
    return kOldestSortKey;
  }
  if (!ReadNumber(date_display, pos, 1, 2, month) || pos >= date_display.size() ||
      date_display[pos++] != '-') {
    return kOldestSortKey;
  }
  if (!ReadNumber(date_display, pos, 1, 2, day) || pos != date_display.size()) {
    return kOldestSortKey;
  }
  if (year < 1 || month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
    return kOldestSortKey;
  }
  return DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string MetaValueToString(const MetaValue& value) {
  if (const auto* scalar = std::get_if<std::string>(&value)) {
    return *scalar;
  }
  return text::JoinLines(std::get<std::vector<std::string>>(value), ", ");
}

std::vector<std::string> MetaValueToList(const MetaValue& value) {
  if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
    return *list;
  }
  return text::SplitListValue(std::get<std::string>(value));
}

NoteMetadata MakeNoteMetadata(const MetadataMap& metadata, const std::string& fallback_title) {
  NoteMetadata note;
  note.title = fallback_title;
  for (const auto& [key, value] : metadata) {
    if (key == "title") {
      note.title = MetaValueToString(value);
    } else if (key == "date") {
      note.date_display = MetaValueToString(value);
    } else if (key == "summary") {
      note.summary = MetaValueToString(value);
    } else if (key == "tags") {
      note.tags = MetaValueToList(value);
    } else if (key == "category") {
      note.category = MetaValueToString(value);
    } else {
      note.extra.emplace(key, value);
    }
  }
  note.sort_key = ParseSortKey(note.date_display);
  return note;
}

bool NewerFirst(const RenderedNote& a, const RenderedNote& b) {
  if (a.metadata.sort_key != b.metadata.sort_key) {
    return a.metadata.sort_key > b.metadata.sort_key;
  }
  if (a.metadata.title != b.metadata.title) {
    return a.metadata.title > b.metadata.title;
  }
  return a.slug > b.slug;
}

}  // namespace notepress
