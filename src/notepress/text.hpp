#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace notepress::text {

std::string Trim(std::string_view value);
std::string TrimRight(std::string_view value);
std::string TrimLeft(std::string_view value);
bool StartsWith(std::string_view value, std::string_view prefix);
bool EndsWith(std::string_view value, std::string_view suffix);
std::string ToLower(std::string value);
bool IsBlank(std::string_view value);

// Splits on '\n' and drops a trailing '\r' from every line. A final newline
// does not produce an empty trailing line.
std::vector<std::string> SplitLines(const std::string& content);
std::string JoinLines(const std::vector<std::string>& lines, std::string_view separator = "\n");

// Splits on ASCII ',', fullwidth '，' and ideographic '、'. Pieces are trimmed
// and empty pieces are dropped.
std::vector<std::string> SplitListValue(std::string_view value);

std::size_t Utf8Length(std::string_view value);
// Returns the first |count| code points of |value|.
std::string Utf8Prefix(std::string_view value, std::size_t count);

}  // namespace notepress::text
