#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "notepress/note.hpp"

namespace notepress {

struct ExtractedDocument {
  MetadataMap metadata;
  std::vector<std::string> body_lines;
  // Indexes into |body_lines| of blockquote lines left out of the rendered
  // body: those whose text contains "date", "tags" or "title".
  std::vector<std::size_t> annotation_lines;

  std::string Body() const;
};

// Parses the lines between the two "---" markers. Keys are lower-cased;
// bracketed values are read as JSON arrays, falling back to a delimiter split.
MetadataMap ParseFrontMatter(const std::vector<std::string>& lines);

// Parses a bracketed list value. Never fails.
std::vector<std::string> ParseListValue(const std::string& value);

// Splits |text| into metadata and body. The title always resolves: front
// matter, then the first "# " heading, then |stem|. Blockquote annotations
// fill date, tags and summary when front matter left them unset.
ExtractedDocument ExtractFrontMatter(const std::string& text, const std::string& stem);

}  // namespace notepress
