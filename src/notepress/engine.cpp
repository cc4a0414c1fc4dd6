#include "notepress/engine.hpp"

#include <algorithm>
#include <vector>

#include "notepress/front_matter.hpp"
#include "notepress/logging.hpp"
#include "notepress/slug.hpp"
#include "notepress/summary.hpp"
#include "notepress/text.hpp"

namespace notepress {

RenderedNote ConvertDocument(const SourceDocument& document, const markdown::Renderer& renderer) {
  const auto extracted = ExtractFrontMatter(document.text, document.stem);

  RenderedNote note;
  note.source_stem = document.stem;
  note.metadata = MakeNoteMetadata(extracted.metadata, document.stem);
  if (note.metadata.summary.empty()) {
    note.metadata.summary = ExtractSummary(extracted.Body());
  }
  note.slug = Slugify(note.metadata.title, document.stem, document.sequence);

  std::vector<std::string> body_lines;
  body_lines.reserve(extracted.body_lines.size());
  for (std::size_t i = 0; i < extracted.body_lines.size(); ++i) {
    if (std::binary_search(extracted.annotation_lines.begin(), extracted.annotation_lines.end(),
                           i)) {
      continue;
    }
    body_lines.push_back(extracted.body_lines[i]);
  }
  note.html_body = renderer.Render(text::Trim(text::JoinLines(body_lines)));

  logging::LogDebug("Converted '" + document.stem + "' -> " + note.slug + " (" +
                    std::to_string(note.html_body.size()) + " bytes, renderer " +
                    renderer.Name() + ")");
  return note;
}

}  // namespace notepress
