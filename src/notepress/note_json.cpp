#include "notepress/note_json.hpp"

namespace notepress {

using nlohmann::json;

json MetaValueToJson(const MetaValue& value) {
  if (const auto* scalar = std::get_if<std::string>(&value)) {
    return *scalar;
  }
  return std::get<std::vector<std::string>>(value);
}

json NoteMetadataToJson(const NoteMetadata& metadata) {
  json extra = json::object();
  for (const auto& [key, value] : metadata.extra) {
    extra[key] = MetaValueToJson(value);
  }
  return {{"title", metadata.title},
          {"date", metadata.date_display},
          {"summary", metadata.summary},
          {"tags", metadata.tags},
          {"category", metadata.category},
          {"sort_key", metadata.HasDate() ? json(metadata.sort_key) : json("oldest")},
          {"extra", extra}};
}

json RenderedNoteToJson(const RenderedNote& note) {
  json payload = NoteMetadataToJson(note.metadata);
  payload["slug"] = note.slug;
  payload["html"] = note.html_body;
  payload["source"] = note.source_stem;
  return payload;
}

}  // namespace notepress
