#pragma once

#include "nlohmann/json.hpp"
#include "notepress/note.hpp"

namespace notepress {

nlohmann::json MetaValueToJson(const MetaValue& value);
nlohmann::json NoteMetadataToJson(const NoteMetadata& metadata);
// Metadata fields plus "slug", "html" and "source".
nlohmann::json RenderedNoteToJson(const RenderedNote& note);

}  // namespace notepress
