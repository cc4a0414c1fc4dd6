#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "notepress/config.hpp"
#include "notepress/note.hpp"
#include "notepress/renderer.hpp"

namespace notepress::site {

inline const std::string kPlaceholderStart = "<!-- BEGIN:ARTICLE_LIST -->";
inline const std::string kPlaceholderEnd = "<!-- END:ARTICLE_LIST -->";

struct CategoryInfo {
  std::string key;
  std::string list_page;
  std::string page_title;
  std::string hero_class;
  std::string badge;
};

struct BuildConfig {
  std::filesystem::path root = ".";
  std::string source_dir = "markdown 文章";
  std::string output_dir = "notes";
  RenderConfig render;

  std::filesystem::path SourcePath() const { return root / source_dir; }
  std::filesystem::path OutputPath() const { return root / output_dir; }
};

struct BuildSummary {
  std::size_t notes = 0;
  std::size_t pages_written = 0;
  std::size_t pages_removed = 0;
  std::map<std::string, std::size_t> per_category;
};

// NOTEPRESS_ROOT, NOTEPRESS_SOURCE_DIR, NOTEPRESS_OUTPUT_DIR plus the render
// settings.
BuildConfig LoadBuildConfig();

const std::vector<CategoryInfo>& Categories();
// Unknown keys resolve to the default category.
const CategoryInfo& FindCategory(const std::string& key);

// Converts every *.md file (sorted), then every *.markdown file (sorted), in
// |source_dir|. Slugs are made unique across the run. Returns newest first;
// an absent directory is logged and yields no notes.
std::vector<RenderedNote> CollectNotes(const std::filesystem::path& source_dir,
                                       const markdown::Renderer& renderer);

std::map<std::string, std::vector<RenderedNote>> GroupByCategory(
    const std::vector<RenderedNote>& notes);

std::string MetaLine(const NoteMetadata& metadata);
std::string RenderArticleCard(const RenderedNote& note);
std::string BuildArticleList(const std::vector<RenderedNote>& notes);
std::string RenderNotePage(const RenderedNote& note);

// Writes <output_dir>/<slug>.html for every note and deletes pages whose slug
// is no longer produced. Returns the number of pages removed.
std::size_t WriteNotePages(const std::vector<RenderedNote>& notes,
                           const std::filesystem::path& output_dir);

// Replaces the text between |start_marker| and |end_marker| in |target|.
// Throws std::runtime_error when the file or a marker is missing.
void UpdateSection(const std::filesystem::path& target, const std::string& start_marker,
                   const std::string& end_marker, const std::string& content);

// Lists every category into its list page and writes the note pages.
BuildSummary BuildSite(const BuildConfig& config, const markdown::Renderer& renderer);

// Prefixes every line that has non-whitespace content.
std::string IndentText(const std::string& text, std::size_t spaces);

std::string ReadTextFile(const std::filesystem::path& path);
void WriteTextFile(const std::filesystem::path& path, const std::string& content);

}  // namespace notepress::site
