#include "notepress/site_builder.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <string_view>
#include <stdexcept>
#include <system_error>

#include "notepress/engine.hpp"
#include "notepress/inline_html.hpp"
#include "notepress/logging.hpp"
#include "notepress/slug.hpp"
#include "notepress/text.hpp"

namespace notepress::site {
namespace {

namespace fs = std::filesystem;

using logging::LogDebug;
using logging::LogError;
using logging::LogInfo;
using markdown::EscapeHtml;

constexpr const char* kNoTagsLabel = "暂无标签";
constexpr const char* kTagSeparator = "，";
constexpr const char* kSiteTitle = "炎症衰老研究笔记";
constexpr const char* kFontStylesheet =
    "https://fonts.googleapis.com/css2?family=Poppins:wght@400;600;700&display=swap";

const std::vector<CategoryInfo> kCategories = {
    {"basics", "basics.html", "Basics｜基础概念", "hero-sub--basics", "Basics"},
    {"papers", "papers.html", "Papers｜论文拆解", "hero-sub--papers", "Papers"},
    {"pathways", "pathways-methods.html", "Pathways & Methods｜通路与方法区",
     "hero-sub--pathways", "Pathways"},
    {"stories", "stories-evolution.html", "Stories & Evolution｜人类演化 & 疾病小随笔",
     "hero-sub--stories", "Stories"},
};

std::vector<fs::path> ListSources(const fs::path& source_dir, const std::string& extension) {
  std::vector<fs::path> paths;
  for (const auto& entry : fs::directory_iterator(source_dir)) {
    if (entry.is_regular_file() && entry.path().extension() == extension) {
      paths.push_back(entry.path());
    }
  }
  std::sort(paths.begin(), paths.end());
  return paths;
}

std::string JoinTags(const std::vector<std::string>& tags, const std::string& separator) {
  return text::JoinLines(tags, separator);
}

std::string NavigationLinks(const std::string& active_key) {
  std::ostringstream nav;
  for (std::size_t i = 0; i < kCategories.size(); ++i) {
    const auto& category = kCategories[i];
    nav << "      <a href=\"../" << category.list_page << "\""
        << (category.key == active_key ? " class=\"active\"" : "") << ">"
        << category.page_title << "</a>";
    if (i + 1 < kCategories.size()) {
      nav << "\n";
    }
  }
  return nav.str();
}

// Date and tag lines shown above the body of a note page.
std::string DetailMetaHtml(const NoteMetadata& metadata) {
  std::vector<std::string> lines;
  if (!metadata.date_display.empty() && metadata.date_display != kUndatedDisplay) {
    lines.push_back("日期：" + EscapeHtml(metadata.date_display));
  }
  if (!metadata.tags.empty()) {
    lines.push_back("标签：" + EscapeHtml(JoinTags(metadata.tags, "、")));
  }
  std::vector<std::string> html;
  for (const auto& line : lines) {
    html.push_back("<p class=\"article-detail__meta\">" + line + "</p>");
  }
  return text::JoinLines(html);
}

}  // namespace

BuildConfig LoadBuildConfig() {
  BuildConfig config;
  config.root = GetEnv("NOTEPRESS_ROOT", config.root.string());
  config.source_dir = GetEnv("NOTEPRESS_SOURCE_DIR", config.source_dir);
  config.output_dir = GetEnv("NOTEPRESS_OUTPUT_DIR", config.output_dir);
  config.render = LoadRenderConfig();
  return config;
}

const std::vector<CategoryInfo>& Categories() { return kCategories; }

const CategoryInfo& FindCategory(const std::string& key) {
  const auto it = std::find_if(kCategories.begin(), kCategories.end(),
                               [&key](const CategoryInfo& info) { return info.key == key; });
  if (it == kCategories.end()) {
    return kCategories.front();
  }
  return *it;
}

std::vector<RenderedNote> CollectNotes(const fs::path& source_dir,
                                       const markdown::Renderer& renderer) {
  std::error_code ec;
  if (!fs::is_directory(source_dir, ec)) {
    LogError("Source directory not found: " + source_dir.string());
    return {};
  }

  auto paths = ListSources(source_dir, ".md");
  const auto long_form = ListSources(source_dir, ".markdown");
  paths.insert(paths.end(), long_form.begin(), long_form.end());

  SlugRegistry registry;
  std::vector<RenderedNote> notes;
  notes.reserve(paths.size());
  int sequence = 0;
  for (const auto& path : paths) {
    ++sequence;
    const logging::DocumentScope scope(path.filename().string());
    logging::ScopedTimer timer("Rendering");
    SourceDocument document{ReadTextFile(path), path.stem().string(), sequence};
    auto note = ConvertDocument(document, renderer);
    note.slug = registry.Claim(note.slug, note.source_stem);
    notes.push_back(std::move(note));
  }

  std::stable_sort(notes.begin(), notes.end(), NewerFirst);
  LogInfo("Collected " + std::to_string(notes.size()) + " notes from " + source_dir.string());
  return notes;
}

std::map<std::string, std::vector<RenderedNote>> GroupByCategory(
    const std::vector<RenderedNote>& notes) {
  std::map<std::string, std::vector<RenderedNote>> grouped;
  for (const auto& note : notes) {
    grouped[FindCategory(note.metadata.category).key].push_back(note);
  }
  return grouped;
}

std::string MetaLine(const NoteMetadata& metadata) {
  const std::string tags = metadata.tags.empty() ? kNoTagsLabel : JoinTags(metadata.tags, kTagSeparator);
  return metadata.date_display + " · " + tags;
}

std::string RenderArticleCard(const RenderedNote& note) {
  const auto slug = EscapeHtml(note.slug);
  std::ostringstream card;
  card << "<article class=\"article-card\" id=\"" << slug << "\">\n"
       << "  <header class=\"article-card__header\">\n"
       << "    <h3>" << EscapeHtml(note.metadata.title) << "</h3>\n"
       << "    <p class=\"article-card__meta\">" << EscapeHtml(MetaLine(note.metadata))
       << "</p>\n"
       << "  </header>\n"
       << "  <p class=\"article-card__summary\">" << EscapeHtml(note.metadata.summary) << "</p>\n"
       << "  <div class=\"article-card__actions\">\n"
       << "    <a class=\"article-card__link\" href=\"notes/" << slug
       << ".html\">阅读全文</a>\n"
       << "  </div>\n"
       << "</article>";
  return card.str();
}

std::string BuildArticleList(const std::vector<RenderedNote>& notes) {
  if (notes.empty()) {
    return "        <p class=\"empty-state\">暂时还没有内容，欢迎稍后再来。</p>";
  }
  std::vector<std::string> rendered;
  rendered.reserve(notes.size());
  for (const auto& note : notes) {
    rendered.push_back(IndentText(RenderArticleCard(note), 8));
  }
  return text::JoinLines(rendered);
}

std::string RenderNotePage(const RenderedNote& note) {
  const auto& category = FindCategory(note.metadata.category);
  const auto title = EscapeHtml(note.metadata.title);
  const auto meta_html = DetailMetaHtml(note.metadata);
  const auto body = meta_html.empty() ? note.html_body : meta_html + "\n" + note.html_body;

  std::ostringstream page;
  page << "<!DOCTYPE html>\n"
       << "<html lang=\"zh-CN\">\n"
       << "<head>\n"
       << "  <meta charset=\"UTF-8\">\n"
       << "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
       << "  <title>" << title << " - " << category.page_title << "</title>\n"
       << "  <link rel=\"preconnect\" href=\"https://fonts.googleapis.com\">\n"
       << "  <link rel=\"preconnect\" href=\"https://fonts.gstatic.com\" crossorigin>\n"
       << "  <link href=\"" << kFontStylesheet << "\" rel=\"stylesheet\">\n"
       << "  <link rel=\"stylesheet\" href=\"../styles.css\">\n"
       << "</head>\n"
       << "<body>\n"
       << "  <header class=\"site-header\">\n"
       << "    <div class=\"brand\">\n"
       << "      <span class=\"brand-mark\">IA</span>\n"
       << "      <div>\n"
       << "        <h1>" << kSiteTitle << "</h1>\n"
       << "        <p class=\"tagline\">" << category.page_title << "</p>\n"
       << "      </div>\n"
       << "    </div>\n"
       << "    <nav class=\"site-nav\">\n"
       << "      <a href=\"../index.html\">首页</a>\n"
       << NavigationLinks(category.key) << "\n"
       << "      <a href=\"../contact.html\">联系我</a>\n"
       << "    </nav>\n"
       << "  </header>\n"
       << "\n"
       << "  <main class=\"content\">\n"
       << "    <section class=\"hero hero-sub " << category.hero_class << "\">\n"
       << "      <div class=\"hero-copy\">\n"
       << "        <span class=\"badge\">" << category.badge << "</span>\n"
       << "        <h1>" << title << "</h1>\n"
       << "        <p class=\"article-detail__meta\">" << EscapeHtml(MetaLine(note.metadata))
       << "</p>\n"
       << "        <a class=\"article-detail__back\" href=\"../" << category.list_page
       << "\">← 返回列表</a>\n"
       << "      </div>\n"
       << "      <div class=\"hero-illustration hero-illustration--mini\" aria-hidden=\"true\">\n"
       << "        <div class=\"blob blob-2\"></div>\n"
       << "        <div class=\"spark spark-3\"></div>\n"
       << "      </div>\n"
       << "    </section>\n"
       << "\n"
       << "    <section class=\"section article-detail\">\n"
       << "      <article class=\"article-detail__card\">\n"
       << IndentText(body, 8) << "\n"
       << "      </article>\n"
       << "    </section>\n"
       << "  </main>\n"
       << "\n"
       << "  <footer class=\"site-footer\">\n"
       << "    <p>© <span id=\"year\"></span> " << kSiteTitle << "</p>\n"
       << "  </footer>\n"
       << "\n"
       << "  <script>\n"
       << "    document.getElementById('year').textContent = new Date().getFullYear();\n"
       << "  </script>\n"
       << "</body>\n"
       << "</html>\n";
  return page.str();
}

std::size_t WriteNotePages(const std::vector<RenderedNote>& notes, const fs::path& output_dir) {
  fs::create_directories(output_dir);

  std::set<std::string> existing;
  for (const auto& entry : fs::directory_iterator(output_dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".html") {
      existing.insert(entry.path().stem().string());
    }
  }

  std::set<std::string> current;
  for (const auto& note : notes) {
    current.insert(note.slug);
    WriteTextFile(output_dir / (note.slug + ".html"), RenderNotePage(note));
  }

  std::size_t removed = 0;
  for (const auto& stale : existing) {
    if (current.count(stale) != 0) {
      continue;
    }
    std::error_code ec;
    if (fs::remove(output_dir / (stale + ".html"), ec)) {
      LogDebug("Removed stale page " + stale + ".html");
      ++removed;
    } else if (ec) {
      logging::LogWarn("Could not remove stale page " + stale + ".html: " + ec.message());
    }
  }
  return removed;
}

void UpdateSection(const fs::path& target, const std::string& start_marker,
                   const std::string& end_marker, const std::string& content) {
  std::error_code ec;
  if (!fs::exists(target, ec)) {
    throw std::runtime_error("File not found: " + target.string());
  }

  const std::string html = ReadTextFile(target);
  const auto start = html.find(start_marker);
  const auto end = html.find(end_marker);
  if (start == std::string::npos || end == std::string::npos || end < start) {
    throw std::runtime_error("No valid placeholder comments in " + target.filename().string());
  }

  std::string updated = html.substr(0, start + start_marker.size());
  updated.append("\n").append(content).append("\n").append(html, end, std::string::npos);
  WriteTextFile(target, updated);
}

BuildSummary BuildSite(const BuildConfig& config, const markdown::Renderer& renderer) {
  BuildSummary summary;
  const auto notes = CollectNotes(config.SourcePath(), renderer);
  const auto grouped = GroupByCategory(notes);
  summary.notes = notes.size();

  for (const auto& category : kCategories) {
    const auto it = grouped.find(category.key);
    const std::vector<RenderedNote> empty;
    const auto& listed = it == grouped.end() ? empty : it->second;
    summary.per_category[category.key] = listed.size();

    const auto target = config.root / category.list_page;
    std::error_code ec;
    if (!fs::exists(target, ec)) {
      LogDebug("Skipping missing list page " + target.string());
      continue;
    }
    UpdateSection(target, kPlaceholderStart, kPlaceholderEnd, BuildArticleList(listed));
  }

  summary.pages_written = notes.size();
  summary.pages_removed = WriteNotePages(notes, config.OutputPath());
  return summary;
}

std::string IndentText(const std::string& text, std::size_t spaces) {
  const std::string prefix(spaces, ' ');
  std::string indented;
  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    end = end == std::string::npos ? text.size() : end + 1;
    const std::string_view line(text.data() + start, end - start);
    if (!text::IsBlank(line)) {
      indented.append(prefix);
    }
    indented.append(line);
    start = end;
  }
  return indented;
}

std::string ReadTextFile(const fs::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw std::runtime_error("Failed to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

void WriteTextFile(const fs::path& path, const std::string& content) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw std::runtime_error("Failed to write " + path.string());
  }
  output << content;
  if (!output) {
    throw std::runtime_error("Failed to write " + path.string());
  }
}

}  // namespace notepress::site
