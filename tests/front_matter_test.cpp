#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "notepress/front_matter.hpp"
#include "notepress/note.hpp"

namespace {

using notepress::ExtractFrontMatter;
using notepress::MakeNoteMetadata;
using notepress::MetaValueToList;
using notepress::MetaValueToString;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void AssertEqual(const std::string& actual, const std::string& expected,
                 const std::string& context) {
  if (actual != expected) {
    throw std::runtime_error(context + ": expected '" + expected + "' but got '" + actual + "'");
  }
}

void AssertList(const std::vector<std::string>& actual, const std::vector<std::string>& expected,
                const std::string& context) {
  if (actual != expected) {
    std::string joined;
    for (const auto& item : actual) {
      joined += "[" + item + "]";
    }
    throw std::runtime_error(context + ": unexpected list " + joined);
  }
}

std::string Field(const notepress::ExtractedDocument& doc, const std::string& key) {
  const auto it = doc.metadata.find(key);
  Assert(it != doc.metadata.end(), "missing key " + key);
  return MetaValueToString(it->second);
}

std::vector<std::string> Tags(const std::string& text) {
  const auto doc = ExtractFrontMatter(text, "stem");
  return MetaValueToList(doc.metadata.at("tags"));
}

void TestDelimitedBlock() {
  const auto doc = ExtractFrontMatter(
      "---\n"
      "title: Inflammaging 101\n"
      "Date: 2024-03-05\n"
      "category: papers\n"
      "editor: Dr. Who\n"
      "not a key line\n"
      "---\n"
      "# Ignored Heading\n"
      "Body text.\n",
      "fallback-stem");
  AssertEqual(Field(doc, "title"), "Inflammaging 101", "title");
  AssertEqual(Field(doc, "date"), "2024-03-05", "keys are lower-cased");
  AssertEqual(Field(doc, "editor"), "Dr. Who", "unknown keys kept");
  Assert(doc.metadata.count("not a key line") == 0, "non key lines ignored");
  AssertEqual(doc.Body(), "# Ignored Heading\nBody text.", "body follows closing marker");

  const auto meta = MakeNoteMetadata(doc.metadata, "fallback-stem");
  AssertEqual(meta.category, "papers", "category");
  Assert(meta.extra.count("editor") == 1, "extra keeps unknown key");
  Assert(meta.tags.empty(), "tags default to empty");
}

void TestTagForms() {
  AssertList(Tags("---\ntags: [\"a\", \"b\"]\n---\n"), {"a", "b"}, "json list");
  AssertList(Tags("---\ntags: [a, b]\n---\n"), {"a", "b"}, "malformed json list");
  AssertList(Tags("---\ntags: a,b\n---\n"), {"a", "b"}, "plain comma list");
  AssertList(Tags("---\ntags: [炎症，衰老、免疫]\n---\n"), {"炎症", "衰老", "免疫"},
             "cjk delimiters");
  AssertList(Tags("---\ntags: [1, 2.5, null, \"x\"]\n---\n"), {"1", "2.5", "x"},
             "json scalars");
  AssertList(Tags("---\ntags: [ , ,]\n---\n"), {}, "empty pieces dropped");
  AssertList(Tags("no front matter"), {}, "absent tags");
}

void TestTitleResolution() {
  AssertEqual(Field(ExtractFrontMatter("intro\n# Heading Title\n## Sub\n", "stem"), "title"),
              "Heading Title", "first level-1 heading");
  AssertEqual(Field(ExtractFrontMatter("## Only Sub\ntext\n", "file-stem"), "title"), "file-stem",
              "stem fallback");
  AssertEqual(Field(ExtractFrontMatter("", "empty"), "title"), "empty", "empty document");
}

void TestBlockquoteAnnotations() {
  const auto doc = ExtractFrontMatter(
      "# 标题\n"
      "> 日期：2023-11-02\n"
      "> 标签：衰老，炎症、免疫\n"
      "> 摘要：一段摘要\n"
      "> 日期：2020-01-01\n"
      "> Please update the docs\n"
      "正文\n",
      "stem");
  AssertEqual(Field(doc, "date"), "2023-11-02", "first date wins");
  AssertList(MetaValueToList(doc.metadata.at("tags")), {"衰老", "炎症", "免疫"}, "inline tags");
  AssertEqual(Field(doc, "summary"), "一段摘要", "inline summary");
  Assert(doc.annotation_lines == std::vector<std::size_t>({5}),
         "only quote lines naming date, tags or title are hidden");

  const auto english = ExtractFrontMatter(
      "> Date: unknown\n"
      "> date: 2022-02-02\n"
      "> Tags: alpha, beta\n",
      "stem");
  AssertEqual(Field(english, "date"), "2022-02-02", "date without value does not claim the key");
  AssertList(MetaValueToList(english.metadata.at("tags")), {"alpha", "beta"}, "english label");
}

void TestFrontMatterWinsOverAnnotations() {
  const auto doc = ExtractFrontMatter(
      "---\n"
      "date: 2021-06-01\n"
      "---\n"
      "> 日期：1999-01-01\n"
      "> 摘要：from quote\n",
      "stem");
  AssertEqual(Field(doc, "date"), "2021-06-01", "front matter date kept");
  AssertEqual(Field(doc, "summary"), "from quote", "unset key filled from quote");
}

void TestUnterminatedBlock() {
  const auto doc = ExtractFrontMatter("---\ntitle: Never closed\nbody?\n", "stem");
  AssertEqual(Field(doc, "title"), "Never closed", "title from open block");
  Assert(doc.body_lines.empty(), "unterminated block consumes the document");
}

void TestSortKey() {
  Assert(notepress::ParseSortKey("1970-01-01") == 0, "epoch");
  Assert(notepress::ParseSortKey("2024-03-01") - notepress::ParseSortKey("2024-02-28") == 2,
         "leap year");
  Assert(notepress::ParseSortKey("2024-1-5") == notepress::ParseSortKey("2024-01-05"),
         "single digit month and day");
  for (const std::string bad : {"未注明日期", "2023-02-29", "2024-13-01", "2024-01-01 10:00",
                                "24-01-01", ""}) {
    Assert(notepress::ParseSortKey(bad) == notepress::kOldestSortKey, "should not parse: " + bad);
  }
  notepress::MetadataMap metadata;
  const auto undated = MakeNoteMetadata(metadata, "t");
  Assert(!undated.HasDate(), "undated record");
  AssertEqual(undated.date_display, notepress::kUndatedDisplay, "undated display");
}

}  // namespace

int main() {
  try {
    TestDelimitedBlock();
    TestTagForms();
    TestTitleResolution();
    TestBlockquoteAnnotations();
    TestFrontMatterWinsOverAnnotations();
    TestUnterminatedBlock();
    TestSortKey();
  } catch (const std::exception& ex) {
    std::cerr << "front_matter_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
