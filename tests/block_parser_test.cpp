#include <iostream>
#include <stdexcept>
#include <string>

#include "notepress/block_parser.hpp"

namespace {

using notepress::markdown::BlockOptions;
using notepress::markdown::RenderBlocks;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void AssertEqual(const std::string& actual, const std::string& expected,
                 const std::string& context) {
  if (actual != expected) {
    throw std::runtime_error(context + ":\n--- expected\n" + expected + "\n--- actual\n" + actual);
  }
}

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::size_t CountOf(const std::string& haystack, const std::string& needle) {
  std::size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

void TestTable() {
  AssertEqual(RenderBlocks("| A | B |\n| - | - |\n| 1 | 2 |\n"),
              "<table>\n"
              "  <thead>\n"
              "    <tr><th>A</th><th>B</th></tr>\n"
              "  </thead>\n"
              "  <tbody>\n"
              "    <tr><td>1</td><td>2</td></tr>\n"
              "  </tbody>\n"
              "</table>",
              "header and body row");
}

void TestTableClosedAtEndOfInput() {
  const auto html = RenderBlocks("Intro line\n| x | y |\n|:--|--:|\n| <1> | [l](u) |");
  Assert(EndsWith(html, "\n</table>"), "table must close at end of input");
  Assert(html.find("<p>Intro line</p>\n<table>") == 0, "paragraph flushed before table");
  Assert(html.find("<td>&lt;1&gt;</td><td><a href=\"u\">l</a></td>") != std::string::npos,
         "cells are escaped and link-inlined");
  Assert(html.find(":--") == std::string::npos, "divider row never rendered");
}

void TestHeaderOnlyTableAndTrailingText() {
  AssertEqual(RenderBlocks("| only |\nafter"),
              "<table>\n"
              "  <thead>\n"
              "    <tr><th>only</th></tr>\n"
              "  </thead>\n"
              "</table>\n"
              "<p>after</p>",
              "header only table");
  AssertEqual(RenderBlocks("|---|---|\n"), "", "divider alone renders nothing");
}

void TestListMarkerChange() {
  AssertEqual(RenderBlocks("- item1\n1. item2\n2) item3\n+ item4"),
              "<ul>\n"
              "  <li>item1</li>\n"
              "</ul>\n"
              "<ol>\n"
              "  <li>item2</li>\n"
              "  <li>item3</li>\n"
              "</ol>\n"
              "<ul>\n"
              "  <li>item4</li>\n"
              "</ul>",
              "marker type change");
}

void TestListItemsInlineLinks() {
  AssertEqual(RenderBlocks("* see [a](b) & more"),
              "<ul>\n  <li>see <a href=\"b\">a</a> &amp; more</li>\n</ul>", "list item inline");
  AssertEqual(RenderBlocks("-no space\n1.no space"), "<p>-no space 1.no space</p>",
              "markers need whitespace");
}

void TestHeadingsAreOnlyEscaped() {
  AssertEqual(RenderBlocks("# Title [x](y) <b>"), "<h1>Title [x](y) &lt;b&gt;</h1>", "h1");
  AssertEqual(RenderBlocks("###### Six"), "<h6>Six</h6>", "h6");
  AssertEqual(RenderBlocks("####### Seven"), "<p>####### Seven</p>", "seven hashes");
  AssertEqual(RenderBlocks("#NoSpace"), "<p>#NoSpace</p>", "no space after hashes");
}

void TestBlockquoteAsymmetry() {
  const std::string input = "> quoted [x](y)\n>second\n\nafter";
  AssertEqual(RenderBlocks(input),
              "<blockquote>\n"
              "  <p>quoted [x](y)</p>\n"
              "  <p>second</p>\n"
              "</blockquote>\n"
              "<p>after</p>",
              "blockquote lines are only escaped");

  BlockOptions options;
  options.link_blockquotes = true;
  Assert(RenderBlocks(input, options).find("<p>quoted <a href=\"y\">x</a></p>") !=
             std::string::npos,
         "compatibility flag enables links in blockquotes");
}

void TestHorizontalRules() {
  for (const std::string rule : {"---", "***", "___", "- - -", "* * * *", "  ___  "}) {
    AssertEqual(RenderBlocks("above\n" + rule + "\nbelow"), "<p>above</p>\n<hr>\n<p>below</p>",
                "rule: " + rule);
  }
  AssertEqual(RenderBlocks("-*-"), "<p>-*-</p>", "mixed markers are not a rule");
}

void TestParagraphs() {
  AssertEqual(RenderBlocks("line one\nline two   \n\n\nthird <line>"),
              "<p>line one line two</p>\n<p>third &lt;line&gt;</p>", "paragraph joining");
  AssertEqual(RenderBlocks("para\n- item\nmore"),
              "<p>para</p>\n<ul>\n  <li>item</li>\n</ul>\n<p>more</p>",
              "paragraph flushed before list, list closed before paragraph");
  AssertEqual(RenderBlocks(""), "", "empty body");
  AssertEqual(RenderBlocks("\n \n\t\n"), "", "whitespace only");
}

void TestDocumentEndingMidParagraph() {
  const auto html = RenderBlocks("# H\n- a\n> q\ntrailing words");
  Assert(CountOf(html, "<ul>") == 1 && CountOf(html, "</ul>") == 1, "list closed once");
  Assert(CountOf(html, "<blockquote>") == 1 && CountOf(html, "</blockquote>") == 1,
         "blockquote closed once");
  Assert(EndsWith(html, "<p>trailing words</p>"), "trailing paragraph flushed");
}

}  // namespace

int main() {
  try {
    TestTable();
    TestTableClosedAtEndOfInput();
    TestHeaderOnlyTableAndTrailingText();
    TestListMarkerChange();
    TestListItemsInlineLinks();
    TestHeadingsAreOnlyEscaped();
    TestBlockquoteAsymmetry();
    TestHorizontalRules();
    TestParagraphs();
    TestDocumentEndingMidParagraph();
  } catch (const std::exception& ex) {
    std::cerr << "block_parser_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
