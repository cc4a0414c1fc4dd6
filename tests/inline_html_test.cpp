#include <iostream>
#include <stdexcept>
#include <string>

#include "notepress/inline_html.hpp"

namespace {

using notepress::markdown::EscapeHtml;
using notepress::markdown::RenderInline;
using notepress::markdown::TokenizeInline;

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

// Every '<', '>' and '"' must belong to markup produced for a link.
bool HasOnlyAnchorMarkup(std::string html) {
  for (const std::string tag : {"<a href=\"", "\">", "</a>"}) {
    for (auto pos = html.find(tag); pos != std::string::npos; pos = html.find(tag)) {
      html.erase(pos, tag.size());
    }
  }
  return html.find_first_of("<>\"'") == std::string::npos;
}

void TestEscapesSpecialCharacters() {
  AssertEqual(EscapeHtml(R"(<b class="x">Tom & Jerry's</b>)"),
              "&lt;b class=&quot;x&quot;&gt;Tom &amp; Jerry&#x27;s&lt;/b&gt;", "escape");
  AssertEqual(EscapeHtml("plain 中文"), "plain 中文", "escape passthrough");
  Assert(EscapeHtml(EscapeHtml("a&b")) != EscapeHtml("a&b"), "escaping must not be idempotent");
}

void TestRendersLinks() {
  AssertEqual(RenderInline("see [docs](https://example.com/a?b=1&c=2) now"),
              "see <a href=\"https://example.com/a?b=1&amp;c=2\">docs</a> now", "single link");
  AssertEqual(RenderInline("[a](1) and [b](2)"), "<a href=\"1\">a</a> and <a href=\"2\">b</a>",
              "two links");
  AssertEqual(RenderInline("[]() [x]() [](y)"), "[]() [x]() [](y)", "empty parts never link");
  AssertEqual(RenderInline("[open](no-close"), "[open](no-close", "unterminated link");
  AssertEqual(RenderInline("[<b>Tom & \"Jerry\"</b>](u)"),
              "<a href=\"u\">&lt;b&gt;Tom &amp; &quot;Jerry&quot;&lt;/b&gt;</a>",
              "link label is escaped");
}

void TestAttributeBreakoutIsEscaped() {
  const auto html = RenderInline(R"([click](http://x.com"><script>))");
  AssertEqual(html, "<a href=\"http://x.com&quot;&gt;&lt;script&gt;\">click</a>",
              "href breakout");
  Assert(html.find("<script>") == std::string::npos, "script tag leaked");
}

void TestLinkSyntaxInsideLinkIsNotReprocessed() {
  const auto html = RenderInline("[a [b](c)](d)");
  AssertEqual(html, "<a href=\"c\">a [b</a>](d)", "nested brackets");
  const auto spans = TokenizeInline("[x](y) tail");
  Assert(spans.size() == 2, "expected a link span and a text span");
  Assert(spans[0].kind == notepress::markdown::InlineSpan::Kind::kLink, "first span is a link");
  AssertEqual(spans[0].url, "y", "link url");
  AssertEqual(spans[1].text, " tail", "trailing text");
}

void TestNoUnescapedMarkupOutsideLinks() {
  const std::string samples[] = {
      "<script>alert(1)</script>",
      "a < b && c > d",
      "[<img src=x>](javascript:\"<x>\")",
      "\"quoted\" 'single' [l](u) <tail>",
      "___LINK_PLACEHOLDER_0___ [x](y)",
  };
  for (const auto& sample : samples) {
    Assert(HasOnlyAnchorMarkup(RenderInline(sample)), "unescaped markup for: " + sample);
  }
  AssertEqual(RenderInline("___LINK_PLACEHOLDER_0___"), "___LINK_PLACEHOLDER_0___",
              "placeholder-looking text stays literal");
}

}  // namespace

int main() {
  try {
    TestEscapesSpecialCharacters();
    TestRendersLinks();
    TestAttributeBreakoutIsEscaped();
    TestLinkSyntaxInsideLinkIsNotReprocessed();
    TestNoUnescapedMarkupOutsideLinks();
  } catch (const std::exception& ex) {
    std::cerr << "inline_html_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
