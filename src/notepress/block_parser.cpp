#include "notepress/block_parser.hpp"

#include <cctype>
#include <string_view>
#include <utility>
#include <variant>

#include "notepress/inline_html.hpp"
#include "notepress/text.hpp"

namespace notepress::markdown {
namespace {

using text::Trim;

struct IdleState {};
struct BlockquoteState {};
struct ListState {
  bool ordered = false;
};
struct TableState {
  std::vector<std::vector<std::string>> rows;
};
struct ParagraphState {
  std::vector<std::string> lines;
};

using ParserState =
    std::variant<IdleState, BlockquoteState, ListState, TableState, ParagraphState>;

bool IsSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool IsDigit(char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }

// ^(#{1,6})\s+(.*)$
bool MatchHeading(const std::string& line, int& level, std::string& content) {
  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  if (hashes == 0 || hashes > 6 || hashes >= line.size() || !IsSpace(line[hashes])) {
    return false;
  }
  level = static_cast<int>(hashes);
  content = Trim(std::string_view(line).substr(hashes));
  return true;
}

// ^\s*([*+-]|\d+[.)])\s+
bool MatchListItem(const std::string& line, bool& ordered, std::string& item) {
  std::size_t pos = 0;
  while (pos < line.size() && IsSpace(line[pos])) {
    ++pos;
  }
  if (pos >= line.size()) {
    return false;
  }
  if (line[pos] == '*' || line[pos] == '+' || line[pos] == '-') {
    ordered = false;
    ++pos;
  } else if (IsDigit(line[pos])) {
    while (pos < line.size() && IsDigit(line[pos])) {
      ++pos;
    }
    if (pos >= line.size() || (line[pos] != '.' && line[pos] != ')')) {
      return false;
    }
    ordered = true;
    ++pos;
  } else {
    return false;
  }
  if (pos >= line.size() || !IsSpace(line[pos])) {
    return false;
  }
  item = Trim(std::string_view(line).substr(pos));
  return true;
}

class BlockParser {
 public:
  explicit BlockParser(const BlockOptions& options) : options_(options) {}

  void Feed(const std::string& raw_line) {
    const std::string line = text::TrimRight(raw_line);

    if (IsTableRow(line)) {
      if (!std::holds_alternative<TableState>(state_)) {
        Close();
        state_ = TableState{};
      }
      if (!IsTableDivider(line)) {
        std::get<TableState>(state_).rows.push_back(SplitTableCells(line));
      }
      return;
    }

    if (line.empty()) {
      Close();
      return;
    }

    if (IsHorizontalRule(line)) {
      Close();
      parts_.emplace_back("<hr>");
      return;
    }

    int level = 0;
    std::string content;
    if (MatchHeading(line, level, content)) {
      Close();
      const auto tag = std::to_string(level);
      parts_.push_back("<h" + tag + ">" + EscapeHtml(content) + "</h" + tag + ">");
      return;
    }

    if (line.front() == '>') {
      if (!std::holds_alternative<BlockquoteState>(state_)) {
        Close();
        parts_.emplace_back("<blockquote>");
        state_ = BlockquoteState{};
      }
      const auto quoted = Trim(std::string_view(line).substr(1));
      const auto html = options_.link_blockquotes ? RenderInline(quoted) : EscapeHtml(quoted);
      parts_.push_back("  <p>" + html + "</p>");
      return;
    }

    bool ordered = false;
    std::string item;
    if (MatchListItem(line, ordered, item)) {
      const auto* list = std::get_if<ListState>(&state_);
      if (list == nullptr || list->ordered != ordered) {
        Close();
        parts_.emplace_back(ordered ? "<ol>" : "<ul>");
        state_ = ListState{ordered};
      }
      parts_.push_back("  <li>" + RenderInline(item) + "</li>");
      return;
    }

    if (!std::holds_alternative<ParagraphState>(state_)) {
      Close();
      state_ = ParagraphState{};
    }
    std::get<ParagraphState>(state_).lines.push_back(line);
  }

  std::vector<std::string> Finish() {
    Close();
    return std::move(parts_);
  }

 private:
  // Serializes whatever block is open and returns to idle. Closing an idle
  // parser does nothing.
  void Close() {
    ParserState closing = std::move(state_);
    state_ = IdleState{};

    if (std::holds_alternative<BlockquoteState>(closing)) {
      parts_.emplace_back("</blockquote>");
    } else if (const auto* list = std::get_if<ListState>(&closing)) {
      parts_.emplace_back(list->ordered ? "</ol>" : "</ul>");
    } else if (const auto* table = std::get_if<TableState>(&closing)) {
      EmitTable(table->rows);
    } else if (const auto* paragraph = std::get_if<ParagraphState>(&closing)) {
      const auto joined = Trim(text::JoinLines(paragraph->lines, " "));
      if (!joined.empty()) {
        parts_.push_back("<p>" + RenderInline(joined) + "</p>");
      }
    }
  }

  void EmitTable(const std::vector<std::vector<std::string>>& rows) {
    if (rows.empty()) {
      return;
    }
    auto render_row = [](const std::vector<std::string>& cells, std::string_view tag) {
      std::string row = "<tr>";
      for (const auto& cell : cells) {
        row.append("<").append(tag).append(">");
        row.append(RenderInline(cell));
        row.append("</").append(tag).append(">");
      }
      row.append("</tr>");
      return row;
    };

    parts_.emplace_back("<table>");
    parts_.emplace_back("  <thead>");
    parts_.push_back("    " + render_row(rows.front(), "th"));
    parts_.emplace_back("  </thead>");
    if (rows.size() > 1) {
      parts_.emplace_back("  <tbody>");
      for (std::size_t i = 1; i < rows.size(); ++i) {
        parts_.push_back("    " + render_row(rows[i], "td"));
      }
      parts_.emplace_back("  </tbody>");
    }
    parts_.emplace_back("</table>");
  }

  const BlockOptions& options_;
  ParserState state_;
  std::vector<std::string> parts_;
};

}  // namespace

bool IsTableRow(const std::string& line) {
  const auto trimmed = Trim(line);
  return trimmed.size() >= 2 && trimmed.front() == '|' && trimmed.back() == '|';
}

bool IsTableDivider(const std::string& line) {
  bool has_hyphen = false;
  for (const char ch : line) {
    if (ch == '-') {
      has_hyphen = true;
    } else if (ch != ':' && ch != '|' && !IsSpace(ch)) {
      return false;
    }
  }
  return has_hyphen;
}

bool IsHorizontalRule(const std::string& line) {
  char marker = '\0';
  int count = 0;
  for (const char ch : line) {
    if (IsSpace(ch)) {
      continue;
    }
    if (ch != '-' && ch != '*' && ch != '_') {
      return false;
    }
    if (marker != '\0' && ch != marker) {
      return false;
    }
    marker = ch;
    ++count;
  }
  return count >= 3;
}

std::vector<std::string> SplitTableCells(const std::string& row) {
  const auto trimmed = Trim(row);
  const std::string_view inner = std::string_view(trimmed).substr(1, trimmed.size() - 2);
  std::vector<std::string> cells;
  std::size_t start = 0;
  while (true) {
    const auto pipe = inner.find('|', start);
    cells.push_back(Trim(inner.substr(start, pipe == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : pipe - start)));
    if (pipe == std::string_view::npos) {
      break;
    }
    start = pipe + 1;
  }
  return cells;
}

std::vector<std::string> RenderBlockList(const std::vector<std::string>& lines,
                                         const BlockOptions& options) {
  BlockParser parser(options);
  for (const auto& line : lines) {
    parser.Feed(line);
  }
  return parser.Finish();
}

std::string RenderBlocks(const std::string& body, const BlockOptions& options) {
  return text::JoinLines(RenderBlockList(text::SplitLines(body), options));
}

}  // namespace notepress::markdown
