#pragma once

#include <string>
#include <vector>

namespace notepress::markdown {

struct BlockOptions {
  // Blockquote lines are only HTML-escaped unless this is set, in which case
  // they get the same link handling as paragraphs and list items.
  bool link_blockquotes = false;
};

// Renders the supported block subset (headings, blockquotes, single-level
// lists, rules, paragraphs and pipe tables) to HTML blocks, one string each.
std::vector<std::string> RenderBlockList(const std::vector<std::string>& lines,
                                         const BlockOptions& options = {});

// RenderBlockList over the lines of |body|, joined with newlines.
std::string RenderBlocks(const std::string& body, const BlockOptions& options = {});

bool IsTableRow(const std::string& line);
bool IsTableDivider(const std::string& line);
bool IsHorizontalRule(const std::string& line);
std::vector<std::string> SplitTableCells(const std::string& row);

}  // namespace notepress::markdown
