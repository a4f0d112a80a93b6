#pragma once

/**
 * Block parsers.
 *
 * Each parser looks at `lines[index]` (and, where it needs to, the lines
 * after it) and either returns a node whose span starts at `index` or
 * declines with std::nullopt. Parsers are stateless and never throw; the
 * document scanner tries them in the order given by block_parsers().
 */

#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace memomark::markdown {

using BlockParser = std::optional<BlockNode> (*)(const std::vector<std::string>& lines,
                                                 std::size_t index);

// Fenced code block. Declines when the fence is never closed.
std::optional<BlockNode> parse_code_block(const std::vector<std::string>& lines, std::size_t index);

// Pipe table. Requires a separator row directly below the header.
std::optional<BlockNode> parse_table(const std::vector<std::string>& lines, std::size_t index);

// '#' heading, single line.
std::optional<BlockNode> parse_heading(const std::vector<std::string>& lines, std::size_t index);

// Run of "- [ ] text" / "- [x] text" lines.
std::optional<BlockNode> parse_checklist(const std::vector<std::string>& lines, std::size_t index);

// Run of "> " lines joined into one text payload.
std::optional<BlockNode> parse_blockquote(const std::vector<std::string>& lines, std::size_t index);

// "---", "***" or "___" (three or more, nothing else on the line).
std::optional<BlockNode> parse_horizontal_rule(const std::vector<std::string>& lines, std::size_t index);

// Ordered or unordered list, see list_parser.hpp.
std::optional<BlockNode> parse_list(const std::vector<std::string>& lines, std::size_t index);

/**
 * Parsers in priority order.
 *
 * Code blocks come first so fenced content is never reinterpreted, tables
 * before anything that could claim their header line, checklists before
 * plain lists.
 */
const std::vector<BlockParser>& block_parsers();

// Returns true for a line shaped like a table row: trimmed, starts and ends with '|'.
bool is_table_row(const std::string& line);

// Returns true for a header separator row such as "|---|:--:|".
bool is_table_separator(const std::string& line);

// Splits a table row into trimmed cells, outer pipes removed.
std::vector<std::string> split_table_row(const std::string& line);

// Returns true for a "- [ ] text" / "- [x] text" line.
bool is_checklist_item(const std::string& line);

// Returns true if the line is a horizontal rule.
bool is_horizontal_rule(const std::string& line);

} // namespace memomark::markdown
