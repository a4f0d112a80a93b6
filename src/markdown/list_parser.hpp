#pragma once

/**
 * List recognition and nesting.
 *
 * A list run is a sequence of item lines of one kind, fixed by the first
 * item: "- text" for unordered lists, "12. text" for ordered ones, each
 * optionally indented. Indentation becomes a nesting level (tab = 1 level,
 * space = half a level, floored) and build_list_tree() turns the flat run
 * into a tree.
 *
 * A single blank line inside a run is kept only when the next line is
 * another item of the same kind. Otherwise the run ends before the blank.
 */

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace memomark::markdown {

// Nesting level from the line's leading spaces and tabs.
int indent_level(const std::string& line);

// Parses one item line of the given kind. Returns nullopt for other lines,
// for the other kind, and for items with no text.
std::optional<FlatListItem> parse_list_item(const std::string& line, ListKind kind);

// Returns the kind of the item on this line, if it is one.
std::optional<ListKind> detect_list_kind(const std::string& line);

/**
 * Nests a flat run of items.
 *
 * An item's children are the following items with a strictly greater level,
 * up to the next item whose level is less than or equal to its own. Items
 * that skip levels attach to their nearest shallower ancestor.
 */
std::vector<ListItem> build_list_tree(const std::vector<FlatListItem>& flat);

} // namespace memomark::markdown
