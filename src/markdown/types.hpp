#pragma once

/**
 * Markdown document model.
 *
 * These types describe a parsed memo: the block sequence produced by the
 * document scanner and the inline matches found inside free-text payloads.
 * They carry no rendering information.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace memomark::markdown {

/**
 * Kind of a block-level node.
 */
enum class BlockType {
    CodeBlock,
    Table,
    Heading,
    List,
    Blockquote,
    HorizontalRule,
    Checklist,
    Paragraph
};

/**
 * Kind of a list run, fixed by its first item.
 */
enum class ListKind {
    Unordered,
    Ordered
};

/**
 * A list item with its nested children.
 */
struct ListItem {
    std::string text;
    int indent_level = 0;
    std::vector<ListItem> children;
};

/**
 * One list line before nesting is applied.
 */
struct FlatListItem {
    std::string text;
    int indent_level = 0;
};

struct ChecklistItem {
    std::string text;
    bool checked = false;
};

/**
 * A block-level node.
 *
 * Only the fields relevant to `type` are populated:
 *   CodeBlock      language, content
 *   Table          headers, rows
 *   Heading        level, text
 *   List           list_kind, items
 *   Blockquote     text
 *   HorizontalRule (none)
 *   Checklist      checklist
 *   Paragraph      text
 */
struct BlockNode {
    BlockType type = BlockType::Paragraph;
    std::size_t start_line = 0;  // First line of the span (inclusive, 0-based).
    std::size_t end_line = 0;    // Last line of the span (inclusive).

    std::string text;
    int level = 0;

    std::optional<std::string> language;
    std::string content;

    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;

    ListKind list_kind = ListKind::Unordered;
    std::vector<ListItem> items;

    std::vector<ChecklistItem> checklist;
};

/**
 * Ordered block sequence of one memo.
 *
 * Spans are contiguous, non-overlapping and cover every line of the source.
 */
struct Document {
    std::vector<BlockNode> blocks;
    std::size_t line_count = 0;
};

/**
 * Kind of an inline match.
 */
enum class InlineKind {
    Image,
    Link,
    Bold,
    Italic,
    Strikethrough,
    Code
};

/**
 * A recognized span inside a text unit.
 *
 * `start` and `end` are inclusive byte offsets into the original text.
 * For images `text` is the alt text and `url` the full `scheme://ref`.
 */
struct InlineMatch {
    InlineKind kind = InlineKind::Bold;
    std::string text;
    std::string url;
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t length() const { return end - start + 1; }
};

/**
 * One piece of a reassembled text unit: either literal text or a match.
 */
struct InlineSegment {
    std::string literal;
    std::optional<InlineMatch> match;

    bool is_literal() const { return !match.has_value(); }
};

// Returns a lowercase name for the kind ("codeblock", "table", ...).
const char* to_string(BlockType type);

// Returns a lowercase name for the kind ("image", "link", "bold", ...).
const char* to_string(InlineKind kind);

} // namespace memomark::markdown
