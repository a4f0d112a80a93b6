#pragma once

/**
 * Render IR: the renderer-agnostic form of a parsed memo.
 *
 * Mirrors the block sequence of a Document, with every free-text payload
 * (paragraph, heading, blockquote body, table cell, list item, checklist
 * item) replaced by its assembled inline run. Code block content stays
 * verbatim. Heading levels are passed through unclamped; presentation
 * layers apply their own limit.
 */

#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace memomark::markdown {

// Literal text interleaved with inline matches, in source order.
using InlineRun = std::vector<InlineSegment>;

struct RenderListItem {
    InlineRun content;
    int indent_level = 0;
    std::vector<RenderListItem> children;
};

struct RenderCheckItem {
    bool checked = false;
    InlineRun content;
};

/**
 * One block of the IR. Fields follow BlockNode:
 *   Paragraph, Heading, Blockquote  content (Heading also level)
 *   CodeBlock                       language, code
 *   Table                           headers, rows
 *   List                            list_kind, items
 *   Checklist                       checklist
 */
struct RenderBlock {
    BlockType type = BlockType::Paragraph;
    std::size_t start_line = 0;
    std::size_t end_line = 0;

    InlineRun content;
    int level = 0;

    std::optional<std::string> language;
    std::string code;

    std::vector<InlineRun> headers;
    std::vector<std::vector<InlineRun>> rows;

    ListKind list_kind = ListKind::Unordered;
    std::vector<RenderListItem> items;

    std::vector<RenderCheckItem> checklist;
};

struct RenderDocument {
    std::vector<RenderBlock> blocks;
    std::size_t line_count = 0;
};

// Maps a parsed document to the IR. Pure; never throws on any document
// produced by parse().
RenderDocument emit_render_ir(const Document& doc);

// parse() followed by emit_render_ir().
RenderDocument render_ir_from_text(const std::string& text);

} // namespace memomark::markdown
