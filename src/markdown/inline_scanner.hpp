#pragma once

/**
 * Inline span scanning and reassembly.
 *
 * Three scanners run independently over one text unit (a paragraph, a
 * heading, a table cell, a list item, a quote body, a checklist item):
 *
 *   scan_images  ![alt](image://file) and ![alt](cache://key)
 *   scan_links   [text](url) and bare http://, https://, ftp://, www. links
 *   scan_styles  **bold**, *italic*, ~~strikethrough~~, `code`
 *
 * Each scanner returns matches of its own category that do not overlap one
 * another. parse_inline() merges the three results into one sorted,
 * non-overlapping sequence; assemble_inline() interleaves those matches with
 * the literal text between them, sliced from the original string.
 *
 * Overlaps between categories are settled by precedence: code, image, link,
 * bold, strikethrough, italic. A match overlapping one of higher precedence
 * is dropped, so inline code always wins inside its own span.
 */

#include "types.hpp"
#include <string>
#include <vector>

namespace memomark::markdown {

// Image references using an allowed scheme.
std::vector<InlineMatch> scan_images(const std::string& text);

// Markdown links and bare autolinks, sorted by start offset.
std::vector<InlineMatch> scan_links(const std::string& text);

// Emphasis and code spans, sorted by start offset.
std::vector<InlineMatch> scan_styles(const std::string& text);

/**
 * All matches of all scanners, stable-sorted by start offset, before
 * cross-category overlaps are settled.
 */
std::vector<InlineMatch> scan_inline(const std::string& text);

/**
 * Drops matches that overlap a match of higher precedence.
 * Input order does not matter; the result is sorted by start offset.
 */
std::vector<InlineMatch> resolve_overlaps(const std::vector<InlineMatch>& matches);

// scan_inline() followed by resolve_overlaps().
std::vector<InlineMatch> parse_inline(const std::string& text);

/**
 * Splits text into literal segments and matches, in source order.
 * Text with no matches yields a single literal segment; empty text yields
 * no segments.
 */
std::vector<InlineSegment> assemble_inline(const std::string& text);

// Precedence used by resolve_overlaps(); lower value wins.
int inline_precedence(InlineKind kind);

} // namespace memomark::markdown
