#pragma once

#include "markdown/render_ir.hpp"
#include <string>
#include <vector>

namespace memomark {

class ImageCache;

/**
 * Renders the render IR as ANSI-formatted terminal text.
 *
 * Block output:
 *   - Headings in bold, colored by level (levels above 6 render as 6)
 *   - Code blocks in a box with the language in the top border
 *   - Tables with box-drawing borders and bold headers
 *   - Lists with bullets or numbers, colors cycling with depth
 *   - Checklists with ☑/☐, checked items struck through
 *   - Quotes behind a "│ " gutter, horizontal rules as a dim line
 *
 * Inline output uses bold, italic, strikethrough, cyan code and OSC 8
 * hyperlinks. Images cannot be shown in a terminal; they render as a
 * placeholder carrying the alt text and the cache status (loading, ready,
 * failed). Lookups go through the image cache, so rendering a memo starts
 * the fetches of the images it references.
 *
 * With colors disabled the output contains no escape sequences at all.
 *
 * Usage:
 *   TerminalRenderer renderer(true, &cache);
 *   std::cout << renderer.render(markdown::render_ir_from_text(memo));
 */
class TerminalRenderer {
public:
    /**
     * @param colors_enabled Whether to emit ANSI escape codes
     * @param images Cache used to resolve image references; may be null,
     *        in which case images render as plain placeholders
     */
    explicit TerminalRenderer(bool colors_enabled = true, ImageCache* images = nullptr);

    // Renders all blocks, separated by blank lines.
    std::string render(const markdown::RenderDocument& doc) const;

    // Renders one block, ending with a newline.
    std::string render_block(const markdown::RenderBlock& block) const;

    /**
     * Renders an inline run. `base` is the style active around the run; it is
     * restored after each styled span.
     */
    std::string render_inline(const markdown::InlineRun& run, const std::string& base = "") const;

private:
    bool colors_enabled_;
    ImageCache* images_;

    // ANSI formatting helpers
    std::string ansi(const char* code) const;
    std::string styled(const char* code, const std::string& text, const std::string& base) const;
    std::string link(const std::string& text, const std::string& url, const std::string& base) const;
    std::string image(const markdown::InlineMatch& match, const std::string& base) const;

    // Block helpers
    std::string heading(const markdown::InlineRun& content, int level) const;
    std::string code_block(const std::string& code, const std::string& lang) const;
    std::string blockquote(const markdown::InlineRun& content) const;
    std::string list(const std::vector<markdown::RenderListItem>& items, bool ordered, int depth) const;
    std::string checklist(const std::vector<markdown::RenderCheckItem>& items) const;
    std::string table(const std::vector<markdown::InlineRun>& headers,
                      const std::vector<std::vector<markdown::InlineRun>>& rows) const;
    std::string horizontal_rule() const;
};

} // namespace memomark
