#include "terminal_renderer.hpp"
#include "config.hpp"
#include "image_cache.hpp"
#include "terminal.hpp"
#include "verbose.hpp"
#include "markdown/text_utils.hpp"
#include <algorithm>

namespace memomark {

using namespace markdown;

namespace {
    // ANSI escape codes
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* ITALIC = "\033[3m";
    constexpr const char* UNDERLINE = "\033[4m";
    constexpr const char* STRIKE = "\033[9m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";

    constexpr size_t MIN_CODE_BOX_WIDTH = 40;

    std::string repeat(const std::string& s, size_t n) {
        std::string result;
        result.reserve(s.length() * n);
        for (size_t i = 0; i < n; i++) {
            result += s;
        }
        return result;
    }

    size_t width_of(const std::string& text) {
        return static_cast<size_t>(terminal::display_width(text));
    }
}

TerminalRenderer::TerminalRenderer(bool colors_enabled, ImageCache* images)
    : colors_enabled_(colors_enabled)
    , images_(images) {}

std::string TerminalRenderer::render(const RenderDocument& doc) const {
    std::string result;
    for (size_t i = 0; i < doc.blocks.size(); i++) {
        if (i > 0) {
            result += "\n";
        }
        result += render_block(doc.blocks[i]);
    }
    return result;
}

std::string TerminalRenderer::render_block(const RenderBlock& block) const {
    switch (block.type) {
        case BlockType::Heading:
            return heading(block.content, block.level);
        case BlockType::Paragraph:
            return render_inline(block.content) + "\n";
        case BlockType::CodeBlock:
            return code_block(block.code, block.language.value_or(""));
        case BlockType::Blockquote:
            return blockquote(block.content);
        case BlockType::List:
            return list(block.items, block.list_kind == ListKind::Ordered, 0);
        case BlockType::Checklist:
            return checklist(block.checklist);
        case BlockType::Table:
            return table(block.headers, block.rows);
        case BlockType::HorizontalRule:
            return horizontal_rule();
    }
    return "";
}

std::string TerminalRenderer::render_inline(const InlineRun& run, const std::string& base) const {
    std::string result;
    for (const auto& segment : run) {
        if (segment.is_literal()) {
            result += segment.literal;
            continue;
        }

        const InlineMatch& m = *segment.match;
        switch (m.kind) {
            case InlineKind::Bold:
                result += styled(BOLD, m.text, base);
                break;
            case InlineKind::Italic:
                result += styled(ITALIC, m.text, base);
                break;
            case InlineKind::Strikethrough:
                result += styled(STRIKE, m.text, base);
                break;
            case InlineKind::Code:
                result += styled(CYAN, "`" + m.text + "`", base);
                break;
            case InlineKind::Link:
                result += link(m.text, m.url, base);
                break;
            case InlineKind::Image:
                result += image(m, base);
                break;
        }
    }
    return result;
}

std::string TerminalRenderer::ansi(const char* code) const {
    return colors_enabled_ ? code : "";
}

std::string TerminalRenderer::styled(const char* code, const std::string& text,
                                     const std::string& base) const {
    if (!colors_enabled_) {
        return text;
    }
    return code + text + RESET + base;
}

std::string TerminalRenderer::link(const std::string& text, const std::string& url,
                                   const std::string& base) const {
    // OSC 8 hyperlinks; terminals without support show the styled text
    if (colors_enabled_) {
        return "\033]8;;" + url + "\033\\" +
               UNDERLINE + BLUE + text + RESET + base +
               "\033]8;;\033\\";
    }
    if (text == url) {
        return text;
    }
    return text + " <" + url + ">";
}

std::string TerminalRenderer::image(const InlineMatch& match, const std::string& base) const {
    std::string label = match.text.empty() ? match.url : match.text;

    if (!images_) {
        return styled(MAGENTA, "[image: " + label + "]", base);
    }

    ImageLookup found = images_->lookup(match.url);
    switch (found.status) {
        case ImageStatus::Loading:
            return styled(DIM, "[loading image: " + label + "]", base);
        case ImageStatus::Ready:
            return styled(MAGENTA, "[image: " + label + ", " +
                          std::to_string(found.bytes ? found.bytes->size() : 0) + " bytes]", base);
        case ImageStatus::Failed:
            break;
    }

    verbose_err("Render", "Image " + match.url + " unavailable: " + found.error);
    return styled(RED, "[image unavailable: " + label + "]", base);
}

std::string TerminalRenderer::heading(const InlineRun& content, int level) const {
    level = std::max(1, std::min(level, MAX_HEADING_LEVEL));

    const char* color;
    switch (level) {
        case 1: color = GREEN; break;
        case 2: color = BLUE; break;
        case 3: color = CYAN; break;
        default: color = MAGENTA; break;
    }

    std::string base = ansi(BOLD) + ansi(color);
    std::string prefix = std::string(level, '#') + " ";
    return base + prefix + render_inline(content, base) + ansi(RESET) + "\n";
}

std::string TerminalRenderer::code_block(const std::string& code, const std::string& lang) const {
    std::vector<std::string> lines = split_lines(code);

    size_t max_line_len = 0;
    for (const auto& line : lines) {
        max_line_len = std::max(max_line_len, width_of(line));
    }

    // Box is wide enough for the longest line and the language label
    size_t label_len = lang.empty() ? 0 : lang.length() + 3;  // "─[lang]"
    size_t box_width = std::max({MIN_CODE_BOX_WIDTH, max_line_len + 4, label_len + 10});

    // ┌─[lang]──────┐
    std::string result = ansi(DIM) + "┌";
    size_t top_fill = box_width - 2;
    if (!lang.empty()) {
        result += "─[" + ansi(RESET) + ansi(YELLOW) + lang + ansi(RESET) + ansi(DIM) + "]";
        top_fill -= label_len;
    }
    result += repeat("─", top_fill) + "┐" + ansi(RESET) + "\n";

    for (const auto& line : lines) {
        size_t padding = box_width - 4 - width_of(line);  // "│ " and " │"
        result += ansi(DIM) + "│" + ansi(RESET) + " " + ansi(GREEN) + line + ansi(RESET);
        result += std::string(padding, ' ') + ansi(DIM) + " │" + ansi(RESET) + "\n";
    }

    // └─────────────┘
    result += ansi(DIM) + "└" + repeat("─", box_width - 2) + "┘" + ansi(RESET) + "\n";
    return result;
}

std::string TerminalRenderer::blockquote(const InlineRun& content) const {
    std::string base = ansi(ITALIC);
    std::string result;
    for (const auto& line : split_lines(render_inline(content, base))) {
        result += ansi(DIM) + "│ " + ansi(RESET) + base + line + ansi(RESET) + "\n";
    }
    return result;
}

std::string TerminalRenderer::list(const std::vector<RenderListItem>& items,
                                   bool ordered, int depth) const {
    // Colors cycle based on nesting depth
    static const char* bullet_colors[] = {CYAN, YELLOW, GREEN, MAGENTA, BLUE};
    const char* bullet_color = bullet_colors[depth % 5];

    std::string result;
    int number = 1;
    for (const auto& item : items) {
        std::string prefix = "  " + std::string(depth * 2, ' ');
        if (ordered) {
            prefix += ansi(bullet_color) + std::to_string(number++) + "." + ansi(RESET) + " ";
        } else {
            prefix += ansi(bullet_color) + "●" + ansi(RESET) + " ";
        }
        result += prefix + render_inline(item.content) + "\n";
        result += list(item.children, ordered, depth + 1);
    }
    return result;
}

std::string TerminalRenderer::checklist(const std::vector<RenderCheckItem>& items) const {
    std::string result;
    for (const auto& item : items) {
        if (item.checked) {
            std::string base = ansi(DIM) + ansi(STRIKE);
            result += "  " + ansi(GREEN) + "☑" + ansi(RESET) + " " +
                      base + render_inline(item.content, base) + ansi(RESET) + "\n";
        } else {
            result += "  ☐ " + render_inline(item.content) + "\n";
        }
    }
    return result;
}

std::string TerminalRenderer::table(const std::vector<InlineRun>& headers,
                                    const std::vector<std::vector<InlineRun>>& rows) const {
    // Render every cell first so widths account for styling and links
    std::vector<std::vector<std::string>> cells;
    std::vector<std::string> header_cells;
    for (const auto& h : headers) {
        header_cells.push_back(render_inline(h));
    }
    cells.push_back(header_cells);
    for (const auto& row : rows) {
        std::vector<std::string> rendered;
        for (const auto& cell : row) {
            rendered.push_back(render_inline(cell));
        }
        cells.push_back(rendered);
    }

    size_t num_cols = 0;
    for (const auto& row : cells) {
        num_cols = std::max(num_cols, row.size());
    }
    if (num_cols == 0) {
        return "";
    }

    std::vector<size_t> col_widths(num_cols, 1);
    for (const auto& row : cells) {
        for (size_t i = 0; i < row.size(); i++) {
            col_widths[i] = std::max(col_widths[i], width_of(row[i]));
        }
    }

    auto border = [&](const char* left, const char* fill, const char* mid, const char* right) {
        std::string line = ansi(DIM) + left;
        for (size_t i = 0; i < num_cols; i++) {
            line += repeat(fill, col_widths[i] + 2);
            line += (i < num_cols - 1) ? mid : right;
        }
        return line + ansi(RESET) + "\n";
    };

    std::string result = border("┌", "─", "┬", "┐");

    for (size_t row_idx = 0; row_idx < cells.size(); row_idx++) {
        const auto& row = cells[row_idx];
        bool is_header = (row_idx == 0);

        result += ansi(DIM) + "│" + ansi(RESET);
        for (size_t col = 0; col < num_cols; col++) {
            std::string cell = col < row.size() ? row[col] : "";
            size_t padding = col_widths[col] - width_of(cell);
            result += " ";
            if (is_header) {
                result += ansi(BOLD) + cell + ansi(RESET);
            } else {
                result += cell;
            }
            result += std::string(padding, ' ') + " " + ansi(DIM) + "│" + ansi(RESET);
        }
        result += "\n";

        if (is_header) {
            result += border("├", "═", "╪", "┤");
        } else if (row_idx < cells.size() - 1) {
            result += border("├", "─", "┼", "┤");
        }
    }

    result += border("└", "─", "┴", "┘");
    return result;
}

std::string TerminalRenderer::horizontal_rule() const {
    return ansi(DIM) + repeat("─", 40) + ansi(RESET) + "\n";
}

} // namespace memomark
