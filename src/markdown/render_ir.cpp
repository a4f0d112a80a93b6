#include "render_ir.hpp"
#include "document.hpp"
#include "inline_scanner.hpp"

namespace memomark::markdown {

namespace {
    RenderListItem emit_list_item(const ListItem& item) {
        RenderListItem out;
        out.content = assemble_inline(item.text);
        out.indent_level = item.indent_level;
        for (const auto& child : item.children) {
            out.children.push_back(emit_list_item(child));
        }
        return out;
    }

    std::vector<InlineRun> emit_row(const std::vector<std::string>& cells) {
        std::vector<InlineRun> row;
        row.reserve(cells.size());
        for (const auto& cell : cells) {
            row.push_back(assemble_inline(cell));
        }
        return row;
    }

    RenderBlock emit_block(const BlockNode& node) {
        RenderBlock block;
        block.type = node.type;
        block.start_line = node.start_line;
        block.end_line = node.end_line;

        switch (node.type) {
            case BlockType::Paragraph:
            case BlockType::Blockquote:
                block.content = assemble_inline(node.text);
                break;

            case BlockType::Heading:
                block.level = node.level;
                block.content = assemble_inline(node.text);
                break;

            case BlockType::CodeBlock:
                block.language = node.language;
                block.code = node.content;
                break;

            case BlockType::Table:
                block.headers = emit_row(node.headers);
                for (const auto& row : node.rows) {
                    block.rows.push_back(emit_row(row));
                }
                break;

            case BlockType::List:
                block.list_kind = node.list_kind;
                for (const auto& item : node.items) {
                    block.items.push_back(emit_list_item(item));
                }
                break;

            case BlockType::Checklist:
                for (const auto& item : node.checklist) {
                    block.checklist.push_back({item.checked, assemble_inline(item.text)});
                }
                break;

            case BlockType::HorizontalRule:
                break;
        }
        return block;
    }
}

RenderDocument emit_render_ir(const Document& doc) {
    RenderDocument out;
    out.line_count = doc.line_count;
    out.blocks.reserve(doc.blocks.size());
    for (const auto& node : doc.blocks) {
        out.blocks.push_back(emit_block(node));
    }
    return out;
}

RenderDocument render_ir_from_text(const std::string& text) {
    return emit_render_ir(parse(text));
}

} // namespace memomark::markdown
