#include "ir_json.hpp"

namespace memomark {

using json = nlohmann::json;
using namespace markdown;

namespace {
    json list_items_to_json(const std::vector<RenderListItem>& items) {
        json arr = json::array();
        for (const auto& item : items) {
            arr.push_back({
                {"content", to_json(item.content)},
                {"indent_level", item.indent_level},
                {"children", list_items_to_json(item.children)}
            });
        }
        return arr;
    }

    json row_to_json(const std::vector<InlineRun>& cells) {
        json arr = json::array();
        for (const auto& cell : cells) {
            arr.push_back(to_json(cell));
        }
        return arr;
    }
}

json to_json(const InlineMatch& match) {
    json j = {
        {"type", to_string(match.kind)},
        {"text", match.text},
        {"start", match.start},
        {"end", match.end}
    };
    if (match.kind == InlineKind::Link || match.kind == InlineKind::Image) {
        j["url"] = match.url;
    }
    return j;
}

json to_json(const InlineRun& run) {
    json arr = json::array();
    for (const auto& segment : run) {
        if (segment.is_literal()) {
            arr.push_back({{"type", "text"}, {"text", segment.literal}});
        } else {
            arr.push_back(to_json(*segment.match));
        }
    }
    return arr;
}

json to_json(const RenderBlock& block) {
    json j = {
        {"type", to_string(block.type)},
        {"start_line", block.start_line},
        {"end_line", block.end_line}
    };

    switch (block.type) {
        case BlockType::Heading:
            j["level"] = block.level;
            j["content"] = to_json(block.content);
            break;

        case BlockType::Paragraph:
        case BlockType::Blockquote:
            j["content"] = to_json(block.content);
            break;

        case BlockType::CodeBlock:
            j["language"] = block.language ? json(*block.language) : json(nullptr);
            j["code"] = block.code;
            break;

        case BlockType::Table: {
            j["headers"] = row_to_json(block.headers);
            json rows = json::array();
            for (const auto& row : block.rows) {
                rows.push_back(row_to_json(row));
            }
            j["rows"] = rows;
            break;
        }

        case BlockType::List:
            j["kind"] = block.list_kind == ListKind::Ordered ? "ordered" : "unordered";
            j["items"] = list_items_to_json(block.items);
            break;

        case BlockType::Checklist: {
            json items = json::array();
            for (const auto& item : block.checklist) {
                items.push_back({
                    {"checked", item.checked},
                    {"content", to_json(item.content)}
                });
            }
            j["items"] = items;
            break;
        }

        case BlockType::HorizontalRule:
            break;
    }
    return j;
}

json to_json(const RenderDocument& doc) {
    json blocks = json::array();
    for (const auto& block : doc.blocks) {
        blocks.push_back(to_json(block));
    }
    return {
        {"line_count", doc.line_count},
        {"blocks", blocks}
    };
}

json matches_to_json(const std::vector<InlineMatch>& matches) {
    json arr = json::array();
    for (const auto& m : matches) {
        arr.push_back(to_json(m));
    }
    return arr;
}

} // namespace memomark
