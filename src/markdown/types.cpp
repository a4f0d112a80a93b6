#include "types.hpp"

namespace memomark::markdown {

const char* to_string(BlockType type) {
    switch (type) {
        case BlockType::CodeBlock:      return "codeblock";
        case BlockType::Table:          return "table";
        case BlockType::Heading:        return "heading";
        case BlockType::List:           return "list";
        case BlockType::Blockquote:     return "blockquote";
        case BlockType::HorizontalRule: return "hr";
        case BlockType::Checklist:      return "checklist";
        case BlockType::Paragraph:      return "paragraph";
    }
    return "unknown";
}

const char* to_string(InlineKind kind) {
    switch (kind) {
        case InlineKind::Image:         return "image";
        case InlineKind::Link:          return "link";
        case InlineKind::Bold:          return "bold";
        case InlineKind::Italic:        return "italic";
        case InlineKind::Strikethrough: return "strikethrough";
        case InlineKind::Code:          return "code";
    }
    return "unknown";
}

} // namespace memomark::markdown
