#include "block_parsers.hpp"
#include "text_utils.hpp"

namespace memomark::markdown {

namespace {
    constexpr const char* FENCE = "```";
    constexpr const char* QUOTE_PREFIX = "> ";

    bool is_separator_cell(const std::string& cell) {
        std::string c = trim(cell);
        size_t begin = 0;
        size_t end = c.length();
        if (begin < end && c[begin] == ':') begin++;
        if (end > begin && c[end - 1] == ':') end--;
        if (begin >= end) {
            return false;
        }
        for (size_t i = begin; i < end; i++) {
            if (c[i] != '-') {
                return false;
            }
        }
        return true;
    }

    // Matches "- [ ] text" / "- [x] text" with optional indentation.
    std::optional<ChecklistItem> match_checklist_item(const std::string& line) {
        size_t i = 0;
        while (i < line.length() && (line[i] == ' ' || line[i] == '\t')) {
            i++;
        }
        if (i >= line.length() || line[i] != '-') {
            return std::nullopt;
        }
        i++;

        size_t ws_start = i;
        while (i < line.length() && (line[i] == ' ' || line[i] == '\t')) {
            i++;
        }
        if (i == ws_start) {
            return std::nullopt;
        }

        if (i + 2 >= line.length() || line[i] != '[' || line[i + 2] != ']') {
            return std::nullopt;
        }
        char mark = line[i + 1];
        if (mark != ' ' && mark != 'x') {
            return std::nullopt;
        }
        i += 3;

        ws_start = i;
        while (i < line.length() && (line[i] == ' ' || line[i] == '\t')) {
            i++;
        }
        if (i == ws_start) {
            return std::nullopt;
        }

        ChecklistItem item;
        item.checked = (mark == 'x');
        item.text = line.substr(i);
        return item;
    }
}

bool is_table_row(const std::string& line) {
    std::string t = trim(line);
    return !t.empty() && t.front() == '|' && t.back() == '|';
}

bool is_table_separator(const std::string& line) {
    std::string t = trim(line);
    if (!t.empty() && t.front() == '|') {
        t.erase(0, 1);
    }
    if (!t.empty() && t.back() == '|') {
        t.pop_back();
    }
    if (t.empty()) {
        return false;
    }
    for (const auto& cell : split(t, '|')) {
        if (!is_separator_cell(cell)) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split_table_row(const std::string& line) {
    std::string t = trim(line);
    // Outer pipes; a lone "|" leaves a single empty cell.
    std::string inner = t.length() >= 2 ? t.substr(1, t.length() - 2) : std::string();
    std::vector<std::string> cells = split(inner, '|');
    for (auto& cell : cells) {
        cell = trim(cell);
    }
    return cells;
}

bool is_horizontal_rule(const std::string& line) {
    if (line.length() < 3) {
        return false;
    }
    char marker = line[0];
    if (marker != '-' && marker != '*' && marker != '_') {
        return false;
    }
    for (char c : line) {
        if (c != marker) {
            return false;
        }
    }
    return true;
}

std::optional<BlockNode> parse_code_block(const std::vector<std::string>& lines, size_t index) {
    const std::string& line = lines[index];
    if (!starts_with(line, FENCE)) {
        return std::nullopt;
    }

    std::vector<std::string> code_lines;
    size_t end = index + 1;
    while (end < lines.size() && !starts_with(lines[end], FENCE)) {
        code_lines.push_back(lines[end]);
        end++;
    }

    if (end >= lines.size()) {
        return std::nullopt;  // Unterminated fence
    }

    BlockNode node;
    node.type = BlockType::CodeBlock;
    node.start_line = index;
    node.end_line = end;
    std::string language = trim(line.substr(3));
    if (!language.empty()) {
        node.language = language;
    }
    node.content = join_lines(code_lines);
    return node;
}

std::optional<BlockNode> parse_table(const std::vector<std::string>& lines, size_t index) {
    const std::string& line = lines[index];
    if (!is_table_row(line)) {
        return std::nullopt;
    }
    if (index + 1 >= lines.size() || !is_table_separator(lines[index + 1])) {
        return std::nullopt;
    }

    BlockNode node;
    node.type = BlockType::Table;
    node.start_line = index;
    node.headers = split_table_row(line);

    size_t current = index + 2;
    while (current < lines.size() && is_table_row(lines[current])) {
        node.rows.push_back(split_table_row(lines[current]));
        current++;
    }

    node.end_line = current - 1;
    return node;
}

std::optional<BlockNode> parse_heading(const std::vector<std::string>& lines, size_t index) {
    const std::string& line = lines[index];
    if (line.empty() || line[0] != '#') {
        return std::nullopt;
    }

    size_t level = 0;
    while (level < line.length() && line[level] == '#') {
        level++;
    }

    BlockNode node;
    node.type = BlockType::Heading;
    node.start_line = index;
    node.end_line = index;
    node.level = static_cast<int>(level);
    node.text = trim(line.substr(level));
    return node;
}

bool is_checklist_item(const std::string& line) {
    return match_checklist_item(line).has_value();
}

std::optional<BlockNode> parse_checklist(const std::vector<std::string>& lines, size_t index) {
    auto first = match_checklist_item(lines[index]);
    if (!first) {
        return std::nullopt;
    }

    BlockNode node;
    node.type = BlockType::Checklist;
    node.start_line = index;
    node.checklist.push_back(*first);

    size_t current = index + 1;
    while (current < lines.size()) {
        auto item = match_checklist_item(lines[current]);
        if (!item) {
            break;
        }
        node.checklist.push_back(*item);
        current++;
    }

    node.end_line = current - 1;
    return node;
}

std::optional<BlockNode> parse_blockquote(const std::vector<std::string>& lines, size_t index) {
    if (!starts_with(lines[index], QUOTE_PREFIX)) {
        return std::nullopt;
    }

    std::vector<std::string> quoted;
    size_t current = index;
    while (current < lines.size() && starts_with(lines[current], QUOTE_PREFIX)) {
        quoted.push_back(lines[current].substr(2));
        current++;
    }

    BlockNode node;
    node.type = BlockType::Blockquote;
    node.start_line = index;
    node.end_line = current - 1;
    node.text = join_lines(quoted);
    return node;
}

std::optional<BlockNode> parse_horizontal_rule(const std::vector<std::string>& lines, size_t index) {
    if (!is_horizontal_rule(lines[index])) {
        return std::nullopt;
    }

    BlockNode node;
    node.type = BlockType::HorizontalRule;
    node.start_line = index;
    node.end_line = index;
    return node;
}

const std::vector<BlockParser>& block_parsers() {
    static const std::vector<BlockParser> parsers = {
        parse_code_block,
        parse_table,
        parse_heading,
        parse_checklist,
        parse_list,
        parse_blockquote,
        parse_horizontal_rule
    };
    return parsers;
}

} // namespace memomark::markdown
