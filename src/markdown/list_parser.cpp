#include "list_parser.hpp"
#include "block_parsers.hpp"
#include "text_utils.hpp"
#include <utility>

namespace memomark::markdown {

namespace {
    size_t skip_indent(const std::string& line, size_t i = 0) {
        while (i < line.length() && (line[i] == ' ' || line[i] == '\t')) {
            i++;
        }
        return i;
    }

    // Position of the item text after "- " or "N. ", or npos.
    size_t item_text_start(const std::string& line, ListKind kind) {
        size_t i = skip_indent(line);
        if (i >= line.length()) {
            return std::string::npos;
        }

        if (kind == ListKind::Unordered) {
            if (line[i] != '-') {
                return std::string::npos;
            }
            i++;
        } else {
            size_t digits = i;
            while (i < line.length() && line[i] >= '0' && line[i] <= '9') {
                i++;
            }
            if (i == digits || i >= line.length() || line[i] != '.') {
                return std::string::npos;
            }
            i++;
        }

        size_t text_start = skip_indent(line, i);
        if (text_start == i) {
            return std::string::npos;  // Marker must be followed by whitespace
        }
        return text_start;
    }
}

int indent_level(const std::string& line) {
    int tabs = 0;
    int spaces = 0;
    for (char c : line) {
        if (c == '\t') {
            tabs++;
        } else if (c == ' ') {
            spaces++;
        } else {
            break;
        }
    }
    // tabs + spaces / 2, floored
    return tabs + spaces / 2;
}

std::optional<FlatListItem> parse_list_item(const std::string& line, ListKind kind) {
    size_t start = item_text_start(line, kind);
    if (start == std::string::npos || start >= line.length()) {
        return std::nullopt;
    }

    FlatListItem item;
    item.text = line.substr(start);
    item.indent_level = indent_level(line);
    return item;
}

std::optional<ListKind> detect_list_kind(const std::string& line) {
    if (parse_list_item(line, ListKind::Unordered)) {
        return ListKind::Unordered;
    }
    if (parse_list_item(line, ListKind::Ordered)) {
        return ListKind::Ordered;
    }
    return std::nullopt;
}

std::vector<ListItem> build_list_tree(const std::vector<FlatListItem>& flat) {
    std::vector<ListItem> roots;

    // (node, level). A node's address stays valid while it is on the stack:
    // only the container of the current top grows, and anything that was
    // above the top in that container has already been popped.
    std::vector<std::pair<ListItem*, int>> stack;

    for (const auto& entry : flat) {
        while (!stack.empty() && stack.back().second >= entry.indent_level) {
            stack.pop_back();
        }

        ListItem item;
        item.text = entry.text;
        item.indent_level = entry.indent_level;

        std::vector<ListItem>& siblings = stack.empty() ? roots : stack.back().first->children;
        siblings.push_back(std::move(item));
        stack.emplace_back(&siblings.back(), entry.indent_level);
    }

    return roots;
}

std::optional<BlockNode> parse_list(const std::vector<std::string>& lines, size_t index) {
    auto kind = detect_list_kind(lines[index]);
    if (!kind || is_checklist_item(lines[index])) {
        return std::nullopt;
    }

    std::vector<FlatListItem> flat;
    size_t current = index;
    while (current < lines.size()) {
        // A checklist line ends the run and is left for the checklist parser.
        if (is_checklist_item(lines[current])) {
            break;
        }
        auto item = parse_list_item(lines[current], *kind);
        if (item) {
            flat.push_back(*item);
            current++;
            continue;
        }

        // One blank line may separate two items of the same run.
        if (is_blank(lines[current]) && current + 1 < lines.size() &&
            !is_checklist_item(lines[current + 1]) &&
            parse_list_item(lines[current + 1], *kind)) {
            current++;
            continue;
        }
        break;
    }

    BlockNode node;
    node.type = BlockType::List;
    node.start_line = index;
    node.end_line = current - 1;
    node.list_kind = *kind;
    node.items = build_list_tree(flat);
    return node;
}

} // namespace memomark::markdown
