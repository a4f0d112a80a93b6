#include "text_utils.hpp"

namespace memomark::markdown {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.length() && is_space(text[start])) {
        start++;
    }
    size_t end = text.length();
    while (end > start && is_space(text[end - 1])) {
        end--;
    }
    return text.substr(start, end - start);
}

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.length(), prefix) == 0;
}

std::vector<std::string> split_lines(const std::string& text) {
    return split(text, '\n');
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string result;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (true) {
        size_t next = text.find(sep, pos);
        if (next == std::string::npos) {
            parts.push_back(text.substr(pos));
            break;
        }
        parts.push_back(text.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

} // namespace memomark::markdown
