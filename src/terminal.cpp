#include "terminal.hpp"

#include <unistd.h>

#include <cstdlib>
#include <cstring>

namespace memomark {
namespace terminal {

namespace {
    constexpr char ESC = '\033';
    constexpr char BEL = '\007';

    bool is_final_byte(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    // Index one past the escape sequence opened at text[start].
    size_t skip_escape(const std::string& text, size_t start) {
        size_t n = text.size();
        if (start + 1 >= n) {
            return n;
        }

        char kind = text[start + 1];
        size_t i = start + 2;
        if (kind == '[') {
            while (i < n && !is_final_byte(text[i])) {
                ++i;
            }
            return i < n ? i + 1 : n;
        }
        if (kind == ']') {
            for (; i < n; ++i) {
                if (text[i] == BEL) {
                    return i + 1;
                }
                if (text[i] == ESC && i + 1 < n && text[i + 1] == '\\') {
                    return i + 2;
                }
            }
            return n;
        }
        return start + 2;
    }

    // Byte length of the UTF-8 sequence led by b; 1 for stray bytes.
    size_t utf8_length(unsigned char b) {
        if (b >= 0xF0 && b < 0xF8) return 4;
        if (b >= 0xE0) return b < 0xF0 ? 3 : 1;
        if (b >= 0xC0) return 2;
        return 1;
    }
}

bool is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool supports_color() {
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    const char* term = std::getenv("TERM");
    if (term == nullptr || std::strcmp(term, "dumb") == 0) {
        return false;
    }
    return is_tty();
}

int display_width(const std::string& text) {
    int columns = 0;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char b = static_cast<unsigned char>(text[i]);
        if (b == static_cast<unsigned char>(ESC)) {
            i = skip_escape(text, i);
            continue;
        }
        if (b >= 0x80 && b < 0xC0) {
            ++i;  // Continuation byte without a lead
            continue;
        }
        if (b != '\n' && b != '\r') {
            ++columns;
        }
        i += utf8_length(b);
    }
    return columns;
}

std::string strip_ansi(const std::string& text) {
    std::string plain;
    plain.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == ESC) {
            i = skip_escape(text, i);
        } else {
            plain.push_back(text[i++]);
        }
    }
    return plain;
}

std::string redraw_prefix() {
    return "\033[2J\033[H";
}

} // namespace terminal
} // namespace memomark
