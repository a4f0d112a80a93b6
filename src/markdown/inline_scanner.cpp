#include "inline_scanner.hpp"
#include "text_utils.hpp"
#include "../config.hpp"
#include <algorithm>
#include <cctype>
#include <optional>

namespace memomark::markdown {

namespace {
    bool by_start(const InlineMatch& a, const InlineMatch& b) {
        return a.start < b.start;
    }

    bool overlaps(const InlineMatch& a, const InlineMatch& b) {
        return a.start <= b.end && b.start <= a.end;
    }

    // Characters that end a bare URL.
    bool is_url_char(char c) {
        if (is_space(c)) {
            return false;
        }
        switch (c) {
            case '<': case '>': case '"': case '{': case '}':
            case '|': case '\\': case '^': case '`': case '[': case ']':
                return false;
            default:
                return true;
        }
    }

    // ![alt](scheme://ref) starting at pos (text[pos] == '!').
    std::optional<InlineMatch> match_image_at(const std::string& text, size_t pos) {
        size_t alt_start = pos + 2;
        size_t close = text.find(']', alt_start);
        if (close == std::string::npos || close + 1 >= text.length() || text[close + 1] != '(') {
            return std::nullopt;
        }

        size_t url_start = close + 2;
        bool scheme_ok = false;
        for (const char* scheme : IMAGE_SCHEMES) {
            std::string prefix = std::string(scheme) + "://";
            if (text.compare(url_start, prefix.length(), prefix) == 0) {
                size_t ref_start = url_start + prefix.length();
                scheme_ok = ref_start < text.length() && text[ref_start] != ')';
                break;
            }
        }
        if (!scheme_ok) {
            return std::nullopt;
        }

        size_t paren = text.find(')', url_start);
        if (paren == std::string::npos) {
            return std::nullopt;
        }

        InlineMatch m;
        m.kind = InlineKind::Image;
        m.text = text.substr(alt_start, close - alt_start);
        m.url = text.substr(url_start, paren - url_start);
        m.start = pos;
        m.end = paren;
        return m;
    }

    // [text](url) starting at pos (text[pos] == '[').
    std::optional<InlineMatch> match_markdown_link_at(const std::string& text, size_t pos) {
        size_t close = text.find(']', pos + 1);
        if (close == std::string::npos || close == pos + 1) {
            return std::nullopt;
        }
        if (close + 1 >= text.length() || text[close + 1] != '(') {
            return std::nullopt;
        }
        size_t paren = text.find(')', close + 2);
        if (paren == std::string::npos || paren == close + 2) {
            return std::nullopt;
        }

        InlineMatch m;
        m.kind = InlineKind::Link;
        m.text = text.substr(pos + 1, close - pos - 1);
        m.url = text.substr(close + 2, paren - close - 2);
        m.start = pos;
        m.end = paren;
        return m;
    }

    // Bare URL starting at pos, if one of the autolink prefixes begins there.
    std::optional<InlineMatch> match_autolink_at(const std::string& text, size_t pos) {
        for (const char* prefix : AUTOLINK_PREFIXES) {
            std::string p(prefix);
            if (text.compare(pos, p.length(), p) != 0) {
                continue;
            }

            bool bare_host = (p == "www.");
            if (bare_host && pos > 0 && std::isalnum(static_cast<unsigned char>(text[pos - 1]))) {
                return std::nullopt;
            }

            size_t end = pos + p.length();
            while (end < text.length() && is_url_char(text[end])) {
                end++;
            }
            if (end == pos + p.length()) {
                return std::nullopt;  // Prefix only
            }

            InlineMatch m;
            m.kind = InlineKind::Link;
            m.text = text.substr(pos, end - pos);
            m.url = bare_host ? "http://" + m.text : m.text;
            m.start = pos;
            m.end = end - 1;
            return m;
        }
        return std::nullopt;
    }

    // open + body + close, where the body is a non-empty run without `stop`.
    std::optional<InlineMatch> match_delimited_at(const std::string& text, size_t pos,
                                                  const std::string& delim, char stop,
                                                  InlineKind kind) {
        if (text.compare(pos, delim.length(), delim) != 0) {
            return std::nullopt;
        }
        size_t body_start = pos + delim.length();
        size_t body_end = body_start;
        while (body_end < text.length() && text[body_end] != stop) {
            body_end++;
        }
        if (body_end == body_start || text.compare(body_end, delim.length(), delim) != 0) {
            return std::nullopt;
        }

        InlineMatch m;
        m.kind = kind;
        m.text = text.substr(body_start, body_end - body_start);
        m.start = pos;
        m.end = body_end + delim.length() - 1;
        return m;
    }

    // **body**, the body running to the next "**".
    std::optional<InlineMatch> match_bold_at(const std::string& text, size_t pos) {
        if (text.compare(pos, 2, "**") != 0) {
            return std::nullopt;
        }
        size_t close = text.find("**", pos + 3);
        if (close == std::string::npos) {
            return std::nullopt;
        }

        InlineMatch m;
        m.kind = InlineKind::Bold;
        m.text = text.substr(pos + 2, close - pos - 2);
        m.start = pos;
        m.end = close + 1;
        return m;
    }
}

std::vector<InlineMatch> scan_images(const std::string& text) {
    std::vector<InlineMatch> matches;
    size_t pos = 0;
    while ((pos = text.find("![", pos)) != std::string::npos) {
        auto m = match_image_at(text, pos);
        if (m) {
            pos = m->end + 1;
            matches.push_back(std::move(*m));
        } else {
            pos++;
        }
    }
    return matches;
}

std::vector<InlineMatch> scan_links(const std::string& text) {
    std::vector<InlineMatch> matches;

    size_t pos = 0;
    while ((pos = text.find('[', pos)) != std::string::npos) {
        auto m = match_markdown_link_at(text, pos);
        if (m) {
            pos = m->end + 1;
            matches.push_back(std::move(*m));
        } else {
            pos++;
        }
    }

    // Bare URLs are dropped when they start inside a markdown link or image.
    std::vector<InlineMatch> claimed = matches;
    for (auto& image : scan_images(text)) {
        claimed.push_back(std::move(image));
    }

    pos = 0;
    while (pos < text.length()) {
        auto m = match_autolink_at(text, pos);
        if (!m) {
            pos++;
            continue;
        }
        pos = m->end + 1;

        bool inside = std::any_of(claimed.begin(), claimed.end(), [&m](const InlineMatch& c) {
            return m->start >= c.start && m->start <= c.end;
        });
        if (!inside) {
            matches.push_back(std::move(*m));
        }
    }

    std::stable_sort(matches.begin(), matches.end(), by_start);
    return matches;
}

std::vector<InlineMatch> scan_styles(const std::string& text) {
    std::vector<InlineMatch> matches;

    size_t pos = 0;
    while ((pos = text.find("**", pos)) != std::string::npos) {
        auto m = match_bold_at(text, pos);
        if (!m) {
            break;  // No closing "**" anywhere further on
        }
        pos = m->end + 1;
        matches.push_back(std::move(*m));
    }
    std::vector<InlineMatch> bold = matches;

    // Italics never start inside a bold span, so emphasis nested in bold is
    // suppressed and a bold's closing "**" cannot open an italic.
    pos = 0;
    while ((pos = text.find('*', pos)) != std::string::npos) {
        auto enclosing = std::find_if(bold.begin(), bold.end(), [pos](const InlineMatch& b) {
            return pos >= b.start && pos <= b.end;
        });
        if (enclosing != bold.end()) {
            pos = enclosing->end + 1;
            continue;
        }

        auto m = match_delimited_at(text, pos, "*", '*', InlineKind::Italic);
        if (!m) {
            pos++;
            continue;
        }
        pos = m->end + 1;
        matches.push_back(std::move(*m));
    }

    pos = 0;
    while ((pos = text.find("~~", pos)) != std::string::npos) {
        auto m = match_delimited_at(text, pos, "~~", '~', InlineKind::Strikethrough);
        if (m) {
            pos = m->end + 1;
            matches.push_back(std::move(*m));
        } else {
            pos++;
        }
    }

    pos = 0;
    while ((pos = text.find('`', pos)) != std::string::npos) {
        auto m = match_delimited_at(text, pos, "`", '`', InlineKind::Code);
        if (m) {
            pos = m->end + 1;
            matches.push_back(std::move(*m));
        } else {
            pos++;
        }
    }

    std::stable_sort(matches.begin(), matches.end(), by_start);
    return matches;
}

std::vector<InlineMatch> scan_inline(const std::string& text) {
    std::vector<InlineMatch> all = scan_images(text);
    for (auto& m : scan_links(text)) {
        all.push_back(std::move(m));
    }
    for (auto& m : scan_styles(text)) {
        all.push_back(std::move(m));
    }
    std::stable_sort(all.begin(), all.end(), by_start);
    return all;
}

int inline_precedence(InlineKind kind) {
    switch (kind) {
        case InlineKind::Code:          return 0;
        case InlineKind::Image:         return 1;
        case InlineKind::Link:          return 2;
        case InlineKind::Bold:          return 3;
        case InlineKind::Strikethrough: return 4;
        case InlineKind::Italic:        return 5;
    }
    return 6;
}

std::vector<InlineMatch> resolve_overlaps(const std::vector<InlineMatch>& matches) {
    std::vector<InlineMatch> candidates = matches;
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const InlineMatch& a, const InlineMatch& b) {
            int pa = inline_precedence(a.kind);
            int pb = inline_precedence(b.kind);
            if (pa != pb) {
                return pa < pb;
            }
            return a.start < b.start;
        });

    std::vector<InlineMatch> accepted;
    for (auto& candidate : candidates) {
        bool clash = std::any_of(accepted.begin(), accepted.end(),
            [&candidate](const InlineMatch& a) { return overlaps(a, candidate); });
        if (!clash) {
            accepted.push_back(std::move(candidate));
        }
    }

    std::sort(accepted.begin(), accepted.end(), by_start);
    return accepted;
}

std::vector<InlineMatch> parse_inline(const std::string& text) {
    return resolve_overlaps(scan_inline(text));
}

std::vector<InlineSegment> assemble_inline(const std::string& text) {
    std::vector<InlineSegment> segments;
    size_t pos = 0;

    for (auto& m : parse_inline(text)) {
        if (m.start > pos) {
            segments.push_back({text.substr(pos, m.start - pos), std::nullopt});
        }
        pos = m.end + 1;
        segments.push_back({std::string(), std::move(m)});
    }

    if (pos < text.length()) {
        segments.push_back({text.substr(pos), std::nullopt});
    }
    return segments;
}

} // namespace memomark::markdown
