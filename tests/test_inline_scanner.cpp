#include <catch2/catch.hpp>
#include "markdown/inline_scanner.hpp"
#include <string>
#include <vector>

using namespace memomark::markdown;

namespace {
    std::vector<InlineKind> kinds(const std::vector<InlineMatch>& matches) {
        std::vector<InlineKind> out;
        for (const auto& m : matches) {
            out.push_back(m.kind);
        }
        return out;
    }
}

// ============================================================================
// Styles
// ============================================================================

TEST_CASE("Every style kind with offsets", "[markdown][inline]") {
    std::string text = "Some **bold** and *italic* and ~~gone~~ and `code`";
    auto matches = parse_inline(text);

    REQUIRE(matches.size() == 4);

    REQUIRE(matches[0].kind == InlineKind::Bold);
    REQUIRE(matches[0].text == "bold");
    REQUIRE(matches[0].start == 5);
    REQUIRE(matches[0].end == 12);

    REQUIRE(matches[1].kind == InlineKind::Italic);
    REQUIRE(matches[1].text == "italic");
    REQUIRE(matches[1].start == 18);
    REQUIRE(matches[1].end == 25);

    REQUIRE(matches[2].kind == InlineKind::Strikethrough);
    REQUIRE(matches[2].text == "gone");
    REQUIRE(matches[2].start == 31);
    REQUIRE(matches[2].end == 38);

    REQUIRE(matches[3].kind == InlineKind::Code);
    REQUIRE(matches[3].text == "code");
    REQUIRE(matches[3].start == 44);
    REQUIRE(matches[3].end == 49);
}

TEST_CASE("Bold followed by italic", "[markdown][inline]") {
    auto matches = parse_inline("**bold** and *italic*");

    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0].kind == InlineKind::Bold);
    REQUIRE(matches[1].kind == InlineKind::Italic);
    REQUIRE(matches[1].text == "italic");
    REQUIRE(matches[1].start == 13);
}

TEST_CASE("Several bold spans", "[markdown][inline]") {
    auto matches = parse_inline("**a** and **b**");

    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0].start == 0);
    REQUIRE(matches[0].end == 4);
    REQUIRE(matches[1].start == 10);
    REQUIRE(matches[1].end == 14);
}

TEST_CASE("Emphasis inside bold is not matched", "[markdown][inline]") {
    auto matches = parse_inline("**bold *nested* still bold**");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].kind == InlineKind::Bold);
    REQUIRE(matches[0].text == "bold *nested* still bold");
}

TEST_CASE("Bold wins over an overlapping italic", "[markdown][inline]") {
    auto matches = parse_inline("*a **b* c**");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].kind == InlineKind::Bold);
    REQUIRE(matches[0].text == "b* c");
    REQUIRE(matches[0].start == 3);
    REQUIRE(matches[0].end == 10);
}

TEST_CASE("Bold may span lines", "[markdown][inline]") {
    auto matches = parse_inline("**one\ntwo**");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].text == "one\ntwo");
}

TEST_CASE("Unclosed delimiters stay literal", "[markdown][inline]") {
    REQUIRE(parse_inline("**never closed").empty());
    REQUIRE(parse_inline("a * b").empty());
    REQUIRE(parse_inline("~~half").empty());
    REQUIRE(parse_inline("`tick").empty());
    REQUIRE(parse_inline("****").empty());
}

TEST_CASE("Code wins inside its own span", "[markdown][inline]") {
    auto matches = parse_inline("`**not bold**`");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].kind == InlineKind::Code);
    REQUIRE(matches[0].text == "**not bold**");
}

// ============================================================================
// Links
// ============================================================================

TEST_CASE("Markdown link and autolink", "[markdown][inline][links]") {
    std::string text = "Check [Google](https://google.com) and https://github.com";
    auto matches = parse_inline(text);

    REQUIRE(matches.size() == 2);

    REQUIRE(matches[0].kind == InlineKind::Link);
    REQUIRE(matches[0].text == "Google");
    REQUIRE(matches[0].url == "https://google.com");
    REQUIRE(matches[0].start == 6);
    REQUIRE(matches[0].end == 33);

    REQUIRE(matches[1].kind == InlineKind::Link);
    REQUIRE(matches[1].text == "https://github.com");
    REQUIRE(matches[1].url == "https://github.com");
    REQUIRE(matches[1].start == 39);
    REQUIRE(matches[1].end == 56);
}

TEST_CASE("www autolink gets an http scheme", "[markdown][inline][links]") {
    auto matches = parse_inline("visit www.example.com today");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].text == "www.example.com");
    REQUIRE(matches[0].url == "http://www.example.com");
    REQUIRE(matches[0].start == 6);
    REQUIRE(matches[0].end == 20);
}

TEST_CASE("www inside a word is not a link", "[markdown][inline][links]") {
    REQUIRE(parse_inline("awww.example.com").empty());
}

TEST_CASE("Scheme alone is not a link", "[markdown][inline][links]") {
    REQUIRE(parse_inline("http:// alone").empty());
}

TEST_CASE("ftp autolink", "[markdown][inline][links]") {
    auto matches = parse_inline("get ftp://files.example.org/a.zip");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].url == "ftp://files.example.org/a.zip");
}

TEST_CASE("Autolink inside a link target is not repeated", "[markdown][inline][links]") {
    auto links = scan_links("[docs](http://docs.io)");

    REQUIRE(links.size() == 1);
    REQUIRE(links[0].text == "docs");
}

TEST_CASE("Link wins over bold inside its text", "[markdown][inline][links]") {
    auto matches = parse_inline("[**b**](http://x)");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].kind == InlineKind::Link);
    REQUIRE(matches[0].text == "**b**");
    REQUIRE(matches[0].url == "http://x");
}

TEST_CASE("Empty link text or target is not a link", "[markdown][inline][links]") {
    REQUIRE(scan_links("[](http://a.b)").size() == 1);  // Only the bare URL
    REQUIRE(scan_links("[text]()").empty());
    REQUIRE(scan_links("[text] (http)").empty());
}

// ============================================================================
// Images
// ============================================================================

TEST_CASE("Image reference", "[markdown][inline][images]") {
    auto matches = parse_inline("![cat](image://cat.png)");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].kind == InlineKind::Image);
    REQUIRE(matches[0].text == "cat");
    REQUIRE(matches[0].url == "image://cat.png");
    REQUIRE(matches[0].start == 0);
    REQUIRE(matches[0].end == 22);
}

TEST_CASE("Cache image reference", "[markdown][inline][images]") {
    auto images = scan_images("see ![paste](cache://k1) here");

    REQUIRE(images.size() == 1);
    REQUIRE(images[0].url == "cache://k1");
    REQUIRE(images[0].start == 4);
}

TEST_CASE("Image with another scheme is a link", "[markdown][inline][images]") {
    std::string text = "![x](http://a.com/x.png)";
    REQUIRE(scan_images(text).empty());

    auto segments = assemble_inline(text);
    REQUIRE(segments.size() == 2);
    REQUIRE(segments[0].is_literal());
    REQUIRE(segments[0].literal == "!");
    REQUIRE(segments[1].match->kind == InlineKind::Link);
    REQUIRE(segments[1].match->text == "x");
}

TEST_CASE("Image with empty reference", "[markdown][inline][images]") {
    REQUIRE(scan_images("![a](image://)").empty());
}

TEST_CASE("Image with empty alt text", "[markdown][inline][images]") {
    auto matches = parse_inline("![](image://x.png)");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].kind == InlineKind::Image);
    REQUIRE(matches[0].text.empty());
}

// ============================================================================
// Overlap resolution
// ============================================================================

TEST_CASE("Precedence order", "[markdown][inline]") {
    REQUIRE(inline_precedence(InlineKind::Code) < inline_precedence(InlineKind::Image));
    REQUIRE(inline_precedence(InlineKind::Image) < inline_precedence(InlineKind::Link));
    REQUIRE(inline_precedence(InlineKind::Link) < inline_precedence(InlineKind::Bold));
    REQUIRE(inline_precedence(InlineKind::Bold) < inline_precedence(InlineKind::Strikethrough));
    REQUIRE(inline_precedence(InlineKind::Strikethrough) < inline_precedence(InlineKind::Italic));
}

TEST_CASE("Resolution ignores input order", "[markdown][inline]") {
    InlineMatch bold{InlineKind::Bold, "b", "", 0, 9};
    InlineMatch code{InlineKind::Code, "c", "", 5, 7};
    InlineMatch italic{InlineKind::Italic, "i", "", 12, 14};

    auto forward = resolve_overlaps({bold, code, italic});
    auto backward = resolve_overlaps({italic, code, bold});

    REQUIRE(kinds(forward) == kinds(backward));
    REQUIRE(forward.size() == 2);
    REQUIRE(forward[0].kind == InlineKind::Code);
    REQUIRE(forward[1].kind == InlineKind::Italic);
}

TEST_CASE("Resolved matches never overlap", "[markdown][inline]") {
    std::vector<std::string> samples = {
        "**a *b** c*",
        "~~x **y~~ z**",
        "`a [b` c](http://d)",
        "![i](image://a) **![j](image://b)**",
        "*one* *two* **three** ~~four~~ `five` www.six.org",
    };

    for (const auto& text : samples) {
        INFO(text);
        auto matches = parse_inline(text);
        for (size_t i = 1; i < matches.size(); i++) {
            REQUIRE(matches[i - 1].end < matches[i].start);
        }
        for (const auto& m : matches) {
            REQUIRE(m.end < text.length());
        }
    }
}

// ============================================================================
// Assembly
// ============================================================================

TEST_CASE("Assembly interleaves literals and matches", "[markdown][inline][assemble]") {
    auto segments = assemble_inline("Hello **world**!");

    REQUIRE(segments.size() == 3);
    REQUIRE(segments[0].literal == "Hello ");
    REQUIRE(segments[1].match->kind == InlineKind::Bold);
    REQUIRE(segments[1].match->text == "world");
    REQUIRE(segments[2].literal == "!");
}

TEST_CASE("Text without matches is one literal", "[markdown][inline][assemble]") {
    auto segments = assemble_inline("just words");

    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].is_literal());
    REQUIRE(segments[0].literal == "just words");
}

TEST_CASE("Empty text has no segments", "[markdown][inline][assemble]") {
    REQUIRE(assemble_inline("").empty());
}

TEST_CASE("Adjacent matches have no empty literal between them", "[markdown][inline][assemble]") {
    auto segments = assemble_inline("`a``b`");

    REQUIRE(segments.size() == 2);
    REQUIRE_FALSE(segments[0].is_literal());
    REQUIRE_FALSE(segments[1].is_literal());
}

TEST_CASE("Segments cover the source", "[markdown][inline][assemble]") {
    std::string text = "Go to [site](http://s.io), **now** or `later` ![i](image://i.png).";
    std::string rebuilt;
    for (const auto& segment : assemble_inline(text)) {
        if (segment.is_literal()) {
            rebuilt += segment.literal;
        } else {
            rebuilt += text.substr(segment.match->start, segment.match->length());
        }
    }
    REQUIRE(rebuilt == text);
}
