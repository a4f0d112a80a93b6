#include <catch2/catch.hpp>
#include "markdown/block_parsers.hpp"
#include <string>
#include <vector>

using namespace memomark::markdown;

// ============================================================================
// Code blocks
// ============================================================================

TEST_CASE("Fenced code block with language", "[markdown][blocks][code]") {
    std::vector<std::string> lines = {"```cpp", "int x = 1;", "return x;", "```", "after"};

    auto node = parse_code_block(lines, 0);
    REQUIRE(node.has_value());
    REQUIRE(node->type == BlockType::CodeBlock);
    REQUIRE(node->start_line == 0);
    REQUIRE(node->end_line == 3);
    REQUIRE(node->language.value_or("") == "cpp");
    REQUIRE(node->content == "int x = 1;\nreturn x;");
}

TEST_CASE("Fenced code block without language", "[markdown][blocks][code]") {
    std::vector<std::string> lines = {"```", "plain", "```"};

    auto node = parse_code_block(lines, 0);
    REQUIRE(node.has_value());
    REQUIRE_FALSE(node->language.has_value());
    REQUIRE(node->content == "plain");
}

TEST_CASE("Code block content is not interpreted", "[markdown][blocks][code]") {
    std::vector<std::string> lines = {"```", "# not a heading", "- not a list", "```"};

    auto node = parse_code_block(lines, 0);
    REQUIRE(node.has_value());
    REQUIRE(node->content == "# not a heading\n- not a list");
}

TEST_CASE("Unterminated fence is not a code block", "[markdown][blocks][code]") {
    std::vector<std::string> lines = {"```js", "let a;"};
    REQUIRE_FALSE(parse_code_block(lines, 0).has_value());
}

TEST_CASE("Empty code block", "[markdown][blocks][code]") {
    std::vector<std::string> lines = {"```", "```"};

    auto node = parse_code_block(lines, 0);
    REQUIRE(node.has_value());
    REQUIRE(node->end_line == 1);
    REQUIRE(node->content.empty());
}

// ============================================================================
// Tables
// ============================================================================

TEST_CASE("Table with header, separator and rows", "[markdown][blocks][table]") {
    std::vector<std::string> lines = {
        "| Name | Qty |",
        "|------|:---:|",
        "| Tea  | 2   |",
        "| Milk | 1   |",
        "done"
    };

    auto node = parse_table(lines, 0);
    REQUIRE(node.has_value());
    REQUIRE(node->type == BlockType::Table);
    REQUIRE(node->end_line == 3);
    REQUIRE(node->headers == std::vector<std::string>{"Name", "Qty"});
    REQUIRE(node->rows.size() == 2);
    REQUIRE(node->rows[0] == std::vector<std::string>{"Tea", "2"});
    REQUIRE(node->rows[1] == std::vector<std::string>{"Milk", "1"});
}

TEST_CASE("Table needs a separator row", "[markdown][blocks][table]") {
    std::vector<std::string> lines = {"| a | b |", "| 1 | 2 |"};
    REQUIRE_FALSE(parse_table(lines, 0).has_value());
}

TEST_CASE("Header-only table", "[markdown][blocks][table]") {
    std::vector<std::string> lines = {"| a | b |", "|---|---|"};

    auto node = parse_table(lines, 0);
    REQUIRE(node.has_value());
    REQUIRE(node->end_line == 1);
    REQUIRE(node->rows.empty());
}

TEST_CASE("Table row helpers", "[markdown][blocks][table]") {
    REQUIRE(is_table_row("| a |"));
    REQUIRE(is_table_row("  | a | b |  "));
    REQUIRE_FALSE(is_table_row("a | b"));
    REQUIRE_FALSE(is_table_row("| a"));

    REQUIRE(is_table_separator("|---|---|"));
    REQUIRE(is_table_separator("| :-- | --: | :-: |"));
    REQUIRE_FALSE(is_table_separator("| a | b |"));
    REQUIRE_FALSE(is_table_separator("||"));

    REQUIRE(split_table_row("|  x | y  |") == std::vector<std::string>{"x", "y"});
    REQUIRE(split_table_row("| a || c |") == std::vector<std::string>{"a", "", "c"});
}

// ============================================================================
// Headings
// ============================================================================

TEST_CASE("Heading levels", "[markdown][blocks][headings]") {
    std::vector<std::string> lines = {"# Title", "### Third", "######## Deep"};

    auto h1 = parse_heading(lines, 0);
    REQUIRE(h1.has_value());
    REQUIRE(h1->level == 1);
    REQUIRE(h1->text == "Title");

    auto h3 = parse_heading(lines, 1);
    REQUIRE(h3->level == 3);
    REQUIRE(h3->text == "Third");

    // Levels are not clamped by the parser
    auto deep = parse_heading(lines, 2);
    REQUIRE(deep->level == 8);
    REQUIRE(deep->text == "Deep");
}

TEST_CASE("Heading must start at column zero", "[markdown][blocks][headings]") {
    std::vector<std::string> lines = {" # Indented", "Not # heading"};
    REQUIRE_FALSE(parse_heading(lines, 0).has_value());
    REQUIRE_FALSE(parse_heading(lines, 1).has_value());
}

// ============================================================================
// Checklists
// ============================================================================

TEST_CASE("Checklist run", "[markdown][blocks][checklist]") {
    std::vector<std::string> lines = {"- [ ] Buy milk", "- [x] Call mom", "Next paragraph"};

    auto node = parse_checklist(lines, 0);
    REQUIRE(node.has_value());
    REQUIRE(node->type == BlockType::Checklist);
    REQUIRE(node->end_line == 1);
    REQUIRE(node->checklist.size() == 2);
    REQUIRE_FALSE(node->checklist[0].checked);
    REQUIRE(node->checklist[0].text == "Buy milk");
    REQUIRE(node->checklist[1].checked);
    REQUIRE(node->checklist[1].text == "Call mom");
}

TEST_CASE("Checklist markers", "[markdown][blocks][checklist]") {
    std::vector<std::string> lines = {"- [X] upper", "- [] empty", "-[ ] tight", "- [ ]"};
    for (size_t i = 0; i < lines.size(); i++) {
        INFO(lines[i]);
        REQUIRE_FALSE(parse_checklist(lines, i).has_value());
    }
}

// ============================================================================
// Blockquotes and rules
// ============================================================================

TEST_CASE("Blockquote joins quoted lines", "[markdown][blocks][blockquote]") {
    std::vector<std::string> lines = {"> first", "> second", "plain"};

    auto node = parse_blockquote(lines, 0);
    REQUIRE(node.has_value());
    REQUIRE(node->end_line == 1);
    REQUIRE(node->text == "first\nsecond");
}

TEST_CASE("Blockquote needs a space after the marker", "[markdown][blocks][blockquote]") {
    std::vector<std::string> lines = {">tight"};
    REQUIRE_FALSE(parse_blockquote(lines, 0).has_value());
}

TEST_CASE("Horizontal rule helper", "[markdown][blocks][hr]") {
    REQUIRE(is_horizontal_rule("---"));
    REQUIRE(is_horizontal_rule("***"));
    REQUIRE(is_horizontal_rule("___"));
    REQUIRE(is_horizontal_rule("----------"));

    REQUIRE_FALSE(is_horizontal_rule("--"));
    REQUIRE_FALSE(is_horizontal_rule("- - -"));
    REQUIRE_FALSE(is_horizontal_rule("-*-"));
    REQUIRE_FALSE(is_horizontal_rule("--- "));
    REQUIRE_FALSE(is_horizontal_rule(""));
}

TEST_CASE("Horizontal rule node", "[markdown][blocks][hr]") {
    std::vector<std::string> lines = {"text", "***"};

    REQUIRE_FALSE(parse_horizontal_rule(lines, 0).has_value());
    auto node = parse_horizontal_rule(lines, 1);
    REQUIRE(node.has_value());
    REQUIRE(node->type == BlockType::HorizontalRule);
    REQUIRE(node->start_line == 1);
    REQUIRE(node->end_line == 1);
}

// ============================================================================
// Priority
// ============================================================================

TEST_CASE("Parser order", "[markdown][blocks]") {
    const auto& parsers = block_parsers();
    REQUIRE(parsers.size() == 7);

    bool code_first = parsers[0] == &parse_code_block;
    bool checklist_before_list = parsers[3] == &parse_checklist && parsers[4] == &parse_list;
    REQUIRE(code_first);
    REQUIRE(checklist_before_list);
}
