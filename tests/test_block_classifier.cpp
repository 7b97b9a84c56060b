#include <catch2/catch.hpp>
#include "block_classifier.hpp"

using namespace mdstream;

// ============================================================================
// Line classification
// ============================================================================

TEST_CASE("Classify block-opening lines", "[classifier]") {
    REQUIRE(classify_line("# Heading") == BlockType::Heading);
    REQUIRE(classify_line("## Heading 2") == BlockType::Heading);
    REQUIRE(classify_line("###### Heading 6") == BlockType::Heading);
    REQUIRE(classify_line("###") == BlockType::Heading);
    REQUIRE(classify_line("```") == BlockType::FencedCode);
    REQUIRE(classify_line("```go") == BlockType::FencedCode);
    REQUIRE(classify_line("~~~") == BlockType::FencedCode);
    REQUIRE(classify_line("---") == BlockType::ThematicBreak);
    REQUIRE(classify_line("***") == BlockType::ThematicBreak);
    REQUIRE(classify_line("___") == BlockType::ThematicBreak);
    REQUIRE(classify_line("- - -") == BlockType::ThematicBreak);
    REQUIRE(classify_line("> quote") == BlockType::Blockquote);
    REQUIRE(classify_line("- list item") == BlockType::List);
    REQUIRE(classify_line("* list item") == BlockType::List);
    REQUIRE(classify_line("+ list item") == BlockType::List);
    REQUIRE(classify_line("1. ordered") == BlockType::List);
    REQUIRE(classify_line("10. ordered") == BlockType::List);
    REQUIRE(classify_line("| table |") == BlockType::Table);
    REQUIRE(classify_line("regular text") == BlockType::Paragraph);
    REQUIRE(classify_line("") == BlockType::Blank);
    REQUIRE(classify_line("   \t") == BlockType::Blank);
}

TEST_CASE("Hash without space is not a heading", "[classifier]") {
    REQUIRE(classify_line("#hashtag") == BlockType::Paragraph);
    REQUIRE(classify_line("####### seven") == BlockType::Paragraph);
}

TEST_CASE("Any pipe makes a table line", "[classifier]") {
    REQUIRE(classify_line("a | b") == BlockType::Table);
    REQUIRE(classify_line("prose with a | pipe") == BlockType::Table);
}

TEST_CASE("Leading indentation is ignored", "[classifier]") {
    REQUIRE(classify_line("   # Heading") == BlockType::Heading);
    REQUIRE(classify_line("  - nested") == BlockType::List);
    REQUIRE(classify_line("\t> quote") == BlockType::Blockquote);
}

TEST_CASE("Block type names", "[classifier]") {
    REQUIRE(std::string(block_type_name(BlockType::FencedCode)) == "fenced-code");
    REQUIRE(std::string(block_type_name(BlockType::ThematicBreak)) == "thematic-break");
}

// ============================================================================
// Markers
// ============================================================================

TEST_CASE("List markers", "[classifier][lists]") {
    REQUIRE(is_list_marker("- item"));
    REQUIRE(is_list_marker("* item"));
    REQUIRE(is_list_marker("+ item"));
    REQUIRE(is_list_marker("1. item"));
    REQUIRE(is_list_marker("10. item"));
    REQUIRE(is_list_marker("1) item"));
    REQUIRE(is_list_marker("1."));
    REQUIRE_FALSE(is_list_marker("-item"));
    REQUIRE_FALSE(is_list_marker("1.item"));
    REQUIRE_FALSE(is_list_marker("text"));
    REQUIRE_FALSE(is_list_marker(""));
    REQUIRE_FALSE(is_list_marker("-"));
}

TEST_CASE("Ordered list marker prefix", "[classifier][lists]") {
    REQUIRE(is_ordered_list_marker_prefix("1."));
    REQUIRE(is_ordered_list_marker_prefix("1)"));
    REQUIRE(is_ordered_list_marker_prefix("123456789."));
    REQUIRE(is_ordered_list_marker_prefix("123456789)"));
    REQUIRE_FALSE(is_ordered_list_marker_prefix("1. "));
    REQUIRE_FALSE(is_ordered_list_marker_prefix("1) "));
    REQUIRE_FALSE(is_ordered_list_marker_prefix("1"));
    REQUIRE_FALSE(is_ordered_list_marker_prefix(""));
    REQUIRE_FALSE(is_ordered_list_marker_prefix("1234567890."));
    REQUIRE_FALSE(is_ordered_list_marker_prefix("a."));
}

TEST_CASE("Thematic breaks", "[classifier]") {
    REQUIRE(is_thematic_break("---"));
    REQUIRE(is_thematic_break("***"));
    REQUIRE(is_thematic_break("___"));
    REQUIRE(is_thematic_break("- - -"));
    REQUIRE(is_thematic_break("* * *"));
    REQUIRE(is_thematic_break("----"));
    REQUIRE_FALSE(is_thematic_break("--"));
    REQUIRE_FALSE(is_thematic_break("-"));
    REQUIRE_FALSE(is_thematic_break("- -"));
    REQUIRE_FALSE(is_thematic_break("abc"));
    REQUIRE_FALSE(is_thematic_break("-*-"));
}

TEST_CASE("Setext underlines", "[classifier]") {
    REQUIRE(is_setext_underline("==="));
    REQUIRE(is_setext_underline("---"));
    REQUIRE(is_setext_underline("  =  "));
    REQUIRE_FALSE(is_setext_underline("- - -"));
    REQUIRE_FALSE(is_setext_underline("=-="));
    REQUIRE_FALSE(is_setext_underline(""));
}

TEST_CASE("Leading space counting and trimming", "[classifier]") {
    REQUIRE(count_leading_spaces("   x") == 3);
    REQUIRE(count_leading_spaces("\t x") == 2);
    REQUIRE(count_leading_spaces("x") == 0);
    REQUIRE(trim_left("  \tx y ") == "x y ");
    REQUIRE(trim_left("   ") == "");
    REQUIRE(is_blank_line(" \t\r"));
    REQUIRE_FALSE(is_blank_line(" x "));
}

// ============================================================================
// Fences
// ============================================================================

TEST_CASE("Parse fence openers", "[classifier][code]") {
    FenceInfo info = parse_fence("```");
    REQUIRE(info.fence_char == '`');
    REQUIRE(info.length == 3);
    REQUIRE(info.indent == 0);

    info = parse_fence("````");
    REQUIRE(info.length == 4);

    info = parse_fence("~~~");
    REQUIRE(info.fence_char == '~');
    REQUIRE(info.length == 3);

    info = parse_fence("  ```");
    REQUIRE(info.length == 3);
    REQUIRE(info.indent == 2);

    info = parse_fence("```go");
    REQUIRE(info.fence_char == '`');
    REQUIRE(info.length == 3);

    REQUIRE(parse_fence("``").length == 0);
    REQUIRE(parse_fence("text").length == 0);
}

TEST_CASE("Closing fences", "[classifier][code]") {
    FenceInfo backticks{'`', 3, 0};
    FenceInfo tildes{'~', 3, 0};
    FenceInfo four{'`', 4, 0};

    REQUIRE(is_closing_fence("```", backticks));
    REQUIRE(is_closing_fence("````", backticks));
    REQUIRE(is_closing_fence("  ```", backticks));
    REQUIRE(is_closing_fence("```   ", backticks));
    REQUIRE(is_closing_fence("~~~", tildes));
    REQUIRE_FALSE(is_closing_fence("``", backticks));
    REQUIRE_FALSE(is_closing_fence("```", tildes));
    REQUIRE_FALSE(is_closing_fence("~~~", backticks));
    REQUIRE_FALSE(is_closing_fence("```x", backticks));
    REQUIRE_FALSE(is_closing_fence("```", four));
    REQUIRE(is_closing_fence("````", four));
}
