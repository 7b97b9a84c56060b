#include <catch2/catch.hpp>
#include "block_machine.hpp"

using namespace mdstream;

namespace {
    // Feed lines and collect every commit in order
    std::vector<Commit> feed_all(BlockMachine& machine, const std::vector<std::string>& lines) {
        std::vector<Commit> all;
        for (const auto& line : lines) {
            auto commits = machine.feed_line(line);
            all.insert(all.end(), commits.begin(), commits.end());
        }
        return all;
    }
}

// ============================================================================
// Single-line blocks
// ============================================================================

TEST_CASE("Heading commits immediately", "[machine]") {
    BlockMachine machine;
    auto commits = machine.feed_line("# Title\n");

    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "# Title\n");
    REQUIRE(commits[0].render);
    REQUIRE(machine.state() == BlockState::Ready);
    REQUIRE(machine.pending_lines().empty());
}

TEST_CASE("Thematic break commits immediately", "[machine]") {
    BlockMachine machine;
    auto commits = machine.feed_line("***\n");

    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "***\n");
    REQUIRE(machine.state() == BlockState::Ready);
}

TEST_CASE("Blank line in Ready commits without rendering", "[machine]") {
    BlockMachine machine;
    auto commits = machine.feed_line("\n");

    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "\n");
    REQUIRE_FALSE(commits[0].render);
    REQUIRE(machine.state() == BlockState::Ready);
}

// ============================================================================
// Paragraphs
// ============================================================================

TEST_CASE("Paragraph waits for a blank line", "[machine][paragraph]") {
    BlockMachine machine;

    REQUIRE(machine.feed_line("Hello\n").empty());
    REQUIRE(machine.feed_line("world\n").empty());
    REQUIRE(machine.state() == BlockState::InParagraph);
    REQUIRE(machine.pending_lines().size() == 2);

    auto commits = machine.feed_line("\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "Hello\nworld\n\n");
    REQUIRE(commits[0].render);
    REQUIRE(machine.state() == BlockState::Ready);
}

TEST_CASE("Setext underline closes the paragraph as a heading", "[machine][paragraph]") {
    SECTION("Dashes") {
        BlockMachine machine;
        machine.feed_line("Title\n");
        auto commits = machine.feed_line("---\n");

        REQUIRE(commits.size() == 1);
        REQUIRE(commits[0].markdown == "Title\n---\n");
        REQUIRE(machine.state() == BlockState::Ready);
    }

    SECTION("Equals") {
        BlockMachine machine;
        machine.feed_line("Title\n");
        auto commits = machine.feed_line("=====\n");

        REQUIRE(commits.size() == 1);
        REQUIRE(commits[0].markdown == "Title\n=====\n");
    }
}

TEST_CASE("A new block interrupts a paragraph", "[machine][paragraph]") {
    BlockMachine machine;
    machine.feed_line("text\n");
    auto commits = machine.feed_line("- item\n");

    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "text\n");
    REQUIRE(machine.state() == BlockState::InList);
    REQUIRE(machine.pending_lines() == std::vector<std::string>{"- item\n"});
}

TEST_CASE("Heading after paragraph commits both", "[machine][paragraph]") {
    BlockMachine machine;
    machine.feed_line("text\n");
    auto commits = machine.feed_line("## Next\n");

    REQUIRE(commits.size() == 2);
    REQUIRE(commits[0].markdown == "text\n");
    REQUIRE(commits[1].markdown == "## Next\n");
    REQUIRE(machine.state() == BlockState::Ready);
}

// ============================================================================
// Fenced code
// ============================================================================

TEST_CASE("Fenced code is held until the closing fence", "[machine][code]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"```go\n", "x := 1\n", "\n", "# not a heading\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.state() == BlockState::InFencedCode);
    REQUIRE(machine.current().fence.length == 3);

    commits = machine.feed_line("```\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "```go\nx := 1\n\n# not a heading\n```\n");
    REQUIRE(machine.state() == BlockState::Ready);
}

TEST_CASE("Four-backtick fence is not closed by three", "[machine][code]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"````\n", "```\n", "inner\n", "```\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.state() == BlockState::InFencedCode);

    commits = machine.feed_line("````\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "````\n```\ninner\n```\n````\n");
}

TEST_CASE("Tilde fence ignores backtick lines", "[machine][code]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"~~~\n", "```\n"});
    REQUIRE(commits.empty());

    commits = machine.feed_line("~~~\n");
    REQUIRE(commits.size() == 1);
}

// ============================================================================
// Tables and blockquotes
// ============================================================================

TEST_CASE("Table ends at the first non-table line", "[machine][table]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"| a | b |\n", "|---|---|\n", "| 1 | 2 |\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.state() == BlockState::InTable);

    commits = machine.feed_line("after\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "| a | b |\n|---|---|\n| 1 | 2 |\n");
    REQUIRE(machine.state() == BlockState::InParagraph);
    REQUIRE(machine.pending_lines() == std::vector<std::string>{"after\n"});
}

TEST_CASE("Blockquote ends at the first unquoted line", "[machine][quote]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"> a\n", ">\n", "> b\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.state() == BlockState::InBlockquote);

    commits = machine.feed_line("after\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "> a\n>\n> b\n");
    REQUIRE(machine.state() == BlockState::InParagraph);
}

// ============================================================================
// Lists
// ============================================================================

TEST_CASE("Top-level list items stream one at a time", "[machine][lists]") {
    BlockMachine machine;

    REQUIRE(machine.feed_line("1. First\n").empty());

    auto commits = machine.feed_line("2. Second\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "1. First\n");

    commits = machine.feed_line("3. Third\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "2. Second\n");

    REQUIRE(machine.pending_lines() == std::vector<std::string>{"3. Third\n"});
    REQUIRE(machine.state() == BlockState::InList);
}

TEST_CASE("Nested list items stay pending until the parent level continues", "[machine][lists]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"1. Parent\n", "   - Child A\n", "   - Child B\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.pending_lines().size() == 3);
    REQUIRE(machine.current().list.base_indent == 0);
    REQUIRE(machine.current().list.last_marker_indent == 3);

    commits = machine.feed_line("2. Next\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "1. Parent\n   - Child A\n   - Child B\n");
    REQUIRE(machine.pending_lines() == std::vector<std::string>{"2. Next\n"});
}

TEST_CASE("Blank lines inside a list stay pending", "[machine][lists]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"- a\n", "\n", "- b\n"});

    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "- a\n\n");
    REQUIRE(machine.state() == BlockState::InList);
}

TEST_CASE("Indented text continues a list item", "[machine][lists]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"- a\n", "  more of a\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.pending_lines().size() == 2);
}

TEST_CASE("Unindented text ends the list", "[machine][lists]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"- a\n", "\n", "text\n"});

    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "- a\n\n");
    REQUIRE(machine.state() == BlockState::InParagraph);
    REQUIRE(machine.current().list.has_marker == false);
}

TEST_CASE("Fence inside a list item returns to the list", "[machine][lists][code]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"1. Step\n", "   ```\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.state() == BlockState::InFencedCode);
    REQUIRE(machine.current().resume == BlockState::InList);

    commits = feed_all(machine, {"   - not an item\n", "   ```\n"});
    REQUIRE(commits.empty());
    REQUIRE(machine.state() == BlockState::InList);
    REQUIRE(machine.current().resume == BlockState::Ready);
    REQUIRE(machine.pending_lines().size() == 4);

    commits = machine.feed_line("2. Next\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "1. Step\n   ```\n   - not an item\n   ```\n");
}

TEST_CASE("Blockquote inside a list item returns to the list", "[machine][lists][quote]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"- a\n", "  > q\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.state() == BlockState::InBlockquote);
    REQUIRE(machine.current().resume == BlockState::InList);

    commits = machine.feed_line("  > more\n");
    REQUIRE(commits.empty());

    commits = machine.feed_line("- b\n");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "- a\n  > q\n  > more\n");
    REQUIRE(machine.state() == BlockState::InList);
    REQUIRE(machine.current().resume == BlockState::Ready);
    REQUIRE(machine.pending_lines() == std::vector<std::string>{"- b\n"});
}

TEST_CASE("Table inside a list item returns to the list", "[machine][lists][table]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"- a\n", "  | x | y |\n", "  |---|---|\n"});

    REQUIRE(commits.empty());
    REQUIRE(machine.state() == BlockState::InTable);
    REQUIRE(machine.current().resume == BlockState::InList);
    REQUIRE(machine.pending_lines().size() == 3);

    SECTION("Unindented text closes the list") {
        commits = machine.feed_line("after\n");
        REQUIRE(commits.size() == 1);
        REQUIRE(commits[0].markdown == "- a\n  | x | y |\n  |---|---|\n");
        REQUIRE(machine.state() == BlockState::InParagraph);
        REQUIRE(machine.current().resume == BlockState::Ready);
        REQUIRE(machine.pending_lines() == std::vector<std::string>{"after\n"});
    }

    SECTION("Next sibling commits the item") {
        commits = machine.feed_line("- b\n");
        REQUIRE(commits.size() == 1);
        REQUIRE(commits[0].markdown == "- a\n  | x | y |\n  |---|---|\n");
        REQUIRE(machine.state() == BlockState::InList);
        REQUIRE(machine.pending_lines() == std::vector<std::string>{"- b\n"});
    }
}

TEST_CASE("Heading at list level ends the list", "[machine][lists]") {
    BlockMachine machine;
    auto commits = feed_all(machine, {"- a\n", "# Heading\n"});

    REQUIRE(commits.size() == 2);
    REQUIRE(commits[0].markdown == "- a\n");
    REQUIRE(commits[1].markdown == "# Heading\n");
    REQUIRE(machine.state() == BlockState::Ready);
}

// ============================================================================
// Finish and purity
// ============================================================================

TEST_CASE("Finish commits pending lines and the unterminated tail", "[machine]") {
    BlockMachine machine;
    machine.feed_line("Hello\n");

    auto commits = machine.finish("wor");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "Hello\nwor\n");
    REQUIRE(machine.state() == BlockState::Ready);
    REQUIRE(machine.pending_lines().empty());
}

TEST_CASE("Finish closes an unterminated fence", "[machine][code]") {
    BlockMachine machine;
    machine.feed_line("```\n");
    machine.feed_line("code\n");

    auto commits = machine.finish("");
    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "```\ncode\n");
    REQUIRE(machine.state() == BlockState::Ready);
    REQUIRE(machine.current().fence.length == 0);
}

TEST_CASE("Finish with nothing pending commits nothing", "[machine]") {
    BlockMachine machine;
    REQUIRE(machine.finish("").empty());
}

TEST_CASE("Advance leaves its input state untouched", "[machine]") {
    MachineState start;
    start.state = BlockState::InParagraph;
    start.pending.push_back("Hello\n");

    Transition t = advance(start, "\n");

    REQUIRE(start.state == BlockState::InParagraph);
    REQUIRE(start.pending.size() == 1);
    REQUIRE(t.next.state == BlockState::Ready);
    REQUIRE(t.next.pending.empty());
    REQUIRE(t.commits.size() == 1);
}

TEST_CASE("CRLF line endings are tolerated", "[machine]") {
    BlockMachine machine;
    machine.feed_line("text\r\n");
    auto commits = machine.feed_line("\r\n");

    REQUIRE(commits.size() == 1);
    REQUIRE(commits[0].markdown == "text\r\n\r\n");
}
