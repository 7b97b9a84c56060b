#include "block_machine.hpp"

#include <utility>

namespace mdstream {

namespace {
    void handle_ready(Transition& t, const std::string& content, const std::string& raw_line);
    void handle_list(Transition& t, const std::string& content, const std::string& raw_line);

    // Move every pending line (plus an optional trailing line) into a commit.
    void commit_pending(Transition& t, const std::string& extra = "") {
        MachineState& s = t.next;
        if (s.pending.empty() && extra.empty()) {
            return;
        }

        Commit commit;
        for (const auto& line : s.pending) {
            commit.markdown += line;
        }
        commit.markdown += extra;
        s.pending.clear();
        t.commits.push_back(std::move(commit));
    }

    void begin_list(MachineState& s, int indent) {
        s.state = BlockState::InList;
        s.list.base_indent = indent;
        s.list.last_marker_indent = indent;
        s.list.has_marker = true;
    }

    void reset_list(MachineState& s) {
        s.list = ListContext{};
    }

    void handle_ready(Transition& t, const std::string& content, const std::string& raw_line) {
        MachineState& s = t.next;
        BlockType type = classify_line(content);

        switch (type) {
            case BlockType::Blank:
                // Blank lines between blocks go straight to the document
                t.commits.push_back(Commit{raw_line, false});
                break;

            case BlockType::Heading:
            case BlockType::ThematicBreak:
                // Single-line blocks are complete immediately
                s.state = BlockState::Ready;
                t.commits.push_back(Commit{raw_line, true});
                break;

            case BlockType::FencedCode:
                s.state = BlockState::InFencedCode;
                s.fence = parse_fence(content);
                s.pending.push_back(raw_line);
                break;

            case BlockType::Table:
                s.state = BlockState::InTable;
                s.pending.push_back(raw_line);
                break;

            case BlockType::List:
                begin_list(s, count_leading_spaces(content));
                s.pending.push_back(raw_line);
                break;

            case BlockType::Blockquote:
                s.state = BlockState::InBlockquote;
                s.pending.push_back(raw_line);
                break;

            case BlockType::Paragraph:
                s.state = BlockState::InParagraph;
                s.pending.push_back(raw_line);
                break;
        }
    }

    void handle_paragraph(Transition& t, const std::string& content, const std::string& raw_line) {
        MachineState& s = t.next;

        // Blank line ends the paragraph
        if (is_blank_line(content)) {
            commit_pending(t, raw_line);
            s.state = BlockState::Ready;
            return;
        }

        // Setext underline must win over thematic break: "---" under a
        // paragraph turns it into a heading
        if (is_setext_underline(content)) {
            commit_pending(t, raw_line);
            s.state = BlockState::Ready;
            return;
        }

        BlockType type = classify_line(content);
        if (type != BlockType::Paragraph) {
            // Another block starts: close the paragraph, then re-dispatch
            commit_pending(t);
            s.state = BlockState::Ready;
            handle_ready(t, content, raw_line);
            return;
        }

        s.pending.push_back(raw_line);
    }

    void handle_fenced_code(Transition& t, const std::string& content, const std::string& raw_line) {
        MachineState& s = t.next;
        s.pending.push_back(raw_line);

        if (!is_closing_fence(content, s.fence)) {
            return;
        }

        s.fence = FenceInfo{};
        if (s.resume == BlockState::InList) {
            // Back to the list; the item stays pending
            s.state = BlockState::InList;
            s.resume = BlockState::Ready;
            return;
        }

        commit_pending(t);
        s.state = BlockState::Ready;
    }

    void handle_table(Transition& t, const std::string& content, const std::string& raw_line) {
        MachineState& s = t.next;

        if (is_table_line(content)) {
            s.pending.push_back(raw_line);
            return;
        }

        // Non-table line ends the table
        if (s.resume == BlockState::InList) {
            s.state = BlockState::InList;
            s.resume = BlockState::Ready;
            handle_list(t, content, raw_line);
            return;
        }

        commit_pending(t);
        s.state = BlockState::Ready;
        handle_ready(t, content, raw_line);
    }

    void handle_list(Transition& t, const std::string& content, const std::string& raw_line) {
        MachineState& s = t.next;

        // A blank line may end the list or sit between items
        if (is_blank_line(content)) {
            s.pending.push_back(raw_line);
            return;
        }

        int indent = count_leading_spaces(content);
        std::string trimmed = trim_left(content);

        if (is_list_marker(trimmed)) {
            // Top-level items stream out as soon as a sibling marker arrives.
            // Nested siblings wait until the nested list closes.
            bool flush_at_marker = s.list.has_marker &&
                (indent <= s.list.base_indent || indent < s.list.last_marker_indent);
            if (flush_at_marker) {
                commit_pending(t);
            }
            s.pending.push_back(raw_line);
            if (indent < s.list.base_indent) {
                s.list.base_indent = indent;
            }
            s.list.last_marker_indent = indent;
            s.list.has_marker = true;
            return;
        }

        BlockType type = classify_line(content);
        if (indent > s.list.base_indent) {
            switch (type) {
                case BlockType::FencedCode:
                    s.state = BlockState::InFencedCode;
                    s.resume = BlockState::InList;
                    s.fence = parse_fence(content);
                    s.pending.push_back(raw_line);
                    return;

                case BlockType::Blockquote:
                    s.state = BlockState::InBlockquote;
                    s.resume = BlockState::InList;
                    s.pending.push_back(raw_line);
                    return;

                case BlockType::Table:
                    s.state = BlockState::InTable;
                    s.resume = BlockState::InList;
                    s.pending.push_back(raw_line);
                    return;

                case BlockType::Heading:
                case BlockType::ThematicBreak:
                    s.pending.push_back(raw_line);
                    return;

                default:
                    break;
            }
        }

        if (type != BlockType::Paragraph) {
            // A different block starts at list level
            s.state = BlockState::Ready;
            reset_list(s);
            commit_pending(t);
            handle_ready(t, content, raw_line);
            return;
        }

        // Indented text continues the current item
        if (indent > s.list.base_indent) {
            s.pending.push_back(raw_line);
            return;
        }

        // Unindented text ends the list
        s.state = BlockState::Ready;
        reset_list(s);
        commit_pending(t);
        handle_ready(t, content, raw_line);
    }

    void handle_blockquote(Transition& t, const std::string& content, const std::string& raw_line) {
        MachineState& s = t.next;

        std::string trimmed = trim_left(content);
        if (is_blank_line(content) || (!trimmed.empty() && trimmed[0] == '>')) {
            s.pending.push_back(raw_line);
            return;
        }

        if (s.resume == BlockState::InList) {
            s.state = BlockState::InList;
            s.resume = BlockState::Ready;
            handle_list(t, content, raw_line);
            return;
        }

        commit_pending(t);
        s.state = BlockState::Ready;
        handle_ready(t, content, raw_line);
    }

    void dispatch(Transition& t, const std::string& content, const std::string& raw_line) {
        switch (t.next.state) {
            case BlockState::Ready:
                handle_ready(t, content, raw_line);
                break;
            case BlockState::InParagraph:
                handle_paragraph(t, content, raw_line);
                break;
            case BlockState::InFencedCode:
                handle_fenced_code(t, content, raw_line);
                break;
            case BlockState::InTable:
                handle_table(t, content, raw_line);
                break;
            case BlockState::InList:
                handle_list(t, content, raw_line);
                break;
            case BlockState::InBlockquote:
                handle_blockquote(t, content, raw_line);
                break;
        }
    }
}

const char* block_state_name(BlockState state) {
    switch (state) {
        case BlockState::Ready: return "ready";
        case BlockState::InParagraph: return "in-paragraph";
        case BlockState::InFencedCode: return "in-fenced-code";
        case BlockState::InTable: return "in-table";
        case BlockState::InList: return "in-list";
        case BlockState::InBlockquote: return "in-blockquote";
    }
    return "unknown";
}

Transition advance(MachineState current, const std::string& raw_line) {
    Transition t;
    t.next = std::move(current);

    // Strip the line ending for analysis; the raw line is what gets stored
    std::string content = raw_line;
    if (!content.empty() && content.back() == '\n') {
        content.pop_back();
    }
    if (!content.empty() && content.back() == '\r') {
        content.pop_back();
    }

    dispatch(t, content, raw_line);
    return t;
}

Transition finish(MachineState current, const std::string& tail) {
    Transition t;
    t.next = std::move(current);

    if (!tail.empty()) {
        std::string line = tail;
        if (line.back() != '\n') {
            line += '\n';
        }
        t.next.pending.push_back(line);
    }

    commit_pending(t);
    t.next = MachineState{};
    return t;
}

std::vector<Commit> BlockMachine::feed_line(const std::string& raw_line) {
    Transition t = advance(std::move(state_), raw_line);
    state_ = std::move(t.next);
    return std::move(t.commits);
}

std::vector<Commit> BlockMachine::finish(const std::string& tail) {
    Transition t = mdstream::finish(std::move(state_), tail);
    state_ = std::move(t.next);
    return std::move(t.commits);
}

} // namespace mdstream
