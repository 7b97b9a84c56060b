#pragma once

/**
 * Streaming block state machine.
 *
 * Consumes markdown one complete line at a time and decides when the block
 * being accumulated is closed. Closed blocks come out as commits: raw
 * markdown to append to the committed document, and whether the document
 * must be re-rendered afterwards.
 *
 * The machine never renders anything itself. advance() is a plain function
 * from (state, line) to (next state, commits), so every transition can be
 * tested without a renderer or a terminal.
 */

#include "block_classifier.hpp"

#include <string>
#include <vector>

namespace mdstream {

enum class BlockState {
    Ready,          // Between blocks
    InParagraph,    // Accumulating paragraph lines
    InFencedCode,   // Inside ``` ... ```
    InTable,        // Inside table rows
    InList,         // Inside a list
    InBlockquote    // Inside > lines
};

// Returns a readable name for a state ("ready", "in-list", ...).
const char* block_state_name(BlockState state);

/**
 * List tracking for the InList state.
 */
struct ListContext {
    int base_indent = 0;          // Minimum marker indent seen in this list
    int last_marker_indent = 0;   // Indent of the most recent marker line
    bool has_marker = false;      // At least one marker seen
};

/**
 * Complete machine state: the open block, its metadata, and its raw lines.
 */
struct MachineState {
    BlockState state = BlockState::Ready;

    // State to return to when a nested fence, blockquote or table closes.
    // Ready unless the nested block was opened inside a list.
    BlockState resume = BlockState::Ready;

    FenceInfo fence;
    ListContext list;

    // Raw lines (with newlines) of the block that is not committed yet
    std::vector<std::string> pending;
};

/**
 * Raw markdown leaving the machine for the committed document.
 */
struct Commit {
    std::string markdown;
    bool render = true;  // False for blank lines between blocks
};

struct Transition {
    MachineState next;
    std::vector<Commit> commits;
};

/**
 * Feed one complete raw line (including its trailing newline) through the
 * machine.
 */
Transition advance(MachineState current, const std::string& raw_line);

/**
 * Force-close whatever is open. A non-empty newline-less tail is appended
 * as a final line (with a newline added). The returned state is Ready.
 */
Transition finish(MachineState current, const std::string& tail);

/**
 * Stateful wrapper around advance() and finish().
 */
class BlockMachine {
public:
    std::vector<Commit> feed_line(const std::string& raw_line);
    std::vector<Commit> finish(const std::string& tail);

    BlockState state() const { return state_.state; }
    const MachineState& current() const { return state_; }
    const std::vector<std::string>& pending_lines() const { return state_.pending; }

private:
    MachineState state_;
};

} // namespace mdstream
