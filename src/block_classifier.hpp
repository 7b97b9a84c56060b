#pragma once

/**
 * Line-level markdown block detection.
 *
 * Every function here is pure: it looks at a single line (without its
 * trailing newline) and never at surrounding context. Context-dependent
 * decisions, like a Setext underline only counting while a paragraph is
 * open, belong to the block state machine.
 */

#include <string>

namespace mdstream {

enum class BlockType {
    Blank,
    Paragraph,
    FencedCode,
    Table,
    List,
    Blockquote,
    Heading,
    ThematicBreak
};

/**
 * Opening fence of a fenced code block.
 */
struct FenceInfo {
    char fence_char = 0;   // '`' or '~'
    int length = 0;        // Number of fence characters
    int indent = 0;        // Leading indent, tabs counted as 1
};

// Returns a readable name for a block type ("paragraph", "list", ...).
const char* block_type_name(BlockType type);

/**
 * Classify a line by the block it starts. Leading spaces and tabs are
 * ignored. Priority: heading, fenced code, thematic break, blockquote,
 * list, table, paragraph.
 */
BlockType classify_line(const std::string& line);

// True if the line contains only whitespace.
bool is_blank_line(const std::string& line);

// Number of leading spaces and tabs; a tab counts as one column.
int count_leading_spaces(const std::string& line);

// Returns the line with leading spaces and tabs removed.
std::string trim_left(const std::string& line);

/**
 * Check if a left-trimmed line starts with a list marker: "-", "*" or "+"
 * followed by a space or tab, or 1-9 digits followed by "." or ")" and then
 * a space, tab, or end of line.
 */
bool is_list_marker(const std::string& trimmed);

/**
 * Check if a left-trimmed line is only an ordered list marker ("1.", "2)")
 * with nothing after it yet.
 */
bool is_ordered_list_marker_prefix(const std::string& trimmed);

/**
 * Check if a left-trimmed line is a thematic break: three or more of the
 * same character (-, *, _) with only spaces or tabs between them.
 */
bool is_thematic_break(const std::string& trimmed);

/**
 * Check if a line is a Setext heading underline: a run of only '=' or only
 * '-', ignoring surrounding whitespace.
 */
bool is_setext_underline(const std::string& line);

// True if the line contains a pipe character anywhere.
bool is_table_line(const std::string& line);

/**
 * Extract fence information from a fence opening line. Returns a FenceInfo
 * with length 0 if the line does not open a fence.
 */
FenceInfo parse_fence(const std::string& line);

/**
 * Check if a line closes the fence described by open: indented at most
 * max(3, open.indent + 3), same fence character, at least as many fence
 * characters, and nothing but whitespace after them.
 */
bool is_closing_fence(const std::string& line, const FenceInfo& open);

} // namespace mdstream
