#pragma once

#include <string>
#include <cstddef>

namespace mdstream {

class OutputSink;

namespace terminal {

/**
 * Get the terminal width in columns.
 * Returns 80 if width cannot be determined.
 */
int get_width();

/**
 * Get the terminal height in rows.
 * Returns 24 if height cannot be determined.
 */
int get_height();

/**
 * Check if stdout is a TTY (interactive terminal).
 */
bool is_tty();

/**
 * Length in bytes of the escape sequence starting at pos, or 0 if there is
 * none. Understands CSI (ESC [ ... final byte) and OSC (ESC ] ... BEL or
 * ESC \) sequences; any other ESC x pair counts as 2 bytes.
 */
size_t escape_length(const std::string& text, size_t pos);

/**
 * Bytes in the UTF-8 sequence introduced by lead byte c. Invalid and
 * continuation bytes count as 1.
 */
size_t utf8_length(unsigned char c);

/**
 * Calculate the display width of a string, accounting for
 * ANSI escape sequences (which have zero width) and
 * multi-byte UTF-8 characters.
 *
 * @param text The text to measure
 * @return Display width in columns
 */
int display_width(const std::string& text);

/**
 * Count how many terminal rows a rendered string occupies.
 *
 * The text is split on newlines. Every segment except an empty one after a
 * trailing newline takes ceil(display_width / terminal_width) rows, and at
 * least one row even when empty.
 *
 * @param text The text to measure
 * @param terminal_width The terminal width for wrap calculation.
 *        Values <= 0 disable wrapping (one row per segment).
 * @return Number of rows the text would occupy
 */
int count_lines(const std::string& text, int terminal_width);

/**
 * Returns the byte offset at which text can be cut so that text.substr(result)
 * starts on a character boundary outside of any escape sequence. The result
 * is pos, or moved forward past the sequence or UTF-8 character that pos
 * falls inside.
 */
size_t safe_suffix_start(const std::string& text, size_t pos);

/**
 * What is left of text on screen after the cursor (at the end of text) moves
 * up n rows to column 1 and everything below is erased. Rows are counted
 * with wrapping at terminal_width (<= 0 disables wrapping).
 */
std::string drop_last_rows(const std::string& text, int n, int terminal_width);

namespace cursor {
    /**
     * Move cursor up n lines.
     * ANSI: \033[nA
     */
    std::string up(int n);

    /**
     * Move cursor to column n (1-based).
     * ANSI: \033[nG
     */
    std::string column(int n);

    /**
     * Show the cursor.
     * ANSI: \033[?25h
     */
    std::string show();
}

namespace clear {
    /**
     * Clear from cursor to end of line.
     * ANSI: \033[K
     */
    std::string to_end_of_line();

    /**
     * Clear from cursor to end of screen.
     * ANSI: \033[J
     */
    std::string to_end_of_screen();
}

/**
 * Move up n rows, to column 1, and erase to the end of the screen.
 * Empty for n <= 0.
 */
std::string erase_rows_sequence(int n);

/**
 * Cursor control for retracting speculative output.
 *
 * Writes its escape sequences to the same sink the rendered text goes to,
 * so the erase lands exactly where the text was written.
 */
class Controller {
public:
    Controller(OutputSink& output, int width);

    /**
     * Move the cursor up n rows, to column 1, and erase to the end of the
     * screen. Does nothing for n <= 0.
     */
    void clear_lines(int n);

    // Rows the rendered text occupies at the current width.
    int count_lines(const std::string& rendered) const;

    int width() const { return width_; }
    void set_width(int width) { width_ = width; }

private:
    OutputSink& output_;
    int width_;
};

} // namespace terminal
} // namespace mdstream
