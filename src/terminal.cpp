#include "terminal.hpp"
#include "output_sink.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace mdstream {
namespace terminal {

size_t utf8_length(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // Invalid or continuation byte
}

int get_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }

    // Try COLUMNS environment variable
    const char* columns = std::getenv("COLUMNS");
    if (columns) {
        int width = std::atoi(columns);
        if (width > 0) {
            return width;
        }
    }

    // Default fallback
    return 80;
}

int get_height() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
        return ws.ws_row;
    }

    const char* lines = std::getenv("LINES");
    if (lines) {
        int height = std::atoi(lines);
        if (height > 0) {
            return height;
        }
    }

    return 24;
}

bool is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

size_t escape_length(const std::string& text, size_t pos) {
    if (pos >= text.length() || text[pos] != '\033') {
        return 0;
    }
    if (pos + 1 >= text.length()) {
        return 1;
    }

    char kind = text[pos + 1];
    size_t i = pos + 2;

    if (kind == '[') {
        // CSI: parameter and intermediate bytes, then a final byte 0x40-0x7E
        while (i < text.length()) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            i++;
            if (c >= 0x40 && c <= 0x7E) {
                break;
            }
        }
        return i - pos;
    }

    if (kind == ']') {
        // OSC: terminated by BEL or ST (ESC \)
        while (i < text.length()) {
            if (text[i] == '\007') {
                return i + 1 - pos;
            }
            if (text[i] == '\033' && i + 1 < text.length() && text[i + 1] == '\\') {
                return i + 2 - pos;
            }
            i++;
        }
        return i - pos;
    }

    return 2;
}

int display_width(const std::string& text) {
    int width = 0;
    size_t i = 0;

    while (i < text.length()) {
        size_t esc = escape_length(text, i);
        if (esc > 0) {
            i += esc;
            continue;
        }

        unsigned char c = static_cast<unsigned char>(text[i]);

        // For simplicity, count each Unicode codepoint as width 1
        // (A more accurate implementation would use wcwidth)
        if (c != '\n' && c != '\r' && ((c & 0xC0) != 0x80)) {
            width++;
        }
        i += utf8_length(c);
    }

    return width;
}

int count_lines(const std::string& text, int terminal_width) {
    if (text.empty()) {
        return 0;
    }

    int total = 0;
    size_t start = 0;

    while (start <= text.length()) {
        size_t nl = text.find('\n', start);
        bool last = (nl == std::string::npos);
        std::string segment = text.substr(start, last ? std::string::npos : nl - start);

        // Don't count the empty segment after a trailing newline
        if (last && segment.empty()) {
            break;
        }

        int width = display_width(segment);
        if (width == 0 || terminal_width <= 0) {
            total++;
        } else {
            total += (width + terminal_width - 1) / terminal_width;
        }

        if (last) {
            break;
        }
        start = nl + 1;
    }

    return total;
}

size_t safe_suffix_start(const std::string& text, size_t pos) {
    if (pos >= text.length()) {
        return text.length();
    }

    size_t i = 0;
    while (i < pos) {
        size_t step = escape_length(text, i);
        if (step == 0) {
            step = utf8_length(static_cast<unsigned char>(text[i]));
        }
        if (i + step > pos) {
            // pos falls inside this sequence or character
            return std::min(i + step, text.length());
        }
        i += step;
    }
    return pos;
}

std::string drop_last_rows(const std::string& text, int n, int terminal_width) {
    if (n <= 0) {
        return text;
    }

    // Byte offset where each terminal row starts; the last entry is the
    // cursor row
    std::vector<size_t> row_starts{0};
    int column = 0;
    size_t i = 0;
    while (i < text.length()) {
        size_t esc = escape_length(text, i);
        if (esc > 0) {
            i += esc;
            continue;
        }

        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t step = utf8_length(c);
        if (c == '\n') {
            row_starts.push_back(i + 1);
            column = 0;
        } else if (c != '\r') {
            if (terminal_width > 0 && column == terminal_width) {
                row_starts.push_back(i);
                column = 0;
            }
            column++;
        }
        i += step;
    }

    int cursor_row = static_cast<int>(row_starts.size()) - 1;
    if (n >= cursor_row) {
        return "";
    }
    return text.substr(0, row_starts[static_cast<size_t>(cursor_row - n)]);
}

namespace cursor {

std::string up(int n) {
    if (n <= 0) return "";
    return "\033[" + std::to_string(n) + "A";
}

std::string column(int n) {
    if (n <= 0) n = 1;
    return "\033[" + std::to_string(n) + "G";
}

std::string show() {
    return "\033[?25h";
}

} // namespace cursor

namespace clear {

std::string to_end_of_line() {
    return "\033[K";
}

std::string to_end_of_screen() {
    return "\033[J";
}

} // namespace clear

Controller::Controller(OutputSink& output, int width)
    : output_(output)
    , width_(width)
{
}

std::string erase_rows_sequence(int n) {
    if (n <= 0) {
        return "";
    }
    return cursor::up(n) + cursor::column(1) + clear::to_end_of_screen();
}

void Controller::clear_lines(int n) {
    if (n <= 0) {
        return;
    }
    // The sink is told which rows go away so it can keep track of what
    // is still on screen
    output_.erase_rows(n);
}

int Controller::count_lines(const std::string& rendered) const {
    return terminal::count_lines(rendered, width_);
}

} // namespace terminal
} // namespace mdstream
