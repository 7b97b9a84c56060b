#include "output_sink.hpp"
#include "terminal.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace mdstream {

void OutputSink::reset() {
    throw std::logic_error("output sink does not support reset");
}

void OutputSink::erase_rows(int n) {
    write(terminal::erase_rows_sequence(n));
}

void BufferSink::write(const std::string& data) {
    if (data.empty()) {
        return;
    }
    buffer_ += data;
    write_count_++;
}

void BufferSink::reset() {
    buffer_.clear();
}

CallbackSink::CallbackSink(OutputCallback output)
    : output_(std::move(output))
{
}

void CallbackSink::write(const std::string& data) {
    if (output_ && !data.empty()) {
        output_(data);
    }
}

TerminalSink::TerminalSink(int terminal_width)
    : terminal_width_(terminal_width)
{
}

void TerminalSink::write(const std::string& data) {
    if (data.empty()) {
        return;
    }
    std::cout << data << std::flush;
    visible_ += data;
}

void TerminalSink::reset() {
    if (visible_.empty()) {
        return;
    }

    int total_lines = terminal::count_lines(visible_, width());

    // If the output ends with a newline the cursor sits on the next (empty)
    // row, otherwise it is still on the last row of the content
    int lines_up = total_lines;
    if (visible_.back() != '\n') {
        lines_up = total_lines - 1;
    }

    std::string seq = "\r";
    seq += terminal::cursor::up(lines_up);
    seq += terminal::clear::to_end_of_screen();
    std::cout << seq << std::flush;

    visible_.clear();
}

void TerminalSink::erase_rows(int n) {
    if (n <= 0) {
        return;
    }
    std::cout << terminal::erase_rows_sequence(n) << std::flush;
    visible_ = terminal::drop_last_rows(visible_, n, width());
}

int TerminalSink::width() const {
    return (terminal_width_ > 0) ? terminal_width_ : terminal::get_width();
}

void TerminalSink::set_width(int terminal_width) {
    terminal_width_ = terminal_width;
}

} // namespace mdstream
