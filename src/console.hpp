#pragma once

#include <string>
#include <iostream>

namespace mdstream {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Terminal output helper with color support.
 *
 * Status and error messages for the command line front end. Falls back to
 * plain text when colors are not supported (TERM unset or TERM=dumb).
 * Messages go to stderr so they never interleave with rendered markdown on
 * stdout.
 */
class Console {
public:
    // Creates a Console instance and detects color support.
    Console();

    // ========== Basic Output ==========

    // Prints text followed by a newline.
    void println(const std::string& text = "") const;

    // ========== Colored Output ==========

    // Prints error message in red.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

    // Prints success message in green with a checkmark prefix.
    void print_success(const std::string& text) const;

    // Prints informational message in cyan.
    void print_info(const std::string& text) const;

    // ========== Raw Output ==========

    // Prints text to stdout without newline or formatting (for streaming output).
    void print_raw(const std::string& text) const;

    // Flushes stdout.
    void flush() const;

    bool colors_enabled() const { return colors_enabled_; }

private:
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();
};

} // namespace mdstream
