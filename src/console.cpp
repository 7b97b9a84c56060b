#include "console.hpp"
#include <cstdlib>

namespace mdstream {

Console::Console() : colors_enabled_(true) {
    enable_colors();
}

void Console::enable_colors() {
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") {
        colors_enabled_ = false;
    }
}

void Console::println(const std::string& text) const {
    std::cerr << text << std::endl;
}

void Console::print_error(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::RED << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_warning(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::YELLOW << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        std::cerr << "* " << text << std::endl;
    }
}

void Console::print_info(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_raw(const std::string& text) const {
    std::cout << text;
}

void Console::flush() const {
    std::cout << std::flush;
}

} // namespace mdstream
