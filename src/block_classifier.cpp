#include "block_classifier.hpp"

namespace mdstream {

namespace {
    bool is_space_or_tab(char c) {
        return c == ' ' || c == '\t';
    }

    // ATX heading: 1-6 '#' followed by space, tab, or end of line
    bool is_heading(const std::string& trimmed) {
        if (trimmed.empty() || trimmed[0] != '#') {
            return false;
        }

        size_t hashes = 0;
        while (hashes < trimmed.length() && trimmed[hashes] == '#') {
            hashes++;
        }

        if (hashes > 6) {
            return false;
        }

        // Just "###" is valid (the space may not have streamed in yet)
        if (hashes == trimmed.length()) {
            return true;
        }

        return is_space_or_tab(trimmed[hashes]);
    }

    bool is_fence_open(const std::string& trimmed) {
        return trimmed.compare(0, 3, "```") == 0 || trimmed.compare(0, 3, "~~~") == 0;
    }
}

const char* block_type_name(BlockType type) {
    switch (type) {
        case BlockType::Blank: return "blank";
        case BlockType::Paragraph: return "paragraph";
        case BlockType::FencedCode: return "fenced-code";
        case BlockType::Table: return "table";
        case BlockType::List: return "list";
        case BlockType::Blockquote: return "blockquote";
        case BlockType::Heading: return "heading";
        case BlockType::ThematicBreak: return "thematic-break";
    }
    return "unknown";
}

BlockType classify_line(const std::string& line) {
    std::string trimmed = trim_left(line);

    if (is_blank_line(trimmed)) {
        return BlockType::Blank;
    }

    if (is_heading(trimmed)) {
        return BlockType::Heading;
    }

    if (is_fence_open(trimmed)) {
        return BlockType::FencedCode;
    }

    if (is_thematic_break(trimmed)) {
        return BlockType::ThematicBreak;
    }

    if (trimmed[0] == '>') {
        return BlockType::Blockquote;
    }

    if (is_list_marker(trimmed)) {
        return BlockType::List;
    }

    // Permissive on purpose: any pipe makes a table row
    if (is_table_line(line)) {
        return BlockType::Table;
    }

    return BlockType::Paragraph;
}

bool is_blank_line(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

int count_leading_spaces(const std::string& line) {
    int count = 0;
    for (char c : line) {
        if (!is_space_or_tab(c)) {
            break;
        }
        count++;
    }
    return count;
}

std::string trim_left(const std::string& line) {
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    return line.substr(start);
}

bool is_list_marker(const std::string& trimmed) {
    if (trimmed.empty()) {
        return false;
    }

    // Unordered list markers: -, *, +
    char c = trimmed[0];
    if (c == '-' || c == '*' || c == '+') {
        return trimmed.length() > 1 && is_space_or_tab(trimmed[1]);
    }

    // Ordered list: 1-9 digits followed by . or )
    size_t i = 0;
    while (i < trimmed.length() && i < 9 && trimmed[i] >= '0' && trimmed[i] <= '9') {
        i++;
    }
    if (i == 0 || i >= trimmed.length()) {
        return false;
    }
    if (trimmed[i] != '.' && trimmed[i] != ')') {
        return false;
    }

    // Marker alone at end of line counts ("1.")
    return i + 1 == trimmed.length() || is_space_or_tab(trimmed[i + 1]);
}

bool is_ordered_list_marker_prefix(const std::string& trimmed) {
    size_t i = 0;
    while (i < trimmed.length() && i < 9 && trimmed[i] >= '0' && trimmed[i] <= '9') {
        i++;
    }
    if (i == 0 || i >= trimmed.length()) {
        return false;
    }
    if (trimmed[i] != '.' && trimmed[i] != ')') {
        return false;
    }
    return i + 1 == trimmed.length();
}

bool is_thematic_break(const std::string& trimmed) {
    if (trimmed.length() < 3) {
        return false;
    }

    char marker = trimmed[0];
    if (marker != '-' && marker != '*' && marker != '_') {
        return false;
    }

    int marker_count = 0;
    for (char c : trimmed) {
        if (c == marker) {
            marker_count++;
        } else if (!is_space_or_tab(c)) {
            return false;
        }
    }

    return marker_count >= 3;
}

bool is_setext_underline(const std::string& line) {
    size_t start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return false;
    }
    size_t end = line.find_last_not_of(" \t\r");

    char marker = line[start];
    if (marker != '=' && marker != '-') {
        return false;
    }

    for (size_t i = start; i <= end; i++) {
        if (line[i] != marker) {
            return false;
        }
    }
    return true;
}

bool is_table_line(const std::string& line) {
    return line.find('|') != std::string::npos;
}

FenceInfo parse_fence(const std::string& line) {
    FenceInfo info;
    std::string trimmed = trim_left(line);
    if (trimmed.empty() || (trimmed[0] != '`' && trimmed[0] != '~')) {
        return info;
    }

    int run = 0;
    while (static_cast<size_t>(run) < trimmed.length() && trimmed[run] == trimmed[0]) {
        run++;
    }
    if (run < 3) {
        return info;
    }

    info.fence_char = trimmed[0];
    info.length = run;
    info.indent = count_leading_spaces(line);
    return info;
}

bool is_closing_fence(const std::string& line, const FenceInfo& open) {
    int indent = count_leading_spaces(line);
    if (indent > 3 && indent > open.indent + 3) {
        return false;
    }

    std::string trimmed = trim_left(line);
    if (trimmed.empty() || trimmed[0] != open.fence_char) {
        return false;
    }

    size_t i = 0;
    while (i < trimmed.length() && trimmed[i] == open.fence_char) {
        i++;
    }
    if (static_cast<int>(i) < open.length) {
        return false;
    }

    // Rest of line should be whitespace only
    return trimmed.find_first_not_of(" \t\r", i) == std::string::npos;
}

} // namespace mdstream
