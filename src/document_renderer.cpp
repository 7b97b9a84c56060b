#include "document_renderer.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "terminal.hpp"
#include <cmark.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <sstream>
#include <utility>

namespace mdstream {

namespace {
    // ANSI escape codes
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* ITALIC = "\033[3m";
    constexpr const char* UNDERLINE = "\033[4m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";

    // Narrowest content column a nested block is squeezed to
    constexpr int MIN_CONTENT_WIDTH = 10;

    // Advance a byte index by n display characters, returning the new byte position.
    // Escape sequences have zero width and are skipped.
    size_t advance_by_display_chars(const std::string& text, size_t byte_pos, size_t n_chars) {
        size_t chars_advanced = 0;
        while (byte_pos < text.length() && chars_advanced < n_chars) {
            size_t esc = terminal::escape_length(text, byte_pos);
            if (esc > 0) {
                byte_pos += esc;
                continue;
            }
            byte_pos += terminal::utf8_length(static_cast<unsigned char>(text[byte_pos]));
            chars_advanced++;
        }
        return std::min(byte_pos, text.length());
    }

    std::string repeat(const std::string& s, size_t n) {
        std::string result;
        result.reserve(s.length() * n);
        for (size_t i = 0; i < n; i++) {
            result += s;
        }
        return result;
    }

    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    int inner_width(int width, int indent) {
        if (width <= 0) {
            return 0;
        }
        return std::max(width - indent, MIN_CONTENT_WIDTH);
    }

    // Collect all text content from a node and its children
    std::string collect_text(cmark_node* node) {
        std::string result;
        cmark_iter* iter = cmark_iter_new(node);
        cmark_event_type ev_type;

        while ((ev_type = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
            if (ev_type != CMARK_EVENT_ENTER) {
                continue;
            }
            cmark_node* cur = cmark_iter_get_node(iter);
            switch (cmark_node_get_type(cur)) {
                case CMARK_NODE_TEXT:
                case CMARK_NODE_CODE: {
                    const char* text = cmark_node_get_literal(cur);
                    if (text) {
                        result += text;
                    }
                    break;
                }
                case CMARK_NODE_SOFTBREAK:
                    result += " ";
                    break;
                case CMARK_NODE_LINEBREAK:
                    result += "\n";
                    break;
                default:
                    break;
            }
        }

        cmark_iter_free(iter);
        return result;
    }

    // Drop leading whitespace and blockquote markers so container lines
    // can be inspected as table rows
    std::string strip_container_prefix(const std::string& line) {
        std::string result = line;
        while (true) {
            size_t start = result.find_first_not_of(" \t");
            if (start == std::string::npos) {
                return "";
            }
            if (result[start] != '>') {
                return result.substr(start);
            }
            result = result.substr(start + 1);
        }
    }

    // Table separator line: | --- | --- | or :---:|:---
    bool is_table_separator(const std::string& line) {
        bool found_dash = false;
        bool found_pipe = false;
        for (char c : line) {
            if (c == '-') {
                found_dash = true;
            } else if (c == '|') {
                found_pipe = true;
            } else if (c != ' ' && c != '\t' && c != ':') {
                return false;
            }
        }
        return found_dash && found_pipe;
    }

    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(" \t");
        return s.substr(start, end - start + 1);
    }

    // Split a table row into trimmed cells. Outer pipes are optional.
    std::vector<std::string> split_cells(const std::string& line) {
        std::string row = trim(line);
        if (!row.empty() && row.front() == '|') {
            row.erase(0, 1);
        }
        if (!row.empty() && row.back() == '|') {
            row.pop_back();
        }

        std::vector<std::string> cells;
        size_t pos = 0;
        while (true) {
            size_t next_pipe = row.find('|', pos);
            if (next_pipe == std::string::npos) {
                cells.push_back(trim(row.substr(pos)));
                break;
            }
            cells.push_back(trim(row.substr(pos, next_pipe - pos)));
            pos = next_pipe + 1;
        }
        return cells;
    }
}

RenderStyle dark_style() {
    RenderStyle style;
    style.name = "dark";
    style.heading = {GREEN, BLUE, CYAN, MAGENTA};
    style.code_inline = CYAN;
    style.code_text = GREEN;
    style.code_label = YELLOW;
    style.border = DIM;
    style.link = BLUE;
    style.bullets = {CYAN, YELLOW, GREEN, MAGENTA, BLUE};
    return style;
}

RenderStyle light_style() {
    RenderStyle style;
    style.name = "light";
    style.heading = {BLUE, MAGENTA, CYAN, RED};
    style.code_inline = MAGENTA;
    style.code_text = BLUE;
    style.code_label = RED;
    style.border = DIM;
    style.link = BLUE;
    style.bullets = {BLUE, MAGENTA, RED, CYAN, GREEN};
    return style;
}

RenderStyle plain_style() {
    RenderStyle style;
    style.name = "plain";
    style.colors_enabled = false;
    return style;
}

RenderStyle style_by_name(const std::string& name) {
    if (name == "dark") {
        return dark_style();
    }
    if (name == "light") {
        return light_style();
    }
    if (name == "plain" || name == "notty") {
        return plain_style();
    }
    throw RenderError("unknown style: " + name);
}

std::vector<std::string> wrap_text(const std::string& text, int width) {
    std::vector<std::string> lines;
    if (width <= 0 || text.empty()) {
        lines.push_back(text);
        return lines;
    }

    // First pass: split into lines based on display width
    size_t max_width = static_cast<size_t>(width);
    size_t byte_pos = 0;
    while (byte_pos < text.length()) {
        std::string remaining = text.substr(byte_pos);
        if (static_cast<size_t>(terminal::display_width(remaining)) <= max_width) {
            lines.push_back(remaining);
            break;
        }

        // Find where to break
        size_t break_byte_pos = advance_by_display_chars(text, byte_pos, max_width);

        // Look for a space to break at
        size_t last_space = text.rfind(' ', break_byte_pos);
        if (last_space != std::string::npos && last_space > byte_pos) {
            break_byte_pos = last_space;
        }

        lines.push_back(text.substr(byte_pos, break_byte_pos - byte_pos));
        byte_pos = break_byte_pos;

        if (byte_pos < text.length() && text[byte_pos] == ' ') {
            byte_pos++;
        }
    }

    if (lines.empty()) {
        lines.push_back("");
        return lines;
    }

    // Second pass: close styling at each break and reopen it on the next line
    std::vector<std::string> active;
    for (size_t line_idx = 0; line_idx < lines.size(); line_idx++) {
        std::string reopen;
        for (const auto& seq : active) {
            reopen += seq;
        }

        const std::string& ln = lines[line_idx];
        for (size_t i = 0; i < ln.length(); ) {
            size_t esc = terminal::escape_length(ln, i);
            if (esc == 0) {
                i++;
                continue;
            }
            std::string seq = ln.substr(i, esc);
            if (seq.size() >= 3 && seq[1] == '[' && seq.back() == 'm') {
                std::string params = seq.substr(2, seq.size() - 3);
                if (params.empty() || params == "0") {
                    active.clear();
                } else {
                    active.push_back(seq);
                }
            }
            i += esc;
        }

        std::string fixed = reopen + ln;
        if (!active.empty() && line_idx + 1 < lines.size()) {
            fixed += RESET;
        }
        lines[line_idx] = fixed;
    }

    return lines;
}

DocumentRenderer::DocumentRenderer(RenderStyle style, int word_wrap)
    : style_(std::move(style))
    , word_wrap_(word_wrap)
{
    if (word_wrap_ < 0) {
        throw RenderError("invalid word wrap width: " + std::to_string(word_wrap));
    }
}

std::string DocumentRenderer::render(const std::string& markdown) const {
    if (markdown.find_first_not_of(" \t\r\n") == std::string::npos) {
        return "";
    }

    std::unique_ptr<cmark_node, decltype(&cmark_node_free)> doc(
        cmark_parse_document(markdown.c_str(), markdown.length(), CMARK_OPT_DEFAULT),
        &cmark_node_free);
    if (!doc) {
        throw RenderError("failed to parse markdown document");
    }

    Context ctx;
    ctx.source_lines = split_lines(markdown);
    return render_children(doc.get(), word_wrap_, ctx, true);
}

std::string DocumentRenderer::render_children(cmark_node* node, int width, Context& ctx,
                                              bool blank_between) const {
    std::string result;
    for (cmark_node* child = cmark_node_first_child(node); child; child = cmark_node_next(child)) {
        std::string block = render_block(child, width, ctx);
        if (block.empty()) {
            continue;
        }
        if (!result.empty() && blank_between) {
            result += "\n";
        }
        result += block;
    }
    return result;
}

std::string DocumentRenderer::render_block(cmark_node* node, int width, Context& ctx) const {
    switch (cmark_node_get_type(node)) {
        case CMARK_NODE_PARAGRAPH:
            return render_paragraph(node, width, ctx);

        case CMARK_NODE_HEADING:
            return heading(collect_text(node), cmark_node_get_heading_level(node));

        case CMARK_NODE_CODE_BLOCK: {
            const char* info = cmark_node_get_fence_info(node);
            const char* literal = cmark_node_get_literal(node);
            // Only the first word of the info string names the language
            std::string lang = info ? info : "";
            size_t space = lang.find_first_of(" \t");
            if (space != std::string::npos) {
                lang = lang.substr(0, space);
            }
            return code_block(literal ? literal : "", lang, width);
        }

        case CMARK_NODE_LIST:
            return render_list(node, width, ctx);

        case CMARK_NODE_BLOCK_QUOTE:
            return render_blockquote(node, width, ctx);

        case CMARK_NODE_THEMATIC_BREAK:
            return horizontal_rule(width);

        case CMARK_NODE_HTML_BLOCK: {
            const char* html = cmark_node_get_literal(node);
            std::string result;
            for (const auto& line : split_lines(html ? html : "")) {
                if (line.find_first_not_of(" \t\r") == std::string::npos) {
                    continue;
                }
                result += ansi(DIM) + line + ansi(RESET) + "\n";
            }
            return result;
        }

        default:
            return "";
    }
}

std::string DocumentRenderer::render_paragraph(cmark_node* node, int width, Context& ctx) const {
    std::vector<std::string> rows;
    if (table_source(node, ctx, rows)) {
        return render_table(rows, width);
    }

    std::string text = render_inlines(node);
    std::string result;
    size_t start = 0;
    while (start <= text.length()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.length();
        }
        for (const auto& line : wrap_text(text.substr(start, end - start), width)) {
            result += line + "\n";
        }
        start = end + 1;
    }
    return result;
}

std::string DocumentRenderer::render_list(cmark_node* node, int width, Context& ctx) const {
    bool ordered = (cmark_node_get_list_type(node) == CMARK_ORDERED_LIST);
    int number = cmark_node_get_list_start(node);

    // Colors cycle based on nesting level
    const std::string& bullet_color = style_.bullets[ctx.list_depth % style_.bullets.size()];

    std::string result;
    ctx.list_depth++;
    for (cmark_node* item = cmark_node_first_child(node); item; item = cmark_node_next(item)) {
        std::string marker = ordered ? std::to_string(number++) + "." : "●";
        std::string prefix = "  " + ansi(bullet_color) + marker + ansi(RESET) + " ";
        std::string hang(2 + terminal::display_width(marker) + 1, ' ');

        // Tight and loose items render the same: no blank lines inside an item
        std::string body = render_children(item, inner_width(width, static_cast<int>(hang.size())),
                                           ctx, false);
        std::vector<std::string> lines = split_lines(body);
        if (lines.empty()) {
            result += "  " + ansi(bullet_color) + marker + ansi(RESET) + "\n";
            continue;
        }

        result += prefix + lines[0] + "\n";
        for (size_t i = 1; i < lines.size(); i++) {
            if (!lines[i].empty()) {
                result += hang + lines[i];
            }
            result += "\n";
        }
    }
    ctx.list_depth--;
    return result;
}

std::string DocumentRenderer::render_blockquote(cmark_node* node, int width, Context& ctx) const {
    std::string body = render_children(node, inner_width(width, 2), ctx, true);
    std::string result;
    for (const auto& line : split_lines(body)) {
        result += ansi(style_.border) + "│" + ansi(RESET);
        if (!line.empty()) {
            result += " " + ansi(ITALIC) + line + ansi(RESET);
        }
        result += "\n";
    }
    return result;
}

std::string DocumentRenderer::render_inlines(cmark_node* node) const {
    std::string result;
    cmark_iter* iter = cmark_iter_new(node);
    cmark_event_type ev_type;

    while ((ev_type = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
        cmark_node* cur = cmark_iter_get_node(iter);
        bool entering = (ev_type == CMARK_EVENT_ENTER);
        cmark_node_type type = cmark_node_get_type(cur);

        switch (type) {
            case CMARK_NODE_TEXT: {
                if (entering) {
                    const char* literal = cmark_node_get_literal(cur);
                    if (literal) {
                        result += literal;
                    }
                }
                break;
            }

            case CMARK_NODE_SOFTBREAK:
                result += " ";
                break;

            case CMARK_NODE_LINEBREAK:
                result += "\n";
                break;

            case CMARK_NODE_CODE: {
                if (entering) {
                    const char* literal = cmark_node_get_literal(cur);
                    result += code(literal ? literal : "");
                }
                break;
            }

            case CMARK_NODE_STRONG: {
                if (entering) {
                    result += bold(collect_text(cur));
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;
            }

            case CMARK_NODE_EMPH: {
                if (entering) {
                    result += italic(collect_text(cur));
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;
            }

            case CMARK_NODE_LINK: {
                if (entering) {
                    const char* url = cmark_node_get_url(cur);
                    result += link(collect_text(cur), url ? url : "");
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;
            }

            case CMARK_NODE_IMAGE: {
                if (entering) {
                    std::string alt = collect_text(cur);
                    const char* url = cmark_node_get_url(cur);
                    result += ansi(DIM) + "[image: " + alt + "]" + ansi(RESET);
                    if (url && strlen(url) > 0) {
                        result += " " + ansi(UNDERLINE) + ansi(style_.link) + url + ansi(RESET);
                    }
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;
            }

            case CMARK_NODE_HTML_INLINE: {
                if (entering) {
                    const char* html = cmark_node_get_literal(cur);
                    if (html) {
                        result += ansi(DIM) + html + ansi(RESET);
                    }
                }
                break;
            }

            default:
                break;
        }
    }

    cmark_iter_free(iter);
    return result;
}

std::string DocumentRenderer::render_inline(const std::string& text) const {
    // Parse text as markdown and render only inline elements
    std::unique_ptr<cmark_node, decltype(&cmark_node_free)> doc(
        cmark_parse_document(text.c_str(), text.length(), CMARK_OPT_DEFAULT),
        &cmark_node_free);
    if (!doc) {
        return text;
    }

    std::string result = render_inlines(doc.get());
    // In table cells, line breaks become spaces
    std::replace(result.begin(), result.end(), '\n', ' ');
    return result;
}

bool DocumentRenderer::table_source(cmark_node* node, const Context& ctx,
                                    std::vector<std::string>& rows) const {
    int start_line = cmark_node_get_start_line(node);
    int end_line = cmark_node_get_end_line(node);
    if (start_line < 1 || end_line <= start_line ||
        end_line > static_cast<int>(ctx.source_lines.size())) {
        return false;
    }

    std::vector<std::string> lines;
    for (int i = start_line; i <= end_line; i++) {
        std::string line = strip_container_prefix(ctx.source_lines[i - 1]);
        if (line.empty()) {
            continue;
        }
        if (line.find('|') == std::string::npos) {
            return false;
        }
        lines.push_back(line);
    }

    if (lines.size() < 2 || !is_table_separator(lines[1])) {
        return false;
    }

    rows = std::move(lines);
    return true;
}

std::string DocumentRenderer::render_table(const std::vector<std::string>& lines, int width) const {
    // Parse table into rows and cells
    std::vector<std::vector<std::string>> rows;
    int separator_row = -1;

    for (const auto& line : lines) {
        // Check if this is a separator row
        if (is_table_separator(line)) {
            if (separator_row < 0) {
                separator_row = static_cast<int>(rows.size());
            }
            continue;  // Skip separator row in output
        }
        rows.push_back(split_cells(line));
    }

    // Render inline markdown in each cell
    for (auto& row : rows) {
        for (auto& cell : row) {
            cell = render_inline(cell);
        }
    }

    // Determine number of columns
    size_t num_cols = 0;
    for (const auto& row : rows) {
        num_cols = std::max(num_cols, row.size());
    }
    if (num_cols == 0) {
        return "";
    }

    int available_width = (width > 0) ? width : config::DEFAULT_WRAP_WIDTH;

    // Reserve space for borders: │ col │ col │ = (num_cols + 1) border chars + 2 spaces per col
    int border_overhead = static_cast<int>(num_cols + 1 + num_cols * 2);
    int content_width = available_width - border_overhead;

    if (content_width < static_cast<int>(num_cols)) {
        // Too narrow for this table - use minimum viable width
        content_width = static_cast<int>(num_cols);
    }

    // Calculate column widths based on content
    std::vector<size_t> col_widths(num_cols, 0);
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < num_cols; i++) {
            col_widths[i] = std::max(col_widths[i], static_cast<size_t>(terminal::display_width(row[i])));
        }
    }

    size_t total_content = 0;
    for (size_t w : col_widths) {
        total_content += w;
    }

    // Scale columns to fit available width if needed
    if (total_content > static_cast<size_t>(content_width)) {
        // Minimum column width of 8, unless that would overflow
        size_t min_width = 8;
        size_t min_total = num_cols * min_width;

        if (min_total <= static_cast<size_t>(content_width)) {
            // Each column gets a share proportional to its original width
            std::vector<size_t> new_widths(num_cols);
            for (size_t i = 0; i < num_cols; i++) {
                double ratio = static_cast<double>(col_widths[i]) / total_content;
                size_t proportional = static_cast<size_t>(ratio * content_width + 0.5);
                new_widths[i] = std::max(min_width, proportional);
            }

            // Adjust if we went over (due to minimums or rounding)
            size_t new_total = 0;
            for (size_t w : new_widths) new_total += w;

            while (new_total > static_cast<size_t>(content_width)) {
                size_t max_idx = 0;
                for (size_t i = 1; i < num_cols; i++) {
                    if (new_widths[i] > new_widths[max_idx]) {
                        max_idx = i;
                    }
                }
                if (new_widths[max_idx] <= min_width) {
                    break;  // All at minimum, can't reduce further
                }
                new_widths[max_idx]--;
                new_total--;
            }

            col_widths = new_widths;
        }
        // else: too many columns for min width of 8 - allow overflow
    }

    std::string result;

    // Top border
    result += ansi(style_.border) + "┌";
    for (size_t i = 0; i < num_cols; i++) {
        result += repeat("─", col_widths[i] + 2);
        result += (i < num_cols - 1) ? "┬" : "┐";
    }
    result += ansi(RESET) + "\n";

    for (size_t row_idx = 0; row_idx < rows.size(); row_idx++) {
        const auto& row = rows[row_idx];
        bool is_header = (separator_row == 1 && row_idx == 0);

        // Wrap each cell's content
        std::vector<std::vector<std::string>> wrapped_cells(num_cols);
        size_t max_lines = 1;
        for (size_t i = 0; i < num_cols; i++) {
            std::string cell_content = (i < row.size()) ? row[i] : "";
            wrapped_cells[i] = wrap_text(cell_content, static_cast<int>(col_widths[i]));
            max_lines = std::max(max_lines, wrapped_cells[i].size());
        }

        for (size_t line_idx = 0; line_idx < max_lines; line_idx++) {
            result += ansi(style_.border) + "│" + ansi(RESET);
            for (size_t col = 0; col < num_cols; col++) {
                std::string cell_line;
                if (line_idx < wrapped_cells[col].size()) {
                    cell_line = wrapped_cells[col][line_idx];
                }

                // Pad to column width (use display width for UTF-8)
                size_t cell_display_width = static_cast<size_t>(terminal::display_width(cell_line));
                size_t padding = (col_widths[col] > cell_display_width)
                    ? col_widths[col] - cell_display_width : 0;
                result += " ";
                if (is_header) {
                    result += ansi(BOLD);
                }
                result += cell_line;
                if (is_header) {
                    result += ansi(RESET);
                }
                result += std::string(padding, ' ');
                result += " " + ansi(style_.border) + "│" + ansi(RESET);
            }
            result += "\n";
        }

        // Separator after the header (double) or between rows
        if (is_header || row_idx < rows.size() - 1) {
            result += ansi(style_.border) + "├";
            for (size_t i = 0; i < num_cols; i++) {
                result += repeat(is_header ? "═" : "─", col_widths[i] + 2);
                result += (i < num_cols - 1) ? (is_header ? "╪" : "┼") : "┤";
            }
            result += ansi(RESET) + "\n";
        }
    }

    // Bottom border
    result += ansi(style_.border) + "└";
    for (size_t i = 0; i < num_cols; i++) {
        result += repeat("─", col_widths[i] + 2);
        result += (i < num_cols - 1) ? "┴" : "┘";
    }
    result += ansi(RESET) + "\n";

    return result;
}

std::string DocumentRenderer::ansi(const std::string& code) const {
    return style_.colors_enabled ? code : "";
}

std::string DocumentRenderer::bold(const std::string& text) const {
    return ansi(BOLD) + text + ansi(RESET);
}

std::string DocumentRenderer::italic(const std::string& text) const {
    return ansi(ITALIC) + text + ansi(RESET);
}

std::string DocumentRenderer::code(const std::string& text) const {
    return ansi(style_.code_inline) + "`" + text + "`" + ansi(RESET);
}

std::string DocumentRenderer::code_block(const std::string& text, const std::string& lang, int width) const {
    std::vector<std::string> lines = split_lines(text);

    // Find the longest line in the code
    size_t max_line_len = 0;
    for (const auto& line : lines) {
        max_line_len = std::max(max_line_len, static_cast<size_t>(terminal::display_width(line)));
    }

    // Minimum box width, accounting for language label
    size_t lang_len = static_cast<size_t>(terminal::display_width(lang));
    size_t label_len = lang.empty() ? 0 : lang_len + 3;  // "─[lang]"
    size_t min_width = (width > 0) ? std::min<size_t>(40, static_cast<size_t>(width)) : 40;
    size_t box_width = std::max({min_width, max_line_len + 4, label_len + 10});

    std::string result;

    // Top border: ┌─[lang]─────────────────────────┐
    result += ansi(style_.border) + "┌";
    size_t top_fill = box_width - 2;  // -2 for corners
    if (!lang.empty()) {
        result += "─[" + ansi(RESET) + ansi(style_.code_label) + lang + ansi(RESET) + ansi(style_.border) + "]";
        top_fill -= label_len;
    }
    result += repeat("─", top_fill) + "┐" + ansi(RESET) + "\n";

    // Code content with left and right borders
    for (const auto& line : lines) {
        size_t padding = box_width - 4 - static_cast<size_t>(terminal::display_width(line));
        result += ansi(style_.border) + "│" + ansi(RESET) + " " + ansi(style_.code_text) + line + ansi(RESET);
        result += std::string(padding, ' ') + ansi(style_.border) + " │" + ansi(RESET) + "\n";
    }

    // Bottom border: └─────────────────────────────────┘
    result += ansi(style_.border) + "└" + repeat("─", box_width - 2) + "┘" + ansi(RESET) + "\n";

    return result;
}

std::string DocumentRenderer::heading(const std::string& text, int level) const {
    size_t color_idx = static_cast<size_t>(std::min(std::max(level, 1), 4) - 1);
    std::string prefix = std::string(static_cast<size_t>(std::max(level, 1)), '#') + " ";
    return ansi(BOLD) + ansi(style_.heading[color_idx]) + prefix + text + ansi(RESET) + "\n";
}

std::string DocumentRenderer::link(const std::string& text, const std::string& url) const {
    // OSC 8 hyperlinks; terminals without support show the text only
    if (style_.colors_enabled) {
        return "\033]8;;" + url + "\033\\" +
               ansi(UNDERLINE) + ansi(style_.link) + text + ansi(RESET) +
               "\033]8;;\033\\";
    }
    return text + " <" + url + ">";
}

std::string DocumentRenderer::horizontal_rule(int width) const {
    size_t n = (width > 0) ? std::min<size_t>(40, static_cast<size_t>(width)) : 40;
    return ansi(style_.border) + repeat("─", n) + ansi(RESET) + "\n";
}

} // namespace mdstream
