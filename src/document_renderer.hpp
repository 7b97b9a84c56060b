#pragma once

/**
 * Full-document markdown renderer.
 *
 * Parses a complete markdown document with cmark and renders it to ANSI
 * styled terminal text. Rendering is deterministic: the same markdown,
 * style and width always produce the same bytes. The streaming renderer
 * relies on this to compare successive renders of a growing document.
 *
 * Layout rules that keep a growing document's output growing at the end:
 *   - top-level blocks are separated by exactly one blank line
 *   - tight and loose lists render identically (no blank line between items)
 *   - the output never contains three consecutive newlines
 *   - a non-empty document ends with exactly one newline
 */

#include <array>
#include <string>
#include <vector>

struct cmark_node;

namespace mdstream {

/**
 * Named set of ANSI codes used by the document renderer.
 */
struct RenderStyle {
    std::string name;
    bool colors_enabled = true;

    std::array<std::string, 4> heading;   // H1, H2, H3, H4-H6
    std::string code_inline;              // `code`
    std::string code_text;                // Fenced code content
    std::string code_label;               // Language label on code boxes
    std::string border;                   // Box-drawing, rules, quote gutter
    std::string link;                     // Link text color
    std::array<std::string, 5> bullets;   // Bullet color per nesting level
};

// Palette for dark terminal backgrounds.
RenderStyle dark_style();

// Palette for light terminal backgrounds.
RenderStyle light_style();

// No ANSI codes at all.
RenderStyle plain_style();

/**
 * Look up a style by name ("dark", "light", "plain"; "notty" is an alias for
 * "plain"). Throws RenderError for unknown names.
 */
RenderStyle style_by_name(const std::string& name);

class DocumentRenderer {
public:
    /**
     * @param style ANSI palette.
     * @param word_wrap Column at which paragraphs wrap. 0 disables wrapping.
     * @throws RenderError if word_wrap is negative.
     */
    DocumentRenderer(RenderStyle style, int word_wrap);

    /**
     * Render a complete markdown document.
     * @throws RenderError if cmark fails to parse the document.
     */
    std::string render(const std::string& markdown) const;

    const RenderStyle& style() const { return style_; }
    int word_wrap() const { return word_wrap_; }

private:
    struct Context {
        std::vector<std::string> source_lines;  // Raw markdown, for tables
        int list_depth = 0;
    };

    RenderStyle style_;
    int word_wrap_;

    // Block rendering. Every block's output ends with "\n".
    std::string render_children(cmark_node* node, int width, Context& ctx, bool blank_between) const;
    std::string render_block(cmark_node* node, int width, Context& ctx) const;
    std::string render_paragraph(cmark_node* node, int width, Context& ctx) const;
    std::string render_list(cmark_node* node, int width, Context& ctx) const;
    std::string render_blockquote(cmark_node* node, int width, Context& ctx) const;

    // Inline rendering
    std::string render_inlines(cmark_node* node) const;
    std::string render_inline(const std::string& text) const;

    // Tables
    bool table_source(cmark_node* node, const Context& ctx, std::vector<std::string>& rows) const;
    std::string render_table(const std::vector<std::string>& lines, int width) const;

    // ANSI formatting helpers
    std::string ansi(const std::string& code) const;
    std::string bold(const std::string& text) const;
    std::string italic(const std::string& text) const;
    std::string code(const std::string& text) const;
    std::string code_block(const std::string& text, const std::string& lang, int width) const;
    std::string heading(const std::string& text, int level) const;
    std::string link(const std::string& text, const std::string& url) const;
    std::string horizontal_rule(int width) const;
};

/**
 * Wrap text to lines of at most width display columns, breaking at spaces
 * where possible. ANSI styling active at a break is closed at the end of the
 * line and reopened on the next one. width <= 0 returns the text unchanged
 * as a single line.
 */
std::vector<std::string> wrap_text(const std::string& text, int width);

} // namespace mdstream
