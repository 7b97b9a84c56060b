#pragma once

/**
 * Speculative preview of the block that is still open.
 *
 * While a paragraph or list item is streaming in, the text that is already
 * safe to style (no unclosed emphasis, code span or link) is rendered and
 * shown below the committed output. The preview is erased again before the
 * block is committed, so committed output never contains preview bytes.
 */

#include "terminal.hpp"

#include <string>

namespace mdstream {

class DocumentRenderer;
class OutputSink;

/**
 * Byte offset up to which content can be rendered without an unclosed
 * inline construct: code spans (matching backtick runs), ** and __, * and _,
 * ~~, and link text followed by a (...) or [...] destination. Backslash
 * escapes are skipped as a pair. Trailing spaces and tabs are trimmed, but
 * at least one character is kept.
 */
size_t find_safe_point(const std::string& content);

/**
 * What the preview currently shows.
 */
struct PreviewState {
    std::string safe_markdown;  // Markdown prefix that was rendered
    std::string safe_rendered;  // Its rendering, without trailing newlines
    std::string anchor;         // Last committed row, rewritten after an erase
    int line_count = 0;         // Rows from the anchor row to the cursor
};

class PartialPreview {
public:
    PartialPreview(OutputSink& output, int width);

    /**
     * Show the safe prefix of content.
     *
     * @param content Open block markdown (pending lines plus unterminated tail).
     * @param renderer Renderer for the prefix.
     * @param anchor Last row of committed output; the cursor is at its end.
     * @param separator Newlines between the committed output and the preview.
     * @return true if the preview changed (including being erased because
     *         the new prefix renders to nothing).
     * @throws RenderError if the prefix cannot be rendered.
     */
    bool update(const std::string& content, const DocumentRenderer& renderer,
                const std::string& anchor, const std::string& separator);

    // Erase the preview and restore the cursor to the end of the anchor.
    void clear();

    // Forget the preview without touching the sink (the screen is being
    // rewritten anyway).
    void discard();

    void set_width(int width) { controller_.set_width(width); }

    bool active() const { return state_.line_count > 0; }
    const PreviewState& state() const { return state_; }

private:
    OutputSink& output_;
    terminal::Controller controller_;
    PreviewState state_;
};

} // namespace mdstream
